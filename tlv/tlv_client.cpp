#include "tlv_client.hpp"
#include "errors.hpp"
#include "network_utils.hpp"

#include <cerrno>
#include <string>
#include <unistd.h>
#include <sys/socket.h>

TlvClient::TlvClient(int sockfd, uint32_t max_payload)
    : sockfd(sockfd), max_payload(max_payload), received(0)
{
    if (sockfd < 0)
    {
        throw ConnectionError("Socket is not connected!");
    }
}

TlvClient::~TlvClient()
{
    int fd = sockfd.exchange(-1);
    if (fd >= 0)
    {
        ::close(fd);
    }
}

void TlvClient::ensure_open() const
{
    if (sockfd < 0)
    {
        throw ConnectionError("Socket is not connected!");
    }
}

void TlvClient::send(const Packet &packet)
{
    send_raw(packet.buffer());
}

void TlvClient::send_raw(const std::vector<uint8_t> &data)
{
    send_raw(data.data(), data.size());
}

void TlvClient::send_raw(const uint8_t *data, size_t len)
{
    ensure_open();

    size_t sent = 0;
    while (sent < len)
    {
        ssize_t ret = ::send(sockfd, data + sent, len - sent, MSG_NOSIGNAL);
        if (ret >= 0)
        {
            sent += static_cast<size_t>(ret);
            continue;
        }

        if (errno == EINTR)
            continue;

        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            // Descriptor is in O_NONBLOCK mode: wait for room and try again
            if (wait_for_fd(sockfd, POLLOUT, -1) < 0)
                throw ConnectionError(errno_message("poll failed"));
            continue;
        }

        throw ConnectionError(errno_message("send failed"));
    }
}

// One receive of up to len bytes. Returns -1 only when block is false and
// the socket has nothing to read.
ssize_t TlvClient::recv_some(uint8_t *buffer, size_t len, bool block)
{
    while (true)
    {
        int fd = sockfd;
        if (fd < 0)
            throw ConnectionError("Socket is not connected!");

        ssize_t ret = ::recv(fd, buffer, len, block ? 0 : MSG_DONTWAIT);
        if (ret > 0)
            return ret;

        if (ret == 0)
            throw ConnectionError("Connection closed by peer");

        if (errno == EINTR)
            continue;

        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            if (!block)
                return -1;

            if (wait_for_fd(fd, POLLIN, -1) < 0)
                throw ConnectionError(errno_message("poll failed"));
            continue;
        }

        throw ConnectionError(errno_message("recv failed"));
    }
}

// Returns false when block is false and the socket ran dry before target
bool TlvClient::fill(size_t target, bool block)
{
    if (frame.size() < target)
        frame.resize(target);

    while (received < target)
    {
        ssize_t ret = recv_some(frame.data() + received, target - received, block);
        if (ret < 0)
            return false;
        received += static_cast<size_t>(ret);
    }
    return true;
}

std::optional<Packet> TlvClient::complete_frame(bool block)
{
    if (!fill(TLV_HEADER_SIZE, block))
        return std::nullopt;

    uint32_t length = read_be32(frame.data() + TLV_TYPE_SIZE);
    if (length > max_payload)
    {
        // The payload is never consumed, so the stream has lost its framing
        frame.clear();
        received = 0;
        shutdown_and_close();
        throw FormatError("Declared payload of " + std::to_string(length) +
                          " bytes exceeds limit of " + std::to_string(max_payload));
    }

    if (!fill(TLV_HEADER_SIZE + length, block))
        return std::nullopt;

    Packet packet = Packet::decode(frame.data(), received);
    frame.clear();
    received = 0;

    return packet;
}

std::optional<Packet> TlvClient::read(bool block)
{
    ensure_open();

    if (!block && received == 0)
    {
        frame.resize(TLV_TYPE_SIZE);
        ssize_t ret = recv_some(frame.data(), TLV_TYPE_SIZE, false);
        if (ret < 0)
            return std::nullopt;
        received = static_cast<size_t>(ret);
    }

    return complete_frame(true);
}

std::optional<Packet> TlvClient::try_read()
{
    ensure_open();
    return complete_frame(false);
}

std::vector<uint8_t> TlvClient::read_raw(size_t size)
{
    ensure_open();

    std::vector<uint8_t> data(size);
    if (size == 0)
        return data;

    while (true)
    {
        ssize_t ret = ::recv(sockfd, data.data(), size, 0);
        if (ret >= 0)
        {
            data.resize(static_cast<size_t>(ret));
            return data;
        }

        if (errno == EINTR)
            continue;

        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            if (wait_for_fd(sockfd, POLLIN, -1) < 0)
                throw ConnectionError(errno_message("poll failed"));
            continue;
        }

        throw ConnectionError(errno_message("recv failed"));
    }
}

void TlvClient::close()
{
    if (sockfd < 0)
    {
        throw ConnectionError("Socket is not connected!");
    }
    shutdown_and_close();
}

void TlvClient::shutdown_and_close()
{
    int fd = sockfd.exchange(-1);
    if (fd < 0)
        return;

    // shutdown() wakes a read blocked in another thread
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

bool TlvClient::is_open() const
{
    return sockfd >= 0;
}

int TlvClient::get_fd() const
{
    return sockfd;
}
