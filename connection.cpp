#include "connection.hpp"
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include "network_utils.hpp"
#include "tlv/errors.hpp"

Connection::Connection(const std::string &addr, int port, int timeout_ms)
{
    sockaddr_storage remote_addr;
    socklen_t remote_addr_len;
    if (!setup_sockaddr(remote_addr, remote_addr_len, addr, port))
    {
        throw ConnectionError("Invalid remote address: " + addr);
    }

    sockfd = socket(get_address_family(addr), SOCK_STREAM, 0);
    if (sockfd < 0)
    {
        throw ConnectionError(errno_message("socket failed"));
    }

    int flag = 1;
    setsockopt(sockfd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    setsockopt(sockfd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));

    // Non-blocking connect so the attempt can be bounded by timeout_ms
    set_nonblocking(sockfd, true);
    int ret = connect(sockfd, (struct sockaddr *)&remote_addr, remote_addr_len);
    if (ret < 0 && errno == EINPROGRESS)
    {
        int ready = wait_for_fd(sockfd, POLLOUT, timeout_ms);
        if (ready <= 0)
        {
            close(sockfd);
            throw ConnectionError("Connection to " + addr + ":" + std::to_string(port) + " timed out");
        }

        int err = 0;
        socklen_t err_len = sizeof(err);
        getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &err_len);
        errno = err;
        ret = err == 0 ? 0 : -1;
    }

    if (ret < 0)
    {
        std::string message = errno_message("Connection to " + addr + ":" + std::to_string(port) + " failed");
        close(sockfd);
        throw ConnectionError(message);
    }

    set_nonblocking(sockfd, false);
}

Connection::~Connection()
{
    if (sockfd >= 0)
    {
        close(sockfd);
    }
}

int Connection::release()
{
    int fd = sockfd;
    sockfd = -1;
    return fd;
}

int Connection::get_fd() const
{
    return sockfd;
}
