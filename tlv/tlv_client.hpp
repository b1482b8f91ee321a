#ifndef TLV_CLIENT_HPP
#define TLV_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>
#include <sys/types.h>
#include "packet.hpp"
#include "config.hpp"

// Frames TLV packets over one connected stream socket.
//
// The client owns the descriptor and closes it on close() or destruction.
// Not thread-safe: one thread drives send/read, except that close() from
// another thread wakes a blocked read with ConnectionError.
class TlvClient
{
private:
    std::atomic<int> sockfd;
    uint32_t max_payload;

    // Bytes of the frame currently being received. Kept across read() calls
    // so a header split by a non-blocking probe is never lost.
    std::vector<uint8_t> frame;
    size_t received;

    void ensure_open() const;
    ssize_t recv_some(uint8_t *buffer, size_t len, bool block);
    bool fill(size_t target, bool block);
    std::optional<Packet> complete_frame(bool block);
    void shutdown_and_close();

public:
    explicit TlvClient(int sockfd, uint32_t max_payload = MAX_PAYLOAD_SIZE);
    ~TlvClient();

    TlvClient(const TlvClient &) = delete;
    TlvClient &operator=(const TlvClient &) = delete;

    void send(const Packet &packet);
    void send_raw(const uint8_t *data, size_t len);
    void send_raw(const std::vector<uint8_t> &data);

    // Returns std::nullopt only when block is false and no type bytes have
    // arrived yet. A declared length above max_payload raises FormatError
    // and closes the socket, since the stream can no longer be framed.
    std::optional<Packet> read(bool block = true);

    // Never blocks: takes whatever the socket has, keeps a partial frame for
    // the next call and returns std::nullopt until the frame is complete.
    std::optional<Packet> try_read();
    std::vector<uint8_t> read_raw(size_t size);

    void close();
    bool is_open() const;
    int get_fd() const;
};

#endif
