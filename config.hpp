#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

constexpr int BUFFER_SIZE = 65536;
constexpr int MAX_EVENTS = 64;
constexpr int LISTEN_BACKLOG = 128;
constexpr int POLL_INTERVAL_MS = 100;
constexpr int CONNECT_TIMEOUT_MS = 5000;

// TLV framing
constexpr size_t TLV_TYPE_SIZE = 4;
constexpr size_t TLV_LENGTH_SIZE = 4;
constexpr size_t TLV_HEADER_SIZE = TLV_TYPE_SIZE + TLV_LENGTH_SIZE;
constexpr uint32_t MAX_PAYLOAD_SIZE = 64u * 1024u * 1024u;

// HTTP tunnel
constexpr size_t EGRESS_LIMIT = 16u * 1024u * 1024u;
constexpr size_t MAX_HTTP_HEADER_SIZE = 16384;
constexpr size_t MAX_HTTP_BODY_SIZE = MAX_PAYLOAD_SIZE + TLV_HEADER_SIZE;
constexpr int HTTP_WRITE_TIMEOUT_MS = 5000;

// What TlvServerHttp::send does when the egress queue is full
enum class OverflowPolicy
{
    REJECT,
    DROP_OLDEST,
    BLOCK
};

inline OverflowPolicy parse_overflow_policy(const std::string &name)
{
    if (name == "drop_oldest")
        return OverflowPolicy::DROP_OLDEST;
    if (name == "block")
        return OverflowPolicy::BLOCK;
    if (name == "reject")
        return OverflowPolicy::REJECT;
    throw std::runtime_error("Unknown overflow policy: " + name);
}

#endif
