#ifndef PACKET_HPP
#define PACKET_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// One TLV message. Wire form:
//   type (uint32 BE) | length (uint32 BE) | payload (length bytes)
class Packet
{
private:
    uint32_t packet_type;
    std::vector<uint8_t> value;

public:
    Packet(uint32_t type, std::vector<uint8_t> payload);
    Packet(uint32_t type, const std::string &payload);

    static std::vector<uint8_t> encode(uint32_t type, const uint8_t *payload, size_t len);
    static std::vector<uint8_t> encode(uint32_t type, const std::vector<uint8_t> &payload);

    // Parses the first complete frame in data; trailing bytes are ignored
    static Packet decode(const uint8_t *data, size_t len);
    static Packet decode(const std::vector<uint8_t> &buffer);

    // Parses a concatenation of frames, as delivered in one GET body
    static std::vector<Packet> split(const uint8_t *data, size_t len);
    static std::vector<Packet> split(const std::vector<uint8_t> &buffer);

    // Total frame size announced by an 8-byte header
    static uint64_t frame_size(const uint8_t *header);

    uint32_t type() const;
    uint32_t length() const;
    const std::vector<uint8_t> &payload() const;
    std::string payload_string() const;
    std::vector<uint8_t> buffer() const;

    bool operator==(const Packet &other) const;
    bool operator!=(const Packet &other) const;
};

void write_be32(uint32_t v, uint8_t out[4]);
uint32_t read_be32(const uint8_t in[4]);

#endif
