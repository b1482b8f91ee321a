#include "packet.hpp"
#include "errors.hpp"
#include "config.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

void write_be32(uint32_t v, uint8_t out[4])
{
    out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(v & 0xFF);
}

uint32_t read_be32(const uint8_t in[4])
{
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           (static_cast<uint32_t>(in[3]));
}

Packet::Packet(uint32_t type, std::vector<uint8_t> payload)
    : packet_type(type), value(std::move(payload))
{
    if (value.size() > std::numeric_limits<uint32_t>::max())
    {
        throw FormatError("Payload does not fit a 32-bit length");
    }
}

Packet::Packet(uint32_t type, const std::string &payload)
    : Packet(type, std::vector<uint8_t>(payload.begin(), payload.end()))
{
}

std::vector<uint8_t> Packet::encode(uint32_t type, const uint8_t *payload, size_t len)
{
    if (len > std::numeric_limits<uint32_t>::max())
    {
        throw FormatError("Payload does not fit a 32-bit length");
    }

    std::vector<uint8_t> frame(TLV_HEADER_SIZE + len);
    write_be32(type, frame.data());
    write_be32(static_cast<uint32_t>(len), frame.data() + TLV_TYPE_SIZE);
    if (len > 0)
    {
        std::copy(payload, payload + len, frame.begin() + TLV_HEADER_SIZE);
    }

    return frame;
}

std::vector<uint8_t> Packet::encode(uint32_t type, const std::vector<uint8_t> &payload)
{
    return encode(type, payload.data(), payload.size());
}

uint64_t Packet::frame_size(const uint8_t *header)
{
    return TLV_HEADER_SIZE + static_cast<uint64_t>(read_be32(header + TLV_TYPE_SIZE));
}

Packet Packet::decode(const uint8_t *data, size_t len)
{
    if (len < TLV_HEADER_SIZE)
    {
        throw FormatError("Buffer shorter than TLV header (" + std::to_string(len) + " bytes)");
    }

    uint64_t total = frame_size(data);
    if (len < total)
    {
        throw FormatError("Buffer holds " + std::to_string(len) + " bytes, frame declares " +
                          std::to_string(total));
    }

    const uint8_t *payload = data + TLV_HEADER_SIZE;
    return Packet(read_be32(data), std::vector<uint8_t>(payload, payload + (total - TLV_HEADER_SIZE)));
}

Packet Packet::decode(const std::vector<uint8_t> &buffer)
{
    return decode(buffer.data(), buffer.size());
}

std::vector<Packet> Packet::split(const uint8_t *data, size_t len)
{
    std::vector<Packet> packets;
    size_t offset = 0;

    while (offset < len)
    {
        Packet packet = decode(data + offset, len - offset);
        offset += TLV_HEADER_SIZE + packet.length();
        packets.push_back(std::move(packet));
    }

    return packets;
}

std::vector<Packet> Packet::split(const std::vector<uint8_t> &buffer)
{
    return split(buffer.data(), buffer.size());
}

uint32_t Packet::type() const
{
    return packet_type;
}

uint32_t Packet::length() const
{
    return static_cast<uint32_t>(value.size());
}

const std::vector<uint8_t> &Packet::payload() const
{
    return value;
}

std::string Packet::payload_string() const
{
    return std::string(value.begin(), value.end());
}

std::vector<uint8_t> Packet::buffer() const
{
    return encode(packet_type, value);
}

bool Packet::operator==(const Packet &other) const
{
    return packet_type == other.packet_type && value == other.value;
}

bool Packet::operator!=(const Packet &other) const
{
    return !(*this == other);
}
