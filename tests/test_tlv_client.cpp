/**
 * @file test_tlv_client.cpp
 * @brief Tests for TlvClient framing over a connected socket pair.
 *
 * Validates:
 *  - End-to-end PING between two clients
 *  - Reassembly when a frame arrives in 1-byte chunks
 *  - Full transmission when the kernel accepts writes piecemeal
 *  - read(false) semantics, including buffered partial headers
 *  - try_read() resuming a partial frame without ever blocking
 *  - ConnectionError on closed sockets, FormatError on oversized frames
 */

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <sys/socket.h>

#include "tlv/tlv_client.hpp"
#include "tlv/errors.hpp"
#include "network_utils.hpp"

using namespace std::chrono_literals;

namespace {

// Owns the peer end; the local end is handed to a TlvClient
struct SocketPair
{
    int local = -1;
    int peer = -1;

    SocketPair()
    {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0)
        {
            local = fds[0];
            peer = fds[1];
        }
    }

    ~SocketPair()
    {
        if (peer >= 0)
            close(peer);
    }

    void write_peer(const std::vector<uint8_t> &data) const
    {
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t ret = ::send(peer, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (ret <= 0)
                return;
            sent += static_cast<size_t>(ret);
        }
    }
};

std::vector<uint8_t> bytes(const std::string &s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

/**
 * @test Ping_EndToEnd
 * @brief Packet sent by one client is read intact by the other.
 */
TEST(TlvClient, Ping_EndToEnd)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    TlvClient agent(fds[0]);
    TlvClient controller(fds[1]);

    agent.send(Packet(1, "PING"));
    auto packet = controller.read();

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type(), 1u);
    EXPECT_EQ(packet->payload_string(), "PING");
}

/**
 * @test Read_OneByteChunks
 * @brief A frame trickling in one byte at a time is reassembled.
 */
TEST(TlvClient, Read_OneByteChunks)
{
    SocketPair pair;
    ASSERT_GE(pair.local, 0);
    TlvClient client(pair.local);

    Packet expected(0xDEADBEEFu, "fragmented payload");
    auto wire = expected.buffer();

    std::thread writer([&]
                       {
        for (uint8_t b : wire)
        {
            pair.write_peer({b});
            std::this_thread::sleep_for(1ms);
        } });

    auto packet = client.read();
    writer.join();

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(*packet, expected);
}

/**
 * @test Read_BackToBackFrames
 * @brief Two frames in one segment are returned by two reads, in order.
 */
TEST(TlvClient, Read_BackToBackFrames)
{
    SocketPair pair;
    TlvClient client(pair.local);

    auto first = Packet(1, "one").buffer();
    auto second = Packet(2, "two").buffer();
    first.insert(first.end(), second.begin(), second.end());
    pair.write_peer(first);

    EXPECT_EQ(*client.read(), Packet(1, "one"));
    EXPECT_EQ(*client.read(), Packet(2, "two"));
}

/**
 * @test Send_LargePayload_PartialWrites
 * @brief With a tiny send buffer every write is partial; the full frame
 *        still arrives exactly once.
 */
TEST(TlvClient, Send_LargePayload_PartialWrites)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    int small = 4096;
    setsockopt(fds[0], SOL_SOCKET, SO_SNDBUF, &small, sizeof(small));

    TlvClient sender(fds[0]);
    TlvClient receiver(fds[1]);

    std::vector<uint8_t> payload(1024 * 1024);
    for (size_t i = 0; i < payload.size(); ++i)
        payload[i] = static_cast<uint8_t>(i * 31);
    Packet expected(5, payload);

    auto reader = std::async(std::launch::async, [&]
                             { return receiver.read(); });
    sender.send(expected);

    auto packet = reader.get();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(*packet, expected);

    // Nothing beyond the one frame was written
    EXPECT_FALSE(receiver.read(false).has_value());
}

/**
 * @test Send_NonBlockingDescriptor
 * @brief "Would block" on an O_NONBLOCK socket is retried, not raised.
 */
TEST(TlvClient, Send_NonBlockingDescriptor)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    ASSERT_TRUE(set_nonblocking(fds[0], true));

    TlvClient sender(fds[0]);
    TlvClient receiver(fds[1]);

    Packet expected(9, std::vector<uint8_t>(512 * 1024, 0x5A));

    auto reader = std::async(std::launch::async, [&]
                             {
        std::this_thread::sleep_for(20ms);
        return receiver.read(); });
    EXPECT_NO_THROW(sender.send(expected));

    auto packet = reader.get();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(*packet, expected);
}

/**
 * @test ReadNonBlocking_NoData
 * @brief Probe on an idle socket returns empty and loses nothing sent later.
 */
TEST(TlvClient, ReadNonBlocking_NoData)
{
    SocketPair pair;
    TlvClient client(pair.local);

    EXPECT_FALSE(client.read(false).has_value());
    EXPECT_FALSE(client.read(false).has_value());

    pair.write_peer(Packet(4, "late").buffer());

    auto packet = client.read(false);
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(*packet, Packet(4, "late"));
}

/**
 * @test ReadNonBlocking_PartialTypeBytesKept
 * @brief Type bytes picked up by read(false) stay part of the frame while the
 *        rest of the header is awaited in blocking mode.
 */
TEST(TlvClient, ReadNonBlocking_PartialTypeBytesKept)
{
    SocketPair pair;
    TlvClient client(pair.local);

    Packet expected(0x0A0B0C0Du, "split header");
    auto wire = expected.buffer();

    pair.write_peer(std::vector<uint8_t>(wire.begin(), wire.begin() + 2));

    auto reader = std::async(std::launch::async, [&]
                             { return client.read(false); });
    std::this_thread::sleep_for(20ms);
    pair.write_peer(std::vector<uint8_t>(wire.begin() + 2, wire.end()));

    auto packet = reader.get();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(*packet, expected);
}

/**
 * @test Read_PeerClosed_Throws
 */
TEST(TlvClient, Read_PeerClosed_Throws)
{
    SocketPair pair;
    TlvClient client(pair.local);

    close(pair.peer);
    pair.peer = -1;

    EXPECT_THROW(client.read(), ConnectionError);
}

/**
 * @test Read_PeerClosedMidFrame_Throws
 */
TEST(TlvClient, Read_PeerClosedMidFrame_Throws)
{
    SocketPair pair;
    TlvClient client(pair.local);

    auto wire = Packet(1, "truncated").buffer();
    pair.write_peer(std::vector<uint8_t>(wire.begin(), wire.begin() + 10));
    close(pair.peer);
    pair.peer = -1;

    EXPECT_THROW(client.read(), ConnectionError);
}

/**
 * @test Read_OversizedLength_ClosesStream
 * @brief The undrained payload of an oversized frame cannot be parsed as the
 *        next header; the client is closed and later reads fail cleanly.
 */
TEST(TlvClient, Read_OversizedLength_ClosesStream)
{
    SocketPair pair;
    TlvClient client(pair.local, 16);

    auto oversized = Packet::encode(1, std::vector<uint8_t>(24, 'A'));
    auto ping = Packet(1, "PING").buffer();
    oversized.insert(oversized.end(), ping.begin(), ping.end());
    pair.write_peer(oversized);

    EXPECT_THROW(client.read(), FormatError);
    EXPECT_FALSE(client.is_open());
    EXPECT_THROW(client.read(), ConnectionError);
    EXPECT_THROW(client.try_read(), ConnectionError);
}

/**
 * @test TryRead_ResumesPartialFrame
 * @brief try_read never waits: each call keeps what arrived and the frame is
 *        returned once its last byte is in.
 */
TEST(TlvClient, TryRead_ResumesPartialFrame)
{
    SocketPair pair;
    TlvClient client(pair.local);

    Packet expected(0x01020304u, "resumed payload");
    auto wire = expected.buffer();

    EXPECT_FALSE(client.try_read().has_value());

    pair.write_peer(std::vector<uint8_t>(wire.begin(), wire.begin() + 2));
    EXPECT_FALSE(client.try_read().has_value());

    pair.write_peer(std::vector<uint8_t>(wire.begin() + 2, wire.begin() + 11));
    EXPECT_FALSE(client.try_read().has_value());

    pair.write_peer(std::vector<uint8_t>(wire.begin() + 11, wire.end()));
    auto packet = client.try_read();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(*packet, expected);

    EXPECT_FALSE(client.try_read().has_value());
}

/**
 * @test TryRead_PeerClosed_Throws
 */
TEST(TlvClient, TryRead_PeerClosed_Throws)
{
    SocketPair pair;
    TlvClient client(pair.local);

    pair.write_peer({0, 0, 0});
    close(pair.peer);
    pair.peer = -1;

    EXPECT_THROW(client.try_read(), ConnectionError);
}

/**
 * @test ReadRaw_SingleReceive
 * @brief read_raw returns at most size bytes from one receive.
 */
TEST(TlvClient, ReadRaw_SingleReceive)
{
    SocketPair pair;
    TlvClient client(pair.local);

    pair.write_peer(bytes("abcdef"));

    EXPECT_EQ(client.read_raw(3), bytes("abc"));
    EXPECT_EQ(client.read_raw(100), bytes("def"));
}

/**
 * @test ReadRaw_OrderlyShutdown_Empty
 */
TEST(TlvClient, ReadRaw_OrderlyShutdown_Empty)
{
    SocketPair pair;
    TlvClient client(pair.local);

    shutdown(pair.peer, SHUT_WR);
    EXPECT_TRUE(client.read_raw(16).empty());
}

/**
 * @test SendRaw_NoFraming
 */
TEST(TlvClient, SendRaw_NoFraming)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    TlvClient sender(fds[0]);
    TlvClient receiver(fds[1]);

    sender.send_raw(bytes("raw"));
    EXPECT_EQ(receiver.read_raw(3), bytes("raw"));
}

/**
 * @test UseAfterClose_Throws
 */
TEST(TlvClient, UseAfterClose_Throws)
{
    SocketPair pair;
    TlvClient client(pair.local);

    EXPECT_TRUE(client.is_open());
    client.close();
    EXPECT_FALSE(client.is_open());

    EXPECT_THROW(client.send(Packet(1, "x")), ConnectionError);
    EXPECT_THROW(client.send_raw(bytes("x")), ConnectionError);
    EXPECT_THROW(client.read(), ConnectionError);
    EXPECT_THROW(client.read(false), ConnectionError);
    EXPECT_THROW(client.read_raw(1), ConnectionError);
    EXPECT_THROW(client.close(), ConnectionError);
}

/**
 * @test InvalidDescriptor_Throws
 */
TEST(TlvClient, InvalidDescriptor_Throws)
{
    EXPECT_THROW(TlvClient(-1), ConnectionError);
}

/**
 * @test CloseFromOtherThread_WakesRead
 * @brief A blocked read fails with ConnectionError once the socket closes.
 */
TEST(TlvClient, CloseFromOtherThread_WakesRead)
{
    SocketPair pair;
    TlvClient client(pair.local);

    auto reader = std::async(std::launch::async, [&]
                             { return client.read(); });
    std::this_thread::sleep_for(50ms);
    client.close();

    EXPECT_THROW(reader.get(), ConnectionError);
}
