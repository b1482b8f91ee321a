#ifndef SERVER_TCP_TUNNEL_HPP
#define SERVER_TCP_TUNNEL_HPP

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include "tunnel.hpp"
#include "listener.hpp"
#include "tlv/tlv_client.hpp"

// Controller side over raw TCP: accepts agents and hands every packet they
// send to the packet handler, together with the client it came from.
class ServerTcpTunnel : public Tunnel
{
public:
    using PacketHandler = std::function<void(const Packet &, TlvClient &)>;

private:
    Listener listener;
    PacketHandler handler;
    int epoll_fd;
    std::unordered_map<int, std::unique_ptr<TlvClient>> clients;

    void handle_client_connection();
    void handle_client_data(int fd);
    void remove_client(int fd);

public:
    ServerTcpTunnel(const std::string &local_addr, int local_port, PacketHandler handler);
    ~ServerTcpTunnel();

    // One pass of the event loop; returns the number of events handled
    int poll_once(int timeout_ms);
    void run() override;

    int port() const;
    size_t client_count() const;
};

#endif
