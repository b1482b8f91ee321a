#ifndef CLIENT_TCP_TUNNEL_HPP
#define CLIENT_TCP_TUNNEL_HPP

#include <memory>
#include <optional>
#include <string>
#include "tunnel.hpp"
#include "tlv/tlv_client.hpp"

// Agent side over raw TCP: sends one packet and waits for the reply
class ClientTcpTunnel : public Tunnel
{
private:
    std::unique_ptr<TlvClient> client;
    Packet request;
    std::optional<Packet> reply;

public:
    ClientTcpTunnel(const std::string &remote_addr, int remote_port, Packet request);
    ~ClientTcpTunnel();

    void run() override;

    const std::optional<Packet> &get_reply() const;
};

#endif
