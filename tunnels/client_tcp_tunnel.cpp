#include <utility>
#include "client_tcp_tunnel.hpp"
#include "connection.hpp"
#include "config.hpp"
#include "network_utils.hpp"

ClientTcpTunnel::ClientTcpTunnel(const std::string &remote_addr, int remote_port, Packet request)
    : request(std::move(request))
{
    Connection connection(remote_addr, remote_port);
    client = std::make_unique<TlvClient>(connection.release());
}

ClientTcpTunnel::~ClientTcpTunnel()
{
    running = false;
}

void ClientTcpTunnel::run()
{
    client->send(request);

    while (running && !reply)
    {
        reply = client->read(false);
        if (!reply)
        {
            wait_for_fd(client->get_fd(), POLLIN, POLL_INTERVAL_MS);
        }
    }

    client->close();
}

const std::optional<Packet> &ClientTcpTunnel::get_reply() const
{
    return reply;
}
