#include "server_http_tunnel.hpp"
#include "config.hpp"

#include <utility>

ServerHttpTunnel::ServerHttpTunnel(const std::string &local_addr, int local_port,
                                   const std::string &urlpath, TlvServerHttp::Callback callback,
                                   size_t egress_limit, OverflowPolicy overflow)
    : listener(dispatcher, local_addr, local_port),
      transport(dispatcher, std::move(callback), urlpath, egress_limit, overflow)
{
}

void ServerHttpTunnel::run()
{
    while (running)
    {
        listener.poll_once(POLL_INTERVAL_MS);
    }
}

TlvServerHttp &ServerHttpTunnel::get_transport()
{
    return transport;
}

int ServerHttpTunnel::port() const
{
    return listener.port();
}
