#ifndef SERVER_HTTP_TUNNEL_HPP
#define SERVER_HTTP_TUNNEL_HPP

#include <string>
#include "tunnel.hpp"
#include "http/dispatcher.hpp"
#include "http/http_listener.hpp"
#include "tlv/tlv_server_http.hpp"

// Controller side over HTTP: agents poll urlpath with GET for queued
// packets and POST one packet per request.
class ServerHttpTunnel : public Tunnel
{
private:
    Dispatcher dispatcher;
    HttpListener listener;
    TlvServerHttp transport;

public:
    ServerHttpTunnel(const std::string &local_addr, int local_port,
                     const std::string &urlpath, TlvServerHttp::Callback callback,
                     size_t egress_limit = EGRESS_LIMIT,
                     OverflowPolicy overflow = OverflowPolicy::REJECT);

    void run() override;

    TlvServerHttp &get_transport();
    int port() const;
};

#endif
