#ifndef TLV_SERVER_HTTP_HPP
#define TLV_SERVER_HTTP_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "packet.hpp"
#include "config.hpp"
#include "http/dispatcher.hpp"

// TLV transport tunneled through a polling HTTP peer.
//
// Outbound packets queue in the egress buffer until the peer GETs the bound
// path; each POST to the path carries one inbound packet, handed to the
// callback. The dispatcher is borrowed and must outlive this object.
class TlvServerHttp : public HttpHandler
{
public:
    using Callback = std::function<void(const Packet &)>;

private:
    Dispatcher &dispatcher;
    Callback callback;
    std::string urlpath; // guarded by the dispatcher lock
    bool registered;

    std::deque<std::vector<uint8_t>> egress;
    size_t egress_bytes;
    size_t egress_limit;
    OverflowPolicy overflow;
    bool closed;
    mutable std::mutex egress_mutex;
    std::condition_variable egress_drained;

    std::vector<uint8_t> concat_egress() const;

public:
    TlvServerHttp(Dispatcher &dispatcher, Callback callback = nullptr,
                  const std::string &urlpath = "/",
                  size_t egress_limit = EGRESS_LIMIT,
                  OverflowPolicy overflow = OverflowPolicy::REJECT);
    ~TlvServerHttp();

    TlvServerHttp(const TlvServerHttp &) = delete;
    TlvServerHttp &operator=(const TlvServerHttp &) = delete;

    void send(const Packet &packet);

    void handle_get(HttpRequest &request) override;
    void handle_post(HttpRequest &request) override;

    void set_urlpath(const std::string &urlpath);
    std::string get_urlpath() const;

    void close();

    // Egress bytes waiting for the next GET
    size_t pending() const;
};

#endif
