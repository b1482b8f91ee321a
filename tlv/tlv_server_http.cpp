#include "tlv_server_http.hpp"
#include "errors.hpp"

#include <string>
#include <utility>

static std::string normalize_urlpath(const std::string &urlpath)
{
    if (!urlpath.empty() && urlpath[0] == '/')
        return urlpath;
    return "/" + urlpath;
}

TlvServerHttp::TlvServerHttp(Dispatcher &dispatcher, Callback callback,
                             const std::string &urlpath,
                             size_t egress_limit, OverflowPolicy overflow)
    : dispatcher(dispatcher), callback(std::move(callback)),
      urlpath(normalize_urlpath(urlpath)), registered(true),
      egress_bytes(0), egress_limit(egress_limit), overflow(overflow), closed(false)
{
    dispatcher.register_path(this->urlpath, this);
}

TlvServerHttp::~TlvServerHttp()
{
    close();
}

void TlvServerHttp::send(const Packet &packet)
{
    std::vector<uint8_t> data = packet.buffer();

    std::unique_lock<std::mutex> lock(egress_mutex);

    if (egress_limit > 0)
    {
        if (data.size() > egress_limit)
        {
            throw OverflowError("Packet of " + std::to_string(data.size()) +
                                " bytes exceeds egress limit of " + std::to_string(egress_limit));
        }

        switch (overflow)
        {
        case OverflowPolicy::REJECT:
            if (egress_bytes + data.size() > egress_limit)
                throw OverflowError("Egress buffer full (" + std::to_string(egress_bytes) + " bytes queued)");
            break;

        case OverflowPolicy::DROP_OLDEST:
            while (egress_bytes + data.size() > egress_limit)
            {
                egress_bytes -= egress.front().size();
                egress.pop_front();
            }
            break;

        case OverflowPolicy::BLOCK:
            egress_drained.wait(lock, [&]
                                { return closed || egress_bytes + data.size() <= egress_limit; });
            if (closed)
                throw ConnectionError("Tunnel closed while waiting for egress room");
            break;
        }
    }

    egress_bytes += data.size();
    egress.push_back(std::move(data));
}

std::vector<uint8_t> TlvServerHttp::concat_egress() const
{
    std::vector<uint8_t> body;
    body.reserve(egress_bytes);
    for (const auto &frame : egress)
    {
        body.insert(body.end(), frame.begin(), frame.end());
    }
    return body;
}

void TlvServerHttp::handle_get(HttpRequest &request)
{
    auto registration = dispatcher.acquire();
    if (request.path() != urlpath)
        return;

    request.send_status(200);

    {
        std::lock_guard<std::mutex> lock(egress_mutex);
        // Egress is only cleared once the response accepted it
        request.write(concat_egress());
        egress.clear();
        egress_bytes = 0;
    }
    egress_drained.notify_all();
}

void TlvServerHttp::handle_post(HttpRequest &request)
{
    auto registration = dispatcher.acquire();
    if (request.path() != urlpath)
        return;

    auto length = request.content_length();
    if (!length)
    {
        request.send_status(411);
        return;
    }

    std::vector<uint8_t> data = request.read_body(*length);
    request.send_status(200);

    try
    {
        std::lock_guard<std::mutex> lock(egress_mutex);
        request.write(concat_egress());
    }
    catch (const HttpError &)
    {
        // Response is best effort; the inbound packet is still delivered
    }

    Packet packet = Packet::decode(data);
    if (callback)
    {
        callback(packet);
    }
}

void TlvServerHttp::set_urlpath(const std::string &path)
{
    std::string next = normalize_urlpath(path);

    auto registration = dispatcher.acquire();
    if (registered)
    {
        dispatcher.rebind(urlpath, next, this);
    }
    urlpath = next;
}

std::string TlvServerHttp::get_urlpath() const
{
    auto registration = dispatcher.acquire();
    return urlpath;
}

void TlvServerHttp::close()
{
    {
        auto registration = dispatcher.acquire();
        if (registered)
        {
            dispatcher.unregister_path(urlpath);
            registered = false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(egress_mutex);
        closed = true;
    }
    egress_drained.notify_all();
}

size_t TlvServerHttp::pending() const
{
    std::lock_guard<std::mutex> lock(egress_mutex);
    return egress_bytes;
}
