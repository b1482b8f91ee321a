#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "http_request.hpp"

// Per-path request handler. Handlers see every request routed to the path
// they were registered under.
class HttpHandler
{
public:
    virtual ~HttpHandler() = default;
    virtual void handle_get(HttpRequest &request) = 0;
    virtual void handle_post(HttpRequest &request) = 0;
};

// URL path -> handler table shared by every transport bound to one listener.
// Handlers are not owned. The lock is held while a handler runs, so a
// concurrent unregister waits for the in-flight request; the same thread may
// re-enter from inside a handler.
class Dispatcher
{
private:
    std::unordered_map<std::string, HttpHandler *> methods;
    mutable std::recursive_mutex methods_mutex;

public:
    // Replaces any handler already registered under path
    void register_path(const std::string &path, HttpHandler *handler);
    bool unregister_path(const std::string &path);

    // Moves handler from old_path to new_path in one step
    void rebind(const std::string &old_path, const std::string &new_path, HttpHandler *handler);

    HttpHandler *lookup(const std::string &path) const;

    // Holds the table lock; state that handlers read while dispatched can be
    // updated under it together with a registration change.
    std::unique_lock<std::recursive_mutex> acquire() const;

    std::vector<std::string> paths() const;

    // Routes by path and method. Returns false when the request fell through
    // to a 404 or 501.
    bool dispatch(HttpRequest &request);
};

#endif
