#include "dispatcher.hpp"

void Dispatcher::register_path(const std::string &path, HttpHandler *handler)
{
    std::lock_guard<std::recursive_mutex> lock(methods_mutex);
    methods[path] = handler;
}

bool Dispatcher::unregister_path(const std::string &path)
{
    std::lock_guard<std::recursive_mutex> lock(methods_mutex);
    return methods.erase(path) > 0;
}

void Dispatcher::rebind(const std::string &old_path, const std::string &new_path, HttpHandler *handler)
{
    std::lock_guard<std::recursive_mutex> lock(methods_mutex);

    auto it = methods.find(old_path);
    if (it != methods.end() && it->second == handler)
    {
        methods.erase(it);
    }
    methods[new_path] = handler;
}

HttpHandler *Dispatcher::lookup(const std::string &path) const
{
    std::lock_guard<std::recursive_mutex> lock(methods_mutex);

    auto it = methods.find(path);
    if (it == methods.end())
        return nullptr;
    return it->second;
}

std::unique_lock<std::recursive_mutex> Dispatcher::acquire() const
{
    return std::unique_lock<std::recursive_mutex>(methods_mutex);
}

std::vector<std::string> Dispatcher::paths() const
{
    std::lock_guard<std::recursive_mutex> lock(methods_mutex);

    std::vector<std::string> out;
    out.reserve(methods.size());
    for (const auto &kv : methods)
    {
        out.push_back(kv.first);
    }
    return out;
}

bool Dispatcher::dispatch(HttpRequest &request)
{
    std::lock_guard<std::recursive_mutex> lock(methods_mutex);

    auto it = methods.find(request.path());
    if (it == methods.end())
    {
        request.send_status(404);
        return false;
    }

    HttpHandler *handler = it->second;
    if (request.method() == "GET")
    {
        handler->handle_get(request);
    }
    else if (request.method() == "POST")
    {
        handler->handle_post(request);
    }
    else
    {
        request.send_status(501);
        return false;
    }

    return true;
}
