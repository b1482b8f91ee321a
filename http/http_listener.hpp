#ifndef HTTP_LISTENER_HPP
#define HTTP_LISTENER_HPP

#include <atomic>
#include <string>
#include <unordered_map>
#include "dispatcher.hpp"

// Single-threaded HTTP/1.0 front end for a Dispatcher. Each connection
// carries one request; the response is buffered while the handler runs and
// written before the connection is closed.
class HttpListener
{
private:
    Dispatcher &dispatcher;
    std::string local_addr;
    int local_port;
    int listen_fd;
    int epoll_fd;
    std::atomic<bool> running{false};

    // Bytes received so far on each client connection
    std::unordered_map<int, std::string> pending;

    void setup_listener();
    void handle_client_connection();
    void handle_client_data(int fd);
    bool try_serve(int fd, const std::string &data);
    void respond(int fd, const std::string &response);
    void respond_status(int fd, int code);
    void close_client(int fd);

public:
    HttpListener(Dispatcher &dispatcher, const std::string &local_addr, int local_port);
    ~HttpListener();

    HttpListener(const HttpListener &) = delete;
    HttpListener &operator=(const HttpListener &) = delete;

    // Serves whatever is ready within timeout_ms. Returns the number of
    // events handled.
    int poll_once(int timeout_ms);

    void run();
    void stop();

    int port() const;
};

#endif
