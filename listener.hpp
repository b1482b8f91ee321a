#ifndef LISTENER_HPP
#define LISTENER_HPP

#include <string>

// Passive TCP endpoint handing out connected stream sockets
class Listener
{
private:
    std::string local_addr;
    int local_port;
    int listen_fd;

    void setup_listener();

public:
    Listener(const std::string &local_addr, int local_port);
    ~Listener();

    Listener(const Listener &) = delete;
    Listener &operator=(const Listener &) = delete;

    // Connected descriptor in blocking mode, or -1 if nothing arrived
    // within timeout_ms (< 0 waits forever)
    int accept(int timeout_ms = -1);

    int get_fd() const;
    int port() const;
};

#endif
