#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <string>
#include "config.hpp"

// Outbound TCP stream connection. Owns the socket until release() hands it
// to a transport.
class Connection
{
private:
    int sockfd;

public:
    Connection(const std::string &addr, int port, int timeout_ms = CONNECT_TIMEOUT_MS);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    int release();
    int get_fd() const;
};

#endif
