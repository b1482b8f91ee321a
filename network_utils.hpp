#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <cstdint>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <arpa/inet.h>
#include <sys/socket.h>

// Detect if an address string is IPv6
inline bool is_ipv6(const std::string &addr)
{
    struct in6_addr result;
    return inet_pton(AF_INET6, addr.c_str(), &result) == 1;
}

// Get the appropriate address family for a given address string
inline int get_address_family(const std::string &addr)
{
    return is_ipv6(addr) ? AF_INET6 : AF_INET;
}

// Setup sockaddr_storage for a given address and port.
// Returns false if the address is not a valid numeric IPv4/IPv6 literal.
inline bool setup_sockaddr(sockaddr_storage &addr_storage, socklen_t &addr_len,
                           const std::string &addr, int port)
{
    memset(&addr_storage, 0, sizeof(addr_storage));

    if (is_ipv6(addr))
    {
        sockaddr_in6 *addr6 = (sockaddr_in6 *)&addr_storage;
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(port);
        addr_len = sizeof(sockaddr_in6);
        return inet_pton(AF_INET6, addr.c_str(), &addr6->sin6_addr) == 1;
    }

    sockaddr_in *addr4 = (sockaddr_in *)&addr_storage;
    addr4->sin_family = AF_INET;
    addr4->sin_port = htons(port);
    addr_len = sizeof(sockaddr_in);
    return inet_pton(AF_INET, addr.c_str(), &addr4->sin_addr) == 1;
}

// Port a bound socket actually listens on (useful after binding port 0)
inline int get_bound_port(int fd)
{
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd, (struct sockaddr *)&addr, &addr_len) < 0)
        return -1;

    if (addr.ss_family == AF_INET6)
        return ntohs(((sockaddr_in6 *)&addr)->sin6_port);
    return ntohs(((sockaddr_in *)&addr)->sin_port);
}

inline bool set_nonblocking(int fd, bool enabled)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return false;

    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

// Wait until fd reports one of events. timeout_ms < 0 waits forever.
// Returns 1 when ready, 0 on timeout, -1 on error (errno set).
inline int wait_for_fd(int fd, short events, int timeout_ms)
{
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;

    while (true)
    {
        int ret = poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR)
            continue;
        return ret > 0 ? 1 : ret;
    }
}

// Parses "host:port", or a bare "port" leaving host untouched. Returns false
// unless the port is 1-5 decimal digits no larger than 65535.
inline bool parse_endpoint(const std::string &value, std::string &host, uint16_t &port)
{
    std::string port_text = value;
    std::string host_text = host;

    auto pos = value.find_last_of(':');
    if (pos != std::string::npos)
    {
        host_text = value.substr(0, pos);
        port_text = value.substr(pos + 1);
    }

    if (port_text.empty() || port_text.size() > 5)
        return false;

    uint32_t number = 0;
    for (char c : port_text)
    {
        if (c < '0' || c > '9')
            return false;
        number = number * 10 + static_cast<uint32_t>(c - '0');
    }
    if (number > 65535)
        return false;

    host = host_text;
    port = static_cast<uint16_t>(number);
    return true;
}

inline std::string errno_message(const std::string &what)
{
    return what + ": " + std::strerror(errno);
}

#endif
