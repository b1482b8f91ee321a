#include "listener.hpp"
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include "config.hpp"
#include "network_utils.hpp"
#include "tlv/errors.hpp"

Listener::Listener(const std::string &local_addr, int local_port)
    : local_addr(local_addr), local_port(local_port), listen_fd(-1)
{
    setup_listener();
}

Listener::~Listener()
{
    if (listen_fd >= 0)
        close(listen_fd);
}

void Listener::setup_listener()
{
    sockaddr_storage addr;
    socklen_t addr_len;
    if (!setup_sockaddr(addr, addr_len, local_addr, local_port))
    {
        throw ConnectionError("Invalid listen address: " + local_addr);
    }

    listen_fd = socket(addr.ss_family, SOCK_STREAM, 0);
    if (listen_fd < 0)
    {
        throw ConnectionError(errno_message("socket failed"));
    }

    int opt = 1;
    setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(listen_fd, (struct sockaddr *)&addr, addr_len) < 0)
    {
        std::string message = errno_message("Bind failed on port " + std::to_string(local_port));
        close(listen_fd);
        listen_fd = -1;
        throw ConnectionError(message);
    }

    if (listen(listen_fd, LISTEN_BACKLOG) < 0)
    {
        std::string message = errno_message("listen failed");
        close(listen_fd);
        listen_fd = -1;
        throw ConnectionError(message);
    }
    set_nonblocking(listen_fd, true);
}

int Listener::accept(int timeout_ms)
{
    while (true)
    {
        int ready = wait_for_fd(listen_fd, POLLIN, timeout_ms);
        if (ready < 0)
            throw ConnectionError(errno_message("poll failed"));
        if (ready == 0)
            return -1;

        sockaddr_storage client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept(listen_fd, (struct sockaddr *)&client_addr, &addr_len);
        if (client_fd < 0)
        {
            // Peer gave up between poll and accept
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR)
                continue;
            throw ConnectionError(errno_message("accept failed"));
        }

        set_nonblocking(client_fd, false);
        int flag = 1;
        setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        return client_fd;
    }
}

int Listener::get_fd() const
{
    return listen_fd;
}

int Listener::port() const
{
    return get_bound_port(listen_fd);
}
