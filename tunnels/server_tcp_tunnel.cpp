#include <iostream>
#include <unistd.h>
#include <sys/epoll.h>
#include <utility>
#include "server_tcp_tunnel.hpp"
#include "config.hpp"
#include "network_utils.hpp"
#include "tlv/errors.hpp"

ServerTcpTunnel::ServerTcpTunnel(const std::string &local_addr, int local_port, PacketHandler handler)
    : listener(local_addr, local_port), handler(std::move(handler))
{
    epoll_fd = epoll_create1(0);
    if (epoll_fd < 0)
    {
        throw ConnectionError(errno_message("epoll_create1 failed"));
    }

    epoll_event ev;
    ev.events = EPOLLIN;
    ev.data.fd = listener.get_fd();
    epoll_ctl(epoll_fd, EPOLL_CTL_ADD, listener.get_fd(), &ev);
}

ServerTcpTunnel::~ServerTcpTunnel()
{
    running = false;
    clients.clear();
    if (epoll_fd >= 0)
        close(epoll_fd);
}

int ServerTcpTunnel::poll_once(int timeout_ms)
{
    epoll_event events[MAX_EVENTS];

    int nfds = epoll_wait(epoll_fd, events, MAX_EVENTS, timeout_ms);
    if (nfds < 0)
    {
        if (errno == EINTR)
            return 0;
        throw ConnectionError(errno_message("epoll_wait failed"));
    }

    for (int i = 0; i < nfds; ++i)
    {
        if (events[i].data.fd == listener.get_fd())
        {
            handle_client_connection();
        }
        else
        {
            handle_client_data(events[i].data.fd);
        }
    }

    return nfds;
}

void ServerTcpTunnel::run()
{
    while (running)
    {
        poll_once(POLL_INTERVAL_MS);
    }
}

void ServerTcpTunnel::handle_client_connection()
{
    int client_fd = listener.accept(0);
    if (client_fd < 0)
        return;

    epoll_event ev;
    ev.events = EPOLLIN;
    ev.data.fd = client_fd;
    epoll_ctl(epoll_fd, EPOLL_CTL_ADD, client_fd, &ev);
    clients[client_fd] = std::make_unique<TlvClient>(client_fd);

    std::cerr << "Agent connected (fd=" << client_fd << ")" << std::endl;
}

void ServerTcpTunnel::handle_client_data(int fd)
{
    auto it = clients.find(fd);
    if (it == clients.end())
        return;

    try
    {
        // A stalled agent must not hold up the others
        auto packet = it->second->try_read();
        if (packet && handler)
        {
            handler(*packet, *it->second);
        }
    }
    catch (const ConnectionError &e)
    {
        std::cerr << "Agent disconnected (fd=" << fd << "): " << e.what() << std::endl;
        remove_client(fd);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        remove_client(fd);
    }
}

void ServerTcpTunnel::remove_client(int fd)
{
    epoll_ctl(epoll_fd, EPOLL_CTL_DEL, fd, nullptr);
    clients.erase(fd);
}

int ServerTcpTunnel::port() const
{
    return listener.port();
}

size_t ServerTcpTunnel::client_count() const
{
    return clients.size();
}
