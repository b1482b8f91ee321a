#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>
#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/epoll.h>
#include "http_listener.hpp"
#include "config.hpp"
#include "network_utils.hpp"
#include "tlv/errors.hpp"

static std::string trim(const std::string &s)
{
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

HttpListener::HttpListener(Dispatcher &dispatcher, const std::string &local_addr, int local_port)
    : dispatcher(dispatcher), local_addr(local_addr), local_port(local_port),
      listen_fd(-1), epoll_fd(-1)
{
    epoll_fd = epoll_create1(0);
    if (epoll_fd < 0)
    {
        throw ConnectionError(errno_message("epoll_create1 failed"));
    }

    try
    {
        setup_listener();
    }
    catch (const ConnectionError &)
    {
        close(epoll_fd);
        epoll_fd = -1;
        throw;
    }
}

HttpListener::~HttpListener()
{
    running = false;
    for (const auto &kv : pending)
    {
        close(kv.first);
    }
    if (listen_fd >= 0)
        close(listen_fd);
    if (epoll_fd >= 0)
        close(epoll_fd);
}

void HttpListener::setup_listener()
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
        std::string message = errno_message("Failed to start HTTP listener on port " + std::to_string(local_port));
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

    epoll_event ev;
    ev.events = EPOLLIN;
    ev.data.fd = listen_fd;
    epoll_ctl(epoll_fd, EPOLL_CTL_ADD, listen_fd, &ev);
}

int HttpListener::poll_once(int timeout_ms)
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
        if (events[i].data.fd == listen_fd)
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

void HttpListener::run()
{
    running = true;
    while (running)
    {
        poll_once(POLL_INTERVAL_MS);
    }
}

void HttpListener::stop()
{
    running = false;
}

int HttpListener::port() const
{
    return get_bound_port(listen_fd);
}

void HttpListener::handle_client_connection()
{
    while (true)
    {
        sockaddr_storage client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = accept(listen_fd, (struct sockaddr *)&client_addr, &addr_len);

        if (client_fd < 0)
            return;

        set_nonblocking(client_fd, true);
        epoll_event ev;
        ev.events = EPOLLIN;
        ev.data.fd = client_fd;
        epoll_ctl(epoll_fd, EPOLL_CTL_ADD, client_fd, &ev);
        pending[client_fd];
    }
}

void HttpListener::handle_client_data(int fd)
{
    char buffer[BUFFER_SIZE];
    ssize_t len = recv(fd, buffer, BUFFER_SIZE, 0);

    if (len < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
        return;

    if (len <= 0)
    {
        close_client(fd);
        return;
    }

    std::string &data = pending[fd];
    data.append(buffer, static_cast<size_t>(len));

    if (try_serve(fd, data))
    {
        close_client(fd);
    }
}

// Returns true once the request on fd has been answered
bool HttpListener::try_serve(int fd, const std::string &data)
{
    size_t header_end = data.find("\r\n\r\n");
    if (header_end == std::string::npos)
    {
        if (data.size() > MAX_HTTP_HEADER_SIZE)
        {
            respond_status(fd, 400);
            return true;
        }
        return false;
    }

    std::istringstream head(data.substr(0, header_end));
    std::string request_line;
    std::getline(head, request_line);

    std::istringstream parts(trim(request_line));
    std::string method, path, version;
    if (!(parts >> method >> path >> version) || version.compare(0, 5, "HTTP/") != 0)
    {
        respond_status(fd, 400);
        return true;
    }

    HttpHeaders headers;
    std::string line;
    while (std::getline(head, line))
    {
        line = trim(line);
        if (line.empty())
            continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos)
        {
            respond_status(fd, 400);
            return true;
        }
        headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }

    std::istringstream empty_body;
    std::ostringstream probe;
    HttpRequest header_view(method, path, headers, empty_body, probe);

    size_t body_len = 0;
    if (header_view.header("Content-Length"))
    {
        auto length = header_view.content_length();
        if (!length)
        {
            respond_status(fd, 400);
            return true;
        }
        if (*length > MAX_HTTP_BODY_SIZE)
        {
            respond_status(fd, 413);
            return true;
        }
        body_len = *length;
    }

    size_t body_start = header_end + 4;
    if (data.size() < body_start + body_len)
        return false;

    std::istringstream rfile(data.substr(body_start, body_len));
    std::ostringstream wfile;
    HttpRequest request(method, path, std::move(headers), rfile, wfile);

    try
    {
        dispatcher.dispatch(request);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << method << " " << path << ": " << e.what() << std::endl;
        if (wfile.tellp() <= 0)
        {
            respond_status(fd, 500);
            return true;
        }
    }

    std::string response = wfile.str();
    if (response.empty())
    {
        // Handler ignored the request: fall through like an unknown path
        respond_status(fd, 404);
        return true;
    }

    respond(fd, response);
    return true;
}

void HttpListener::respond(int fd, const std::string &response)
{
    size_t sent = 0;
    while (sent < response.size())
    {
        ssize_t ret = send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (ret >= 0)
        {
            sent += static_cast<size_t>(ret);
            continue;
        }

        if (errno == EINTR)
            continue;

        if ((errno == EAGAIN || errno == EWOULDBLOCK) &&
            wait_for_fd(fd, POLLOUT, HTTP_WRITE_TIMEOUT_MS) > 0)
            continue;

        std::cerr << "Error: response write failed after " << sent << " of "
                  << response.size() << " bytes" << std::endl;
        return;
    }
}

void HttpListener::respond_status(int fd, int code)
{
    std::istringstream rfile;
    std::ostringstream wfile;
    HttpRequest request("", "", HttpHeaders(), rfile, wfile);
    request.send_status(code);
    respond(fd, wfile.str());
}

void HttpListener::close_client(int fd)
{
    epoll_ctl(epoll_fd, EPOLL_CTL_DEL, fd, nullptr);
    close(fd);
    pending.erase(fd);
}
