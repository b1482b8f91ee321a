#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <CLI/CLI.hpp>
#include "config.hpp"
#include "network_utils.hpp"
#include "tlv/packet.hpp"
#include "tunnels/tunnel.hpp"
#include "tunnels/client_tcp_tunnel.hpp"
#include "tunnels/server_tcp_tunnel.hpp"
#include "tunnels/server_http_tunnel.hpp"

struct Config
{
    std::string local_host = "::";
    uint16_t local_port = 0;
    std::string remote_host;
    uint16_t remote_port = 0;
    std::string protocol = "tcp";
    std::string urlpath = "/";
    size_t egress_limit = EGRESS_LIMIT;
    std::string overflow = "reject";
    uint32_t type = 1;
    std::string message;
};

static void log_packet(const char *direction, const Packet &packet)
{
    std::cerr << direction << " packet type=" << packet.type()
              << " length=" << packet.length() << std::endl;
}

int main(int argc, char *argv[])
{
    CLI::App app{"Tiny TLV Tunnel - TLV command/control transport over TCP or HTTP"};

    app.set_version_flag("-v,--version", "1.0.0");

    Config config;

    auto client = app.add_subcommand("client", "Run as agent (sends one packet over TCP and prints the reply)");
    auto server = app.add_subcommand("server", "Run as controller (echoes every packet back to its sender)");

    // Client-specific options
    client->add_option_function<std::string>(
              "-r,--remote",
              [&config](const std::string &val)
              {
                  if (val.find(':') == std::string::npos ||
                      !parse_endpoint(val, config.remote_host, config.remote_port))
                  {
                      throw CLI::ValidationError("Remote must be specified as host:port");
                  }
              },
              "Controller address (host:port)")
        ->required();

    client->add_option("-t,--type", config.type, "Packet type");

    client->add_option("-m,--message", config.message, "Packet payload")
        ->required();

    // Server-specific options
    server->add_option_function<std::string>(
              "-l,--local",
              [&config](const std::string &val)
              {
                  if (!parse_endpoint(val, config.local_host, config.local_port))
                  {
                      throw CLI::ValidationError("Local must be specified as host:port or port");
                  }
              },
              "Local listen address (host:port or port)")
        ->required();

    server->add_option("-p,--protocol", config.protocol, "Transport protocol")
        ->check(CLI::IsMember({"tcp", "http"}));

    server->add_option("-u,--urlpath", config.urlpath, "URL path polled by HTTP agents");

    server->add_option("--egress-limit", config.egress_limit, "Max queued egress bytes for HTTP (0 = unbounded)");

    server->add_option("--overflow", config.overflow, "Egress overflow policy")
        ->check(CLI::IsMember({"reject", "drop_oldest", "block"}));

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try
    {
        std::unique_ptr<Tunnel> tunnel;

        // The HTTP echo callback needs the transport it belongs to, which
        // only exists once the tunnel is constructed
        ServerHttpTunnel *http = nullptr;

        if (client->parsed())
        {
            auto agent = std::make_unique<ClientTcpTunnel>(
                config.remote_host, config.remote_port,
                Packet(config.type, config.message));
            log_packet("Sending", Packet(config.type, config.message));
            agent->run();

            const auto &reply = agent->get_reply();
            if (reply)
            {
                log_packet("Received", *reply);
                std::cout << reply->payload_string() << std::endl;
            }
            return 0;
        }
        else if (server->parsed())
        {
            if (config.protocol == "tcp")
            {
                tunnel = std::make_unique<ServerTcpTunnel>(
                    config.local_host, config.local_port,
                    [](const Packet &packet, TlvClient &agent)
                    {
                        log_packet("Received", packet);
                        agent.send(packet);
                    });
            }
            else if (config.protocol == "http")
            {
                auto http_tunnel = std::make_unique<ServerHttpTunnel>(
                    config.local_host, config.local_port, config.urlpath,
                    [&http](const Packet &packet)
                    {
                        log_packet("Received", packet);
                        http->get_transport().send(packet);
                    },
                    config.egress_limit, parse_overflow_policy(config.overflow));
                http = http_tunnel.get();
                tunnel = std::move(http_tunnel);
            }
            else
            {
                throw std::runtime_error("Unknown protocol: " + config.protocol);
            }

            std::cerr << "Listening on " << config.local_host << ":" << config.local_port
                      << " (" << config.protocol << ")" << std::endl;
        }
        else
        {
            throw std::runtime_error("Unknown mode");
        }

        tunnel->run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
