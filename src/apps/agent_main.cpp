/**
 * @file agent_main.cpp
 * @brief stratus-agent: the remote side of the deployer
 *
 * Serves the v1 agent protocol over HTTP on one Asio event loop. File
 * operations are confined to the configured root; command operations run
 * entries of the command catalog only.
 *
 * Run with:
 *   ./build/stratus-agent --config agent.json
 */

#include "stratus/agent/command_runner.hpp"
#include "stratus/agent/config.hpp"
#include "stratus/agent/routes.hpp"
#include "stratus/agent/service.hpp"
#include "stratus/core/logging.hpp"
#include "stratus/network/http_router.hpp"
#include "stratus/network/http_server.hpp"

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>

namespace po = boost::program_options;

namespace {

bool parse_args(int argc, char* argv[], po::variables_map& options, po::options_description& usage) {
    usage.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>()->default_value("agent.json"), "Agent configuration file")
        ("port,p", po::value<int>(), "Override the listening port")
        ("root,r", po::value<std::string>(), "Override the file root")
        ("log-file", po::value<std::string>(), "Also log to this rotating file")
        ("verbose,v", po::bool_switch(), "Debug logging");

    po::store(po::parse_command_line(argc, argv, usage), options);
    po::notify(options);
    return !options.count("help");
}

} // namespace

int main(int argc, char* argv[]) {
    po::variables_map options;
    po::options_description usage("stratus-agent options");
    try {
        if (!parse_args(argc, argv, options, usage)) {
            std::cout << usage << std::endl;
            return 0;
        }
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage << std::endl;
        return 1;
    }

    auto loaded = stratus::agent::load_agent_config(options["config"].as<std::string>());
    if (loaded.is_error()) {
        std::cerr << "Error: " << loaded.error() << std::endl;
        return 1;
    }
    auto config = loaded.take();

    if (options.count("port")) {
        const int port = options["port"].as<int>();
        if (port < 0 || port > 65535) {
            std::cerr << "Error: port out of range: " << port << std::endl;
            return 1;
        }
        config.port = static_cast<std::uint16_t>(port);
    }
    if (options.count("root")) {
        config.root = options["root"].as<std::string>();
    }
    if (options.count("log-file")) {
        config.logging.file = options["log-file"].as<std::string>();
    }
    config.logging.verbose = config.logging.verbose || options["verbose"].as<bool>();

    auto logger = stratus::configure_logging(config.logging, "agent");
    if (logger.is_error()) {
        std::cerr << "Error: " << logger.error() << std::endl;
        return 1;
    }

    stratus::agent::ProcessCommandRunner runner;
    stratus::agent::AgentService service(config.root, config.commands, runner);

    stratus::network::HttpRouter router;
    stratus::agent::register_agent_routes(router, service, config.credentials);

    try {
        boost::asio::io_context io_context;

        stratus::network::HttpServer server(io_context, config.bind_address, config.port,
                                            config.max_segment_size + 64 * 1024);
        server.set_handler([&router](const stratus::network::HttpRequest& request) {
            return router.handle_request(request);
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down...", signal);
            server.stop();
            io_context.stop();
        });

        spdlog::info("════════════════════════════════════════════");
        spdlog::info("{} (protocol v{}) listening on {}:{}", stratus::agent::kAgentName,
                     stratus::agent::kProtocolVersion, config.bind_address, server.port());
        spdlog::info("File root: {}", service.root().string());
        spdlog::info("Command catalog: {} entr{}", config.commands.size(), config.commands.size() == 1 ? "y" : "ies");
        for (const auto& route : router.list_routes()) {
            spdlog::debug("  {}", route);
        }
        spdlog::info("════════════════════════════════════════════");

        io_context.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Agent failed: {}", e.what());
        return 1;
    }

    spdlog::info("Agent stopped");
    return 0;
}
