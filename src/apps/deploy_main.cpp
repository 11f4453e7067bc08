/**
 * @file deploy_main.cpp
 * @brief stratus-deploy: provisions a web + SQL deployment
 *
 * Run with:
 *   ./build/stratus-deploy --config deploy.json
 *
 * Administrator credentials come from the configuration file, then from
 * STRATUS_ADMIN_USERNAME / STRATUS_ADMIN_PASSWORD, then from a prompt.
 */

#include "stratus/agent/http_session.hpp"
#include "stratus/cloud/state_cloud.hpp"
#include "stratus/core/logging.hpp"
#include "stratus/deploy/config.hpp"
#include "stratus/deploy/credentials.hpp"
#include "stratus/deploy/pipeline.hpp"
#include "stratus/events/components.hpp"
#include "stratus/events/event_bus.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

namespace po = boost::program_options;

namespace {

bool parse_args(int argc, char* argv[], po::variables_map& options, po::options_description& usage) {
    usage.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>()->default_value("deploy.json"), "Deployment configuration file")
        ("state-file,s", po::value<std::string>(), "Control-plane state file (overrides the configuration)")
        ("segment-size", po::value<std::size_t>(), "Transfer segment size in bytes")
        ("log-file", po::value<std::string>(), "Also log to this rotating file")
        ("verbose,v", po::bool_switch(), "Debug logging");

    po::store(po::parse_command_line(argc, argv, usage), options);
    po::notify(options);
    return !options.count("help");
}

std::unique_ptr<stratus::deploy::CredentialProvider> make_credential_provider(
    const stratus::deploy::DeploymentConfig& config) {
    if (config.credentials) {
        return std::make_unique<stratus::deploy::StaticCredentialProvider>(*config.credentials);
    }
    if (auto from_env = stratus::deploy::credentials_from_environment()) {
        return std::make_unique<stratus::deploy::StaticCredentialProvider>(*from_env);
    }
    return std::make_unique<stratus::deploy::TerminalCredentialPrompt>(std::cin, std::cerr);
}

} // namespace

int main(int argc, char* argv[]) {
    po::variables_map options;
    po::options_description usage("stratus-deploy options");
    try {
        if (!parse_args(argc, argv, options, usage)) {
            std::cout << usage << std::endl;
            return 0;
        }
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage << std::endl;
        return 1;
    }

    auto loaded = stratus::deploy::load_deployment_config(options["config"].as<std::string>());
    if (loaded.is_error()) {
        std::cerr << "Error: " << loaded.error() << std::endl;
        return 1;
    }
    auto config = loaded.take();

    if (options.count("state-file")) {
        config.state_file = options["state-file"].as<std::string>();
    }
    if (options.count("segment-size")) {
        config.segment_size = options["segment-size"].as<std::size_t>();
        if (config.segment_size == 0) {
            std::cerr << "Error: --segment-size must be > 0" << std::endl;
            return 1;
        }
    }
    if (options.count("log-file")) {
        config.logging.file = options["log-file"].as<std::string>();
    }
    config.logging.verbose = config.logging.verbose || options["verbose"].as<bool>();

    auto logger = stratus::configure_logging(config.logging, "deploy");
    if (logger.is_error()) {
        std::cerr << "Error: " << logger.error() << std::endl;
        return 1;
    }

    if (config.state_file.empty()) {
        spdlog::warn("No state file configured, control-plane state is kept in memory only");
    }
    auto cloud = stratus::cloud::JsonStateCloud::open(config.state_file);
    if (cloud.is_error()) {
        spdlog::error("{}", cloud.error());
        return 1;
    }

    stratus::events::EventBus bus;
    stratus::events::LoggerComponent logger_component(bus);
    stratus::events::ProgressComponent progress(bus);

    stratus::agent::HttpSessionFactory sessions;
    auto credentials = make_credential_provider(config);

    stratus::deploy::DeploymentPipeline pipeline(config, *cloud.value(), sessions, *credentials, bus);
    auto result = pipeline.run();
    progress.log_summary();

    if (result.is_error()) {
        spdlog::error("{}", result.error());
        return 1;
    }
    return 0;
}
