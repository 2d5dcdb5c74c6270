/// @file main.cpp
/// @brief relay_host entry point - loads a host config and runs its instances
///
/// Startup:
/// - HostConfig: read from the JSON file given on the command line
/// - Logging: console and optional rotating file sinks from the "log" section
/// - Host: registry, store, event bus, executor and session manager
/// - Instances: started from the config, scripts loaded from the catalog
///
/// Runs until SIGINT or SIGTERM, then shuts the host down.

#include "sample_scripts.hpp"

#include <relay/core/log.hpp>
#include <relay/core/version.hpp>
#include <relay/host/host.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] CONFIG\n"
              << "\n"
              << "Arguments:\n"
              << "  CONFIG          Path to the host configuration (JSON)\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h      Show this help message\n"
              << "  --version, -v   Show version information\n"
              << "  --scripts       List the bundled scripts and exit\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " config/relay.json\n";
}

void print_version() {
    std::cout << "relay_host " << relay_core::relay_version().to_string() << "\n"
              << "relay script host runtime\n";
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    std::string config_path;
    bool list_scripts = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--scripts") {
            list_scripts = true;
        } else if (!arg.empty() && arg[0] != '-') {
            config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    relay_core::init_logging();

    auto catalog = std::make_shared<relay_host::ScriptCatalog>();
    relay_app::register_sample_scripts(*catalog);

    if (list_scripts) {
        for (const auto& name : catalog->names()) {
            auto script = catalog->create(name);
            std::cout << name << "  " << script->manifest().version << "  " << script->manifest().description << "\n";
        }
        return 0;
    }

    if (config_path.empty()) {
        std::cerr << "Error: No configuration specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    auto config = relay_host::HostConfig::load_file(config_path);
    if (!config) {
        RELAY_LOG_ERROR("Failed to load configuration: {}", relay_core::build_error_chain(config.error()));
        return 1;
    }

    relay_core::configure_logging(config.value().log);
    RELAY_LOG_INFO("relay_host {} starting bot '{}' ({} instances)",
        relay_core::relay_version().to_string(), config.value().bot_id, config.value().instances.size());

    auto host = relay_host::Host::create(std::move(config).value(), catalog);
    if (!host) {
        RELAY_LOG_ERROR("Failed to create host: {}", relay_core::build_error_chain(host.error()));
        return 1;
    }

    if (auto started = host.value()->start(); !started) {
        RELAY_LOG_ERROR("Failed to start host: {}", relay_core::build_error_chain(started.error()));
        host.value()->shutdown();
        return 1;
    }

    if (auto port = host.value()->web_port(); port != 0) {
        RELAY_LOG_INFO("Websocket peers: ws://{}:{}/<instance>/<script>", host.value()->config().web.address, port);
    }

    // Block until asked to stop
    boost::asio::io_context signals_io;
    boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            RELAY_LOG_INFO("Received signal {}, stopping", signal_number);
        }
    });
    signals_io.run();

    host.value()->shutdown();
    relay_core::shutdown_logging();
    return 0;
}
