// tether-cli
// Interactive JSON-RPC over WebSocket client driven by a YAML config

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"

int main(int argc, char **argv) {
    std::string config_path = "tether.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: tether-cli [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: tether.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Input (one per line on stdin):\n";
            std::cerr << "  method [json-params]          Send a request\n";
            std::cerr << "  :notify method [json-params]  Send a notification\n";
            std::cerr << "  :respond id [json-result]     Answer a server request\n";
            std::cerr << "  :health  :offline  :online  :disconnect  :connect  :quit\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger threshold is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("tether-cli starting...");
    LOG_INFO("Loading config: " + config_path);

    tether::runtime::CliConfig config;
    std::string error;

    if (!tether::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    tether::logging::Logger::set_level(tether::logging::string_to_level(config.logging.level));

    tether::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    tether::runtime::install_signal_handlers();

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
