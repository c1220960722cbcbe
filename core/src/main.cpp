// Trellico Runtime
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "trellico-runtime.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: trellico-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: trellico-runtime.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    trellico::logging::Logger::init(trellico::logging::Level::LVL_INFO);
    LOG_INFO("Trellico Runtime v0 starting...");
    LOG_INFO("Loading config: " << config_path);

    trellico::runtime::RuntimeConfig config;
    std::string error;

    if (!trellico::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    trellico::logging::Logger::set_level(trellico::logging::string_to_level(config.logging.level));

    trellico::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    if (!trellico::runtime::SignalHandler::install(error)) {
        LOG_ERROR("Failed to install signal handlers: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Providers: " << runtime.get_catalog().size());
    LOG_INFO("  Process mode: " << trellico::process::process_mode_to_string(config.processes.mode));

    // Blocks until SIGINT/SIGTERM, then shuts everything down
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
