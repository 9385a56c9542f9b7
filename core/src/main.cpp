// todod
// Todo record service over HTTP, backed by a single JSON document

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    const std::string default_config_path = "todod.yaml";
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: todod [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: " << default_config_path
                      << " if present, else built-in defaults)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    todod::runtime::RuntimeConfig config;
    std::string error;

    const bool explicit_config = !config_path.empty();
    if (!explicit_config) {
        config_path = default_config_path;
    }

    if (std::filesystem::exists(config_path)) {
        LOG_INFO("todod starting...");
        LOG_INFO("Loading config: " << config_path);

        if (!todod::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    } else if (explicit_config) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    } else {
        LOG_INFO("todod starting with built-in defaults (no " << default_config_path << ")");
    }

    todod::logging::Logger::set_level(todod::logging::string_to_level(config.logging.level));

    todod::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    todod::runtime::SignalHandler::install();

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Listening: http://" << config.http.bind << ":" << config.http.port);
    LOG_INFO("  Store: " << config.store.path);

    // Run main loop (blocking)
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
