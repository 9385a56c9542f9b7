#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>
#include <vector>

#include "../logging/logger.hpp"

namespace todod {
namespace runtime {

namespace {
constexpr int kMaxIndent = 8;
}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "HTTP bind address must not be empty";
        return false;
    }
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }

    // Validate Store settings
    if (config.store.path.empty()) {
        error = "store.path must not be empty";
        return false;
    }
    if (config.store.indent < 0 || config.store.indent > kMaxIndent) {
        error = "store.indent must be between 0 and " + std::to_string(kMaxIndent);
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // An empty file is a valid, all-defaults config
        if (yaml.IsNull()) {
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "store", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }
            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
        }

        // Load store config
        if (yaml["store"]) {
            if (yaml["store"]["path"]) {
                config.store.path = yaml["store"]["path"].as<std::string>();
            }
            if (yaml["store"]["indent"]) {
                config.store.indent = yaml["store"]["indent"].as<int>();
            }
            if (yaml["store"]["serialize_writes"]) {
                config.store.serialize_writes = yaml["store"]["serialize_writes"].as<bool>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                   << config.http.thread_pool_size << " worker threads)");

        std::stringstream store_msg;
        store_msg << "[Config] Store: " << config.store.path;
        if (config.store.serialize_writes) {
            store_msg << " (serialized writes)";
        }
        LOG_INFO(store_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace todod
