#pragma once

#include <string>

namespace todod {
namespace runtime {

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 5000;                 // HTTP port
    int thread_pool_size = 8;        // Worker thread pool size
};

struct StoreConfig {
    std::string path = "db/todo.json";  // Collection document, relative to the working directory
    int indent = 2;                     // Spaces per level when writing the document (0-8)
    bool serialize_writes = false;      // Hold one mutex across each create/update/delete cycle
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    HttpConfig http;
    StoreConfig store;
    LoggingConfig logging;
};

// Loads configuration from a YAML file; keys absent from the file keep their defaults
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace todod
