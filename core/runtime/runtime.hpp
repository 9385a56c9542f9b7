#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "service/todo_service.hpp"
#include "store/id_generator.hpp"
#include "store/todo_store.hpp"

namespace todod {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Build store and service, then bind the HTTP server
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the HTTP server
    void shutdown();

    service::TodoService &get_todo_service() { return *todo_service_; }
    store::TodoStore &get_store() { return *store_; }

private:
    bool init_store(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<store::TodoStore> store_;
    std::unique_ptr<store::IdGenerator> id_generator_;
    std::unique_ptr<service::TodoService> todo_service_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace todod
