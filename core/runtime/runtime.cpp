#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace todod {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing todod");

    if (!init_store(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    // Armed here rather than in run() so a stop() issued in between is not lost
    running_ = true;

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_store(std::string &error) {
    store_ = std::make_unique<store::TodoStore>(config_.store.path, config_.store.indent);
    id_generator_ = std::make_unique<store::IdGenerator>();
    todo_service_ =
        std::make_unique<service::TodoService>(*store_, *id_generator_, config_.store.serialize_writes);

    // Probe the document once so a corrupt file is reported at startup.
    // Not fatal: requests keep answering 500 until the file is fixed.
    store::Collection todos;
    store::StoreError store_error;
    if (store_->load(todos, store_error)) {
        LOG_INFO("[Runtime] Store " << store_->path() << " holds " << todos.size() << " todo(s)");
    } else {
        LOG_WARN("[Runtime] Store " << store_->path() << " is unreadable ("
                                    << store::store_error_kind_to_string(store_error.kind)
                                    << "): " << store_error.message);
    }

    if (!config_.store.serialize_writes) {
        LOG_DEBUG("[Runtime] Writes are not serialized; concurrent mutations may overwrite each other");
    }

    return true;
}

bool Runtime::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *todo_service_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }

    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }
}

}  // namespace runtime
}  // namespace todod
