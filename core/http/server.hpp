#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

namespace todod {

namespace service {
class TodoService;
}

namespace http {

/**
 * @brief HTTP front end for the todo service
 *
 * Maps exact (method, path) pairs onto TodoService operations and encodes
 * every response, including routing errors, as JSON.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool, so requests overlap
 * - No locking happens here; TodoService decides whether writes serialize
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, service::TodoService &todos);

    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    service::TodoService &todos_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/todo_handlers.cpp)
    void handle_list_todos(const httplib::Request &req, httplib::Response &res);
    void handle_get_todo(const httplib::Request &req, httplib::Response &res);
    void handle_create_todo(const httplib::Request &req, httplib::Response &res);
    void handle_update_todo(const httplib::Request &req, httplib::Response &res);
    void handle_delete_todo(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace todod
