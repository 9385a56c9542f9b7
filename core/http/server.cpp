#include "server.hpp"

#include <exception>
#include <utility>

#include "errors.hpp"
#include "logging/logger.hpp"
#include "service/todo_service.hpp"

namespace todod {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, service::TodoService &todos)
    : config_(config), todos_(todos) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // httplib serves HEAD from GET routes; only the registered methods are routes here
    server_->set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res) {
        if (req.method != "HEAD") {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        LOG_DEBUG("[HTTP] No route for " << req.method << " " << req.path);
        res.status = kStatusNotFound;
        res.set_content(make_error_response(kRouteNotFoundMessage).dump(), "application/json");
        return httplib::Server::HandlerResponse::Handled;
    });

    // Fill in a JSON body for errors raised by httplib itself (unmatched route,
    // unparseable request). Bodies already set by a handler are kept.
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        std::string message = kInternalErrorMessage;
        if (res.status == kStatusNotFound) {
            message = kRouteNotFoundMessage;
            LOG_DEBUG("[HTTP] No route for " << req.method << " " << req.path);
        } else if (res.status >= kStatusBadRequest && res.status < kStatusInternal) {
            message = kBadRequestMessage;
        }

        res.set_content(make_error_response(message).dump(), "application/json");
    });

    // Anything a handler throws ends as a generic 500; the detail stays in the log
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        res.status = kStatusInternal;
        res.set_content(make_error_response(kInternalErrorMessage).dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on http://" << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET /todos - List all todos
    server_->Get("/todos",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_list_todos(req, res); });

    // GET /todo?id=...|title=... - Fetch one todo
    server_->Get("/todo", [this](const httplib::Request &req, httplib::Response &res) { handle_get_todo(req, res); });

    // POST /todos/create-todo - Create a todo
    server_->Post("/todos/create-todo",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_create_todo(req, res); });

    // PATCH /todos/update-todo?id=...|title=... - Replace a todo's body
    server_->Patch("/todos/update-todo",
                   [this](const httplib::Request &req, httplib::Response &res) { handle_update_todo(req, res); });

    // DELETE /todos/delete-todo?id=...|title=... - Delete matching todos
    server_->Delete("/todos/delete-todo",
                    [this](const httplib::Request &req, httplib::Response &res) { handle_delete_todo(req, res); });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET    /todos");
    LOG_INFO("[HTTP]   GET    /todo?id=|title=");
    LOG_INFO("[HTTP]   POST   /todos/create-todo");
    LOG_INFO("[HTTP]   PATCH  /todos/update-todo?id=|title=");
    LOG_INFO("[HTTP]   DELETE /todos/delete-todo?id=|title=");
}

}  // namespace http
}  // namespace todod
