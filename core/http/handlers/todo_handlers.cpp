#include "../../logging/logger.hpp"
#include "../../service/todo_service.hpp"
#include "../../store/todo.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace todod {
namespace http {

//=============================================================================
// GET /todos
//=============================================================================
void HttpServer::handle_list_todos(const httplib::Request &req, httplib::Response &res) {
    auto result = todos_.list();
    if (!result.success()) {
        send_failure(req, res, result);
        return;
    }

    send_json(res, StatusCode::OK, store::encode_todos(result.todos));
}

//=============================================================================
// GET /todo?id=...|title=...
//=============================================================================
void HttpServer::handle_get_todo(const httplib::Request &req, httplib::Response &res) {
    auto result = todos_.get(parse_lookup_key(req));
    if (!result.success()) {
        send_failure(req, res, result);
        return;
    }

    send_json(res, StatusCode::OK, store::encode_todo(result.todo));
}

//=============================================================================
// POST /todos/create-todo
//=============================================================================
void HttpServer::handle_create_todo(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json payload;
    if (!parse_payload(req.body, payload)) {
        LOG_DEBUG("[HTTP] Rejected malformed payload on " << req.path);
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(kInvalidJsonMessage));
        return;
    }

    auto result = todos_.create(decode_create_request(payload));
    if (!result.success()) {
        send_failure(req, res, result);
        return;
    }

    send_json(res, StatusCode::CREATED, store::encode_todo(result.todo));
}

//=============================================================================
// PATCH /todos/update-todo?id=...|title=...
//=============================================================================
void HttpServer::handle_update_todo(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json payload;
    if (!parse_payload(req.body, payload)) {
        LOG_DEBUG("[HTTP] Rejected malformed payload on " << req.path);
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(kInvalidJsonMessage));
        return;
    }

    auto result = todos_.update(parse_lookup_key(req), decode_update_request(payload));
    if (!result.success()) {
        send_failure(req, res, result);
        return;
    }

    send_json(res, StatusCode::OK, store::encode_todo(result.todo));
}

//=============================================================================
// DELETE /todos/delete-todo?id=...|title=...
//=============================================================================
void HttpServer::handle_delete_todo(const httplib::Request &req, httplib::Response &res) {
    auto result = todos_.remove(parse_lookup_key(req));
    if (!result.success()) {
        send_failure(req, res, result);
        return;
    }

    send_json(res, StatusCode::OK, make_success_response());
}

}  // namespace http
}  // namespace todod
