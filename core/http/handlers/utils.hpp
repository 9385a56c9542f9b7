#pragma once

#include <httplib.h>

#include <string>

#include <nlohmann/json.hpp>

#include "../../logging/logger.hpp"
#include "../../service/todo_service.hpp"
#include "../errors.hpp"
#include "../json.hpp"

namespace todod {
namespace http {

// Helper: Build the lookup key from ?id= and ?title= (URL-decoded by httplib)
inline service::LookupKey parse_lookup_key(const httplib::Request &req) {
    service::LookupKey key;
    if (req.has_param("id")) {
        key.id = req.get_param_value("id");
    }
    if (req.has_param("title")) {
        key.title = req.get_param_value("title");
    }
    return key;
}

// Helper: Send JSON response (works for both json and ordered_json bodies)
template <typename Json>
inline void send_json(httplib::Response &res, StatusCode code, const Json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(-1, ' ', false, Json::error_handler_t::replace), "application/json");
}

// Helper: Send a failed operation. Internal detail is logged, never returned.
inline void send_failure(const httplib::Request &req, httplib::Response &res, const service::OperationResult &result) {
    const StatusCode code = result_code_to_status(result.code);
    if (code == StatusCode::INTERNAL) {
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " failed: " << result.error_message);
        send_json(res, code, make_error_response(kInternalErrorMessage));
        return;
    }
    send_json(res, code, make_error_response(result.error_message));
}

}  // namespace http
}  // namespace todod
