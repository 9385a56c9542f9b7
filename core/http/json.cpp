#include "json.hpp"

#include <optional>
#include <utility>

namespace todod {
namespace http {

namespace {
std::optional<std::string> string_field(const nlohmann::json &payload, const char *name) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    auto it = payload.find(name);
    if (it == payload.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}
}  // namespace

bool parse_payload(const std::string &body, nlohmann::json &payload) {
    if (body.empty()) {
        payload = nlohmann::json::object();
        return true;
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return false;
    }
    payload = std::move(parsed);
    return true;
}

service::CreateTodoRequest decode_create_request(const nlohmann::json &payload) {
    service::CreateTodoRequest request;
    request.title = string_field(payload, "title");
    request.body = string_field(payload, "body");
    return request;
}

service::UpdateTodoRequest decode_update_request(const nlohmann::json &payload) {
    service::UpdateTodoRequest request;
    request.body = string_field(payload, "body");
    return request;
}

StatusCode result_code_to_status(service::ResultCode code) {
    switch (code) {
        case service::ResultCode::OK:
            return StatusCode::OK;
        case service::ResultCode::CREATED:
            return StatusCode::CREATED;
        case service::ResultCode::INVALID_ARGUMENT:
            return StatusCode::INVALID_ARGUMENT;
        case service::ResultCode::NOT_FOUND:
            return StatusCode::NOT_FOUND;
        case service::ResultCode::ALREADY_EXISTS:
            return StatusCode::ALREADY_EXISTS;
        case service::ResultCode::INTERNAL:
            return StatusCode::INTERNAL;
        default:
            return StatusCode::INTERNAL;
    }
}

}  // namespace http
}  // namespace todod
