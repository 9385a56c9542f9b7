#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "service/todo_service.hpp"

namespace todod {
namespace http {

/**
 * @brief JSON request decoding for the todo endpoints
 *
 * Payload fields are read leniently: a field that is missing, or present
 * with a non-string value, decodes to nullopt and is left to the service's
 * validation to reject. A payload that is valid JSON but not an object has
 * no fields.
 */

// Parse a request body. An empty body is an empty object.
// Returns false only when the body is not valid JSON.
bool parse_payload(const std::string &body, nlohmann::json &payload);

service::CreateTodoRequest decode_create_request(const nlohmann::json &payload);
service::UpdateTodoRequest decode_update_request(const nlohmann::json &payload);

// Maps service outcomes onto the HTTP status model
StatusCode result_code_to_status(service::ResultCode code);

}  // namespace http
}  // namespace todod
