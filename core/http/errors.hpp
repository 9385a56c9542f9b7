#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace todod {
namespace http {

/**
 * @brief Response status model
 *
 * - OK -> HTTP 200
 * - CREATED -> HTTP 201
 * - INVALID_ARGUMENT -> HTTP 400 (validation failure or malformed payload)
 * - NOT_FOUND -> HTTP 404 (no matching record or route)
 * - ALREADY_EXISTS -> HTTP 409 (duplicate title)
 * - INTERNAL -> HTTP 500
 */
enum class StatusCode { OK, CREATED, INVALID_ARGUMENT, NOT_FOUND, ALREADY_EXISTS, INTERNAL };

/**
 * @brief Convert StatusCode to HTTP status integer
 */
inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::CREATED:
            return 201;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::ALREADY_EXISTS:
            return 409;
        case StatusCode::INTERNAL:
            return 500;
        default:
            return 500;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::CREATED:
            return "CREATED";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::ALREADY_EXISTS:
            return "ALREADY_EXISTS";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

// Client-facing messages that are not produced by the todo service
constexpr const char *kRouteNotFoundMessage = "Route Not Found";
constexpr const char *kInvalidJsonMessage = "Invalid JSON payload";
constexpr const char *kInternalErrorMessage = "Internal Server Error";
constexpr const char *kBadRequestMessage = "Bad Request";

/**
 * @brief Build a JSON error response body: {"error": message}
 */
inline nlohmann::json make_error_response(const std::string &message) { return {{"error", message}}; }

/**
 * @brief Acknowledgement body for operations without a record to return
 */
inline nlohmann::json make_success_response() { return {{"success", true}}; }

}  // namespace http
}  // namespace todod
