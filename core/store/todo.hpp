#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace todod {
namespace store {

/**
 * @brief A single todo record as persisted and served
 *
 * The four known fields are optional so that a document written by another
 * tool round-trips without coercion: a field that was absent on disk stays
 * absent when the collection is saved again. Records created by this service
 * always carry all four.
 *
 * A known field holding something other than a string (e.g. a null body)
 * is kept verbatim in `raw_fields` and its typed member stays empty, so
 * such a record never matches a lookup but is saved back unchanged.
 *
 * Fields nobody here owns are kept in `extra`, in document order.
 */
struct Todo {
    std::optional<std::string> id;
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<std::string> created_at;  // "createdAt" on the wire

    nlohmann::ordered_json raw_fields = nlohmann::ordered_json::object();
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
};

// Whole collection, insertion order
using Collection = std::vector<Todo>;

// Encoding keeps key order: id, title, body, createdAt, then extra fields
nlohmann::ordered_json encode_todo(const Todo &todo);
nlohmann::ordered_json encode_todos(const Collection &todos);

// Rejects records that are not objects; field values are never coerced
bool decode_todo(const nlohmann::ordered_json &json, Todo &todo, std::string &error);

/**
 * @brief Human-readable creation timestamp in local time
 *
 * en-US style without zero padding, e.g. "10/19/2026, 4:03:12 PM".
 * Meant for display only; not sortable and not intended to be parsed.
 */
std::string format_created_at(std::chrono::system_clock::time_point when);

}  // namespace store
}  // namespace todod
