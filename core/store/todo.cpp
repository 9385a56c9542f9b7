#include "todo.hpp"

#include <ctime>
#include <sstream>
#include <utility>

namespace todod {
namespace store {

namespace {
constexpr const char *kFieldId = "id";
constexpr const char *kFieldTitle = "title";
constexpr const char *kFieldBody = "body";
constexpr const char *kFieldCreatedAt = "createdAt";

void decode_string_field(const nlohmann::ordered_json &json, const char *name, std::optional<std::string> &out,
                         nlohmann::ordered_json &raw_fields) {
    auto it = json.find(name);
    if (it == json.end()) {
        out.reset();
        return;
    }
    if (!it->is_string()) {
        out.reset();
        raw_fields[name] = *it;
        return;
    }
    out = it->get<std::string>();
}

void encode_field(nlohmann::ordered_json &json, const char *name, const std::optional<std::string> &value,
                  const nlohmann::ordered_json &raw_fields) {
    if (value) {
        json[name] = *value;
        return;
    }
    auto it = raw_fields.find(name);
    if (it != raw_fields.end()) {
        json[name] = *it;
    }
}
}  // namespace

nlohmann::ordered_json encode_todo(const Todo &todo) {
    nlohmann::ordered_json json = nlohmann::ordered_json::object();
    encode_field(json, kFieldId, todo.id, todo.raw_fields);
    encode_field(json, kFieldTitle, todo.title, todo.raw_fields);
    encode_field(json, kFieldBody, todo.body, todo.raw_fields);
    encode_field(json, kFieldCreatedAt, todo.created_at, todo.raw_fields);

    for (const auto &[key, value] : todo.extra.items()) {
        json[key] = value;
    }
    return json;
}

nlohmann::ordered_json encode_todos(const Collection &todos) {
    nlohmann::ordered_json json = nlohmann::ordered_json::array();
    for (const auto &todo : todos) {
        json.push_back(encode_todo(todo));
    }
    return json;
}

bool decode_todo(const nlohmann::ordered_json &json, Todo &todo, std::string &error) {
    if (!json.is_object()) {
        error = std::string("record must be an object, got ") + json.type_name();
        return false;
    }

    Todo decoded;
    decode_string_field(json, kFieldId, decoded.id, decoded.raw_fields);
    decode_string_field(json, kFieldTitle, decoded.title, decoded.raw_fields);
    decode_string_field(json, kFieldBody, decoded.body, decoded.raw_fields);
    decode_string_field(json, kFieldCreatedAt, decoded.created_at, decoded.raw_fields);

    for (const auto &[key, value] : json.items()) {
        if (key == kFieldId || key == kFieldTitle || key == kFieldBody || key == kFieldCreatedAt) {
            continue;
        }
        decoded.extra[key] = value;
    }

    todo = std::move(decoded);
    return true;
}

std::string format_created_at(std::chrono::system_clock::time_point when) {
    auto time = std::chrono::system_clock::to_time_t(when);

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    int hour12 = tm_buf.tm_hour % 12;
    if (hour12 == 0) {
        hour12 = 12;
    }

    std::ostringstream out;
    out << (tm_buf.tm_mon + 1) << "/" << tm_buf.tm_mday << "/" << (tm_buf.tm_year + 1900) << ", " << hour12 << ":";
    out << (tm_buf.tm_min < 10 ? "0" : "") << tm_buf.tm_min << ":";
    out << (tm_buf.tm_sec < 10 ? "0" : "") << tm_buf.tm_sec;
    out << (tm_buf.tm_hour < 12 ? " AM" : " PM");
    return out.str();
}

}  // namespace store
}  // namespace todod
