#include "todo_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace todod {
namespace store {

namespace fs = std::filesystem;

namespace {
bool is_blank(const std::string &content) {
    return std::all_of(content.begin(), content.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}
}  // namespace

const char *store_error_kind_to_string(StoreError::Kind kind) {
    switch (kind) {
        case StoreError::Kind::IO:
            return "IO";
        case StoreError::Kind::DATA_CORRUPTION:
            return "DATA_CORRUPTION";
        default:
            return "UNKNOWN";
    }
}

TodoStore::TodoStore(std::string path, int indent) : path_(std::move(path)), indent_(indent) {}

bool TodoStore::load(Collection &todos, StoreError &error) const {
    std::error_code ec;
    const bool exists = fs::exists(path_, ec);
    if (ec) {
        error = {StoreError::Kind::IO, "Cannot stat " + path_ + ": " + ec.message()};
        return false;
    }
    if (!exists) {
        LOG_DEBUG("[Store] " << path_ << " does not exist yet, using empty collection");
        todos.clear();
        return true;
    }

    if (!fs::is_regular_file(path_, ec)) {
        error = {StoreError::Kind::IO, path_ + " is not a regular file"};
        return false;
    }

    std::string content;
    try {
        std::ifstream file(path_, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            error = {StoreError::Kind::IO, "Cannot open " + path_ + " for reading"};
            return false;
        }

        // libstdc++ filebuf reports some read errors by throwing, not via badbit
        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad()) {
            error = {StoreError::Kind::IO, "Read failed for " + path_};
            return false;
        }
    } catch (const std::ios_base::failure &e) {
        error = {StoreError::Kind::IO, "Read failed for " + path_ + ": " + e.what()};
        return false;
    }

    if (is_blank(content)) {
        todos.clear();
        return true;
    }

    auto document = nlohmann::ordered_json::parse(content, nullptr, false);
    if (document.is_discarded()) {
        error = {StoreError::Kind::DATA_CORRUPTION, path_ + " is not valid JSON"};
        return false;
    }
    if (!document.is_array()) {
        error = {StoreError::Kind::DATA_CORRUPTION,
                 path_ + " must hold a JSON array, got " + std::string(document.type_name())};
        return false;
    }

    Collection loaded;
    loaded.reserve(document.size());
    for (size_t i = 0; i < document.size(); ++i) {
        Todo todo;
        std::string record_error;
        if (!decode_todo(document[i], todo, record_error)) {
            error = {StoreError::Kind::DATA_CORRUPTION, path_ + ": record " + std::to_string(i) + ": " + record_error};
            return false;
        }
        loaded.push_back(std::move(todo));
    }

    todos = std::move(loaded);
    return true;
}

bool TodoStore::save(const Collection &todos, StoreError &error) const {
    const fs::path target(path_);

    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = {StoreError::Kind::IO,
                     "Cannot create directory " + target.parent_path().string() + ": " + ec.message()};
            return false;
        }
    }

    // Invalid UTF-8 in a stored string is replaced rather than aborting the write
    const std::string content =
        encode_todos(todos).dump(indent_, ' ', false, nlohmann::ordered_json::error_handler_t::replace);

    try {
        std::ofstream file(path_, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error = {StoreError::Kind::IO, "Cannot open " + path_ + " for writing"};
            return false;
        }

        file << content;
        file.flush();
        if (!file) {
            error = {StoreError::Kind::IO, "Write failed for " + path_};
            return false;
        }
    } catch (const std::ios_base::failure &e) {
        error = {StoreError::Kind::IO, "Write failed for " + path_ + ": " + e.what()};
        return false;
    }

    LOG_DEBUG("[Store] Saved " << todos.size() << " record(s) to " << path_);
    return true;
}

}  // namespace store
}  // namespace todod
