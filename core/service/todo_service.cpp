#include "todo_service.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

#include "logging/logger.hpp"

namespace todod {
namespace service {

namespace {
constexpr const char *kTodoNotFound = "Todo not found";
constexpr const char *kCreateFieldsRequired = "title and body are required";
constexpr const char *kUpdateBodyRequired = "body is required in payload";
constexpr const char *kLookupKeyRequired = "id or title query param required";
constexpr const char *kDuplicateTitle = "Todo with this title already exists";
}  // namespace

const char *result_code_to_string(ResultCode code) {
    switch (code) {
        case ResultCode::OK:
            return "OK";
        case ResultCode::CREATED:
            return "CREATED";
        case ResultCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ResultCode::NOT_FOUND:
            return "NOT_FOUND";
        case ResultCode::ALREADY_EXISTS:
            return "ALREADY_EXISTS";
        case ResultCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

bool LookupKey::matches(const store::Todo &todo) const {
    if (has_id()) {
        return todo.id == id;
    }
    // No key at all matches nothing
    return title.has_value() && todo.title == title;
}

TodoService::TodoService(store::ITodoStore &store, store::IdGenerator &ids, bool serialize_writes)
    : store_(store), ids_(ids), serialize_writes_(serialize_writes) {}

ListResult TodoService::list() {
    ListResult result;
    load(result.todos, result);
    return result;
}

TodoResult TodoService::get(const LookupKey &key) {
    TodoResult result;

    store::Collection todos;
    if (!load(todos, result)) {
        return result;
    }

    auto it = std::find_if(todos.begin(), todos.end(), [&key](const store::Todo &todo) { return key.matches(todo); });
    if (it == todos.end()) {
        result.code = ResultCode::NOT_FOUND;
        result.error_message = kTodoNotFound;
        return result;
    }

    result.todo = std::move(*it);
    return result;
}

TodoResult TodoService::create(const CreateTodoRequest &request) {
    TodoResult result;

    if (!request.title.has_value() || request.title->empty() || !request.body.has_value()) {
        result.code = ResultCode::INVALID_ARGUMENT;
        result.error_message = kCreateFieldsRequired;
        return result;
    }

    auto lock = acquire_write_lock();

    store::Collection todos;
    if (!load(todos, result)) {
        return result;
    }

    const bool duplicate = std::any_of(todos.begin(), todos.end(),
                                       [&request](const store::Todo &todo) { return todo.title == request.title; });
    if (duplicate) {
        result.code = ResultCode::ALREADY_EXISTS;
        result.error_message = kDuplicateTitle;
        LOG_DEBUG("[Todos] Rejected duplicate title '" << *request.title << "'");
        return result;
    }

    store::Todo todo;
    todo.id = ids_.new_id();
    todo.title = request.title;
    todo.body = request.body;
    todo.created_at = store::format_created_at(std::chrono::system_clock::now());

    todos.push_back(todo);
    if (!save(todos, result)) {
        return result;
    }

    LOG_INFO("[Todos] Created " << *todo.id << " '" << *todo.title << "'");
    result.code = ResultCode::CREATED;
    result.todo = std::move(todo);
    return result;
}

TodoResult TodoService::update(const LookupKey &key, const UpdateTodoRequest &request) {
    TodoResult result;

    if (!request.body.has_value()) {
        result.code = ResultCode::INVALID_ARGUMENT;
        result.error_message = kUpdateBodyRequired;
        return result;
    }

    auto lock = acquire_write_lock();

    store::Collection todos;
    if (!load(todos, result)) {
        return result;
    }

    auto it = std::find_if(todos.begin(), todos.end(), [&key](const store::Todo &todo) { return key.matches(todo); });
    if (it == todos.end()) {
        result.code = ResultCode::NOT_FOUND;
        result.error_message = kTodoNotFound;
        return result;
    }

    it->body = request.body;
    it->raw_fields.erase("body");
    if (!save(todos, result)) {
        return result;
    }

    LOG_INFO("[Todos] Updated body of " << it->id.value_or("<no id>"));
    result.todo = *it;
    return result;
}

OperationResult TodoService::remove(const LookupKey &key) {
    OperationResult result;

    if (!key.has_id() && !key.has_title()) {
        result.code = ResultCode::INVALID_ARGUMENT;
        result.error_message = kLookupKeyRequired;
        return result;
    }

    auto lock = acquire_write_lock();

    store::Collection todos;
    if (!load(todos, result)) {
        return result;
    }

    // Every match goes, not just the first
    store::Collection kept;
    kept.reserve(todos.size());
    std::copy_if(todos.begin(), todos.end(), std::back_inserter(kept),
                 [&key](const store::Todo &todo) { return !key.matches(todo); });

    if (kept.size() == todos.size()) {
        result.code = ResultCode::NOT_FOUND;
        result.error_message = kTodoNotFound;
        return result;
    }

    if (!save(kept, result)) {
        return result;
    }

    LOG_INFO("[Todos] Deleted " << (todos.size() - kept.size()) << " record(s) by "
                                << (key.has_id() ? "id '" + *key.id : "title '" + *key.title) << "'");
    return result;
}

bool TodoService::load(store::Collection &todos, OperationResult &result) {
    store::StoreError error;
    if (!store_.load(todos, error)) {
        result.code = ResultCode::INTERNAL;
        result.error_message =
            std::string("Store load failed (") + store::store_error_kind_to_string(error.kind) + "): " + error.message;
        return false;
    }
    return true;
}

bool TodoService::save(const store::Collection &todos, OperationResult &result) {
    store::StoreError error;
    if (!store_.save(todos, error)) {
        result.code = ResultCode::INTERNAL;
        result.error_message =
            std::string("Store save failed (") + store::store_error_kind_to_string(error.kind) + "): " + error.message;
        return false;
    }
    return true;
}

std::unique_lock<std::mutex> TodoService::acquire_write_lock() {
    if (!serialize_writes_) {
        return std::unique_lock<std::mutex>(write_mutex_, std::defer_lock);
    }
    return std::unique_lock<std::mutex>(write_mutex_);
}

}  // namespace service
}  // namespace todod
