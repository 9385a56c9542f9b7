#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "store/id_generator.hpp"
#include "store/todo.hpp"
#include "store/i_todo_store.hpp"

namespace todod {
namespace service {

// Outcome of a todo operation; the HTTP layer maps these to status codes
enum class ResultCode { OK, CREATED, INVALID_ARGUMENT, NOT_FOUND, ALREADY_EXISTS, INTERNAL };

const char *result_code_to_string(ResultCode code);

/**
 * @brief Identifies a record for get/update/delete
 *
 * A non-empty id takes precedence and the title is then ignored; records
 * are never matched on both. An empty id counts as absent.
 */
struct LookupKey {
    std::optional<std::string> id;
    std::optional<std::string> title;

    bool has_id() const { return id.has_value() && !id->empty(); }
    bool has_title() const { return title.has_value() && !title->empty(); }

    bool matches(const store::Todo &todo) const;
};

// Absent (or non-string) payload fields are nullopt
struct CreateTodoRequest {
    std::optional<std::string> title;
    std::optional<std::string> body;
};

struct UpdateTodoRequest {
    std::optional<std::string> body;
};

struct OperationResult {
    ResultCode code = ResultCode::OK;
    std::string error_message;  // Store failure detail when code is INTERNAL

    bool success() const { return code == ResultCode::OK || code == ResultCode::CREATED; }
};

struct TodoResult : OperationResult {
    store::Todo todo;
};

struct ListResult : OperationResult {
    store::Collection todos;
};

/**
 * @brief The five todo operations over a todo store
 *
 * Each call is an independent load / mutate / save cycle against the
 * document; nothing is cached between calls.
 *
 * With serialize_writes disabled (the default) concurrent mutations race:
 * two creates may both pass the duplicate-title check, and the later of two
 * overlapping saves discards the earlier one's change. With it enabled,
 * create/update/remove hold one mutex for their whole cycle. Reads never
 * lock.
 */
class TodoService {
public:
    TodoService(store::ITodoStore &store, store::IdGenerator &ids, bool serialize_writes = false);

    TodoService(const TodoService &) = delete;
    TodoService &operator=(const TodoService &) = delete;

    ListResult list();
    TodoResult get(const LookupKey &key);
    TodoResult create(const CreateTodoRequest &request);
    TodoResult update(const LookupKey &key, const UpdateTodoRequest &request);
    OperationResult remove(const LookupKey &key);

    bool serialize_writes() const { return serialize_writes_; }

private:
    bool load(store::Collection &todos, OperationResult &result);
    bool save(const store::Collection &todos, OperationResult &result);
    std::unique_lock<std::mutex> acquire_write_lock();

    store::ITodoStore &store_;
    store::IdGenerator &ids_;
    bool serialize_writes_;
    std::mutex write_mutex_;
};

}  // namespace service
}  // namespace todod
