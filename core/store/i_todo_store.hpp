#pragma once

#include <string>

#include "todo.hpp"

namespace todod {
namespace store {

/**
 * @brief Failure detail from a todo store
 *
 * DATA_CORRUPTION: the document exists but does not hold a JSON array of
 * records. IO: the document could not be read or written.
 */
struct StoreError {
    enum class Kind { IO, DATA_CORRUPTION };

    Kind kind = Kind::IO;
    std::string message;
};

const char *store_error_kind_to_string(StoreError::Kind kind);

// Interface for TodoStore to enable mocking
class ITodoStore {
public:
    virtual ~ITodoStore() = default;

    virtual bool load(Collection &todos, StoreError &error) const = 0;
    virtual bool save(const Collection &todos, StoreError &error) const = 0;
};

}  // namespace store
}  // namespace todod
