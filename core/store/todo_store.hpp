#pragma once

#include <string>

#include "i_todo_store.hpp"
#include "todo.hpp"

namespace todod {
namespace store {

/**
 * @brief File-backed todo collection
 *
 * The whole collection lives in one JSON document. There is no cache: every
 * load() reads the file and every save() rewrites it in full with a plain
 * truncate-and-write, so a reader racing a writer can see a partial file.
 *
 * The store itself takes no locks. Callers that need read-modify-write
 * atomicity must serialize around load()/save() themselves.
 */
class TodoStore : public ITodoStore {
public:
    explicit TodoStore(std::string path, int indent = 2);

    /**
     * @brief Read the full collection
     *
     * A missing document, or one with no content besides whitespace, is an
     * empty collection. Records are returned as stored.
     *
     * @param todos Replaced with the loaded collection on success
     * @param error Populated on failure
     * @return true on success
     */
    bool load(Collection &todos, StoreError &error) const override;

    /**
     * @brief Overwrite the document with the full collection
     *
     * Creates missing parent directories first.
     */
    bool save(const Collection &todos, StoreError &error) const override;

    const std::string &path() const { return path_; }

private:
    std::string path_;
    int indent_;
};

}  // namespace store
}  // namespace todod
