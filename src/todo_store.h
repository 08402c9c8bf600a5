// todo_store.h
#pragma once

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "todo_item.h"

namespace mdtodo {

// Raised when the todo directory cannot be created. Fatal at startup.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// A per-file read or write failure. Never aborts a multi-file load/save.
struct FileError {
    std::string file;
    std::string message;
};

// Trim, default blank to "uncategorized", replace characters that cannot
// appear in "<category>.md" with '_'.
std::string normalizeCategory(const std::string& category);

// --------------------------------------------------------------------
// TodoStore: all items of <root>/todo/*.md held in memory.
//
// Files are routed by category: on save every item goes to
// "<category>.md", so changing a category moves the item to that file.
// Files are not locked; external edits made while the store is open are
// overwritten by the next save.
// --------------------------------------------------------------------
class TodoStore {
public:
    explicit TodoStore(const std::string& rootDir);

    // Full reload from disk, discarding in-memory state.
    // Throws StoreError if the todo directory cannot be created.
    std::vector<FileError> load();

    // Write every category file in full. Files that load() skipped as
    // unreadable or not UTF-8 are reported, never overwritten.
    std::vector<FileError> save();

    ItemId addTodo(const std::string& text, const std::string& category);
    void deleteTodo(ItemId id);
    bool updateTodo(ItemId id, const std::string& text, const std::string& category);
    bool toggle(ItemId id);

    const TodoItem* find(ItemId id) const;
    std::vector<TodoItem> todosInCategory(const std::string& category) const;
    std::vector<std::string> sortedCategories() const;

    // Source file basename, empty for items added since the last load/save.
    std::string originOf(ItemId id) const;

    const std::vector<TodoItem>& items() const { return items_; }
    const std::string& todoDir() const { return todoDir_; }
    bool dirty() const { return dirty_; }

private:
    void ensureTodoDir() const;
    ItemId nextId() { return ++lastId_; }

    std::string todoDir_;
    std::vector<TodoItem> items_;
    std::set<std::string> categories_;
    std::map<ItemId, std::string> origin_;
    std::set<std::string> knownFiles_;
    std::set<std::string> skippedFiles_;
    ItemId lastId_ = 0;
    bool dirty_ = false;
};

} // namespace mdtodo
