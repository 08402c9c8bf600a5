// todo_store.cpp
#include "todo_store.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "markdown_codec.h"

namespace fs = std::filesystem;

namespace mdtodo {

std::string normalizeCategory(const std::string& category) {
    std::string result = trim(category);
    if (result.empty()) {
        return kDefaultCategory;
    }
    for (char& c : result) {
        unsigned char uc = (unsigned char)c;
        if (c == '/' || c == '\\' || std::isspace(uc) || std::iscntrl(uc)) {
            c = '_';
        }
    }
    return result;
}

TodoStore::TodoStore(const std::string& rootDir)
    : todoDir_((fs::path(rootDir) / "todo").string()) {
    categories_.insert(kDefaultCategory);
}

void TodoStore::ensureTodoDir() const {
    std::error_code ec;
    fs::create_directories(todoDir_, ec);
    if (ec || !fs::is_directory(todoDir_)) {
        throw StoreError("Can't create todo directory " + todoDir_ +
                         (ec ? ": " + ec.message() : std::string()));
    }
}

// --------------------------------------------------------------------
// Read every *.md file of the todo directory, in file name order.
// --------------------------------------------------------------------
std::vector<FileError> TodoStore::load() {
    ensureTodoDir();

    items_.clear();
    origin_.clear();
    knownFiles_.clear();
    skippedFiles_.clear();
    categories_.clear();
    categories_.insert(kDefaultCategory);

    std::vector<FileError> errors;
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(todoDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->path().extension() == ".md" && it->is_regular_file(entryEc)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        errors.push_back({todoDir_, ec.message()});
        spdlog::warn("Listing {} failed: {}", todoDir_, ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const fs::path& path : files) {
        const std::string fileName = path.filename().string();
        std::ifstream in(path, std::ios::binary);
        std::ostringstream content;
        if (in) {
            content << in.rdbuf();
        }
        if (!in.is_open() || in.bad()) {
            errors.push_back({fileName, "unreadable"});
            skippedFiles_.insert(fileName);
            spdlog::warn("Can't read {}", path.string());
            continue;
        }
        const std::string text = content.str();
        if (!isValidUtf8(text)) {
            errors.push_back({fileName, "not valid UTF-8"});
            skippedFiles_.insert(fileName);
            spdlog::warn("Skipping {}: not valid UTF-8", path.string());
            continue;
        }

        std::vector<TodoItem> parsed = parseMarkdown(text, normalizeCategory(path.stem().string()));
        if (!parsed.empty()) {
            knownFiles_.insert(fileName);
        }
        for (TodoItem& item : parsed) {
            item.id = nextId();
            categories_.insert(item.category);
            origin_[item.id] = fileName;
            items_.push_back(item);
        }
    }

    dirty_ = false;
    spdlog::info("Loaded {} todos from {} files in {}", items_.size(), knownFiles_.size(), todoDir_);
    return errors;
}

// --------------------------------------------------------------------
// Group items by "<category>.md" and overwrite each file. Files that
// held items before but lost all of them are rewritten empty. Files
// skipped by load() are never overwritten.
// --------------------------------------------------------------------
std::vector<FileError> TodoStore::save() {
    std::vector<FileError> errors;
    try {
        ensureTodoDir();
    } catch (const StoreError& ex) {
        errors.push_back({todoDir_, ex.what()});
        spdlog::warn("{}", ex.what());
        return errors;
    }

    std::map<std::string, std::vector<TodoItem>> byFile;
    for (const std::string& fileName : knownFiles_) {
        byFile[fileName];
    }
    for (const TodoItem& item : items_) {
        byFile[item.category + ".md"].push_back(item);
    }

    for (const auto& entry : byFile) {
        const std::string& fileName = entry.first;
        const std::vector<TodoItem>& fileItems = entry.second;
        const std::string category = fs::path(fileName).stem().string();
        const fs::path path = fs::path(todoDir_) / fileName;

        if (skippedFiles_.count(fileName)) {
            errors.push_back({fileName, "skipped on load, not overwritten"});
            spdlog::warn("Not writing {}: it was skipped on load", path.string());
            continue;
        }

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (out) {
            out << serializeMarkdown(fileItems, category);
            out.close();
        }
        if (!out) {
            errors.push_back({fileName, "unwritable"});
            spdlog::warn("Can't write {}", path.string());
            continue;
        }
        knownFiles_.insert(fileName);
        for (const TodoItem& item : fileItems) {
            origin_[item.id] = fileName;
        }
    }

    if (errors.empty()) {
        dirty_ = false;
    }
    spdlog::info("Saved {} todos to {} ({} errors)", items_.size(), todoDir_, errors.size());
    return errors;
}

ItemId TodoStore::addTodo(const std::string& text, const std::string& category) {
    TodoItem item;
    item.id = nextId();
    item.text = trim(text);
    item.category = normalizeCategory(category);
    categories_.insert(item.category);
    items_.push_back(item);
    dirty_ = true;
    return item.id;
}

void TodoStore::deleteTodo(ItemId id) {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [id](const TodoItem& item) { return item.id == id; });
    if (it == items_.end()) {
        return;
    }
    items_.erase(it);
    origin_.erase(id);
    dirty_ = true;
}

bool TodoStore::updateTodo(ItemId id, const std::string& text, const std::string& category) {
    for (TodoItem& item : items_) {
        if (item.id == id) {
            item.text = trim(text);
            item.category = normalizeCategory(category);
            categories_.insert(item.category);
            dirty_ = true;
            return true;
        }
    }
    return false;
}

bool TodoStore::toggle(ItemId id) {
    for (TodoItem& item : items_) {
        if (item.id == id) {
            item.done = !item.done;
            dirty_ = true;
            return true;
        }
    }
    return false;
}

const TodoItem* TodoStore::find(ItemId id) const {
    for (const TodoItem& item : items_) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

std::vector<TodoItem> TodoStore::todosInCategory(const std::string& category) const {
    std::vector<TodoItem> result;
    for (const TodoItem& item : items_) {
        if (item.category == category) result.push_back(item);
    }
    return result;
}

std::vector<std::string> TodoStore::sortedCategories() const {
    return std::vector<std::string>(categories_.begin(), categories_.end());
}

std::string TodoStore::originOf(ItemId id) const {
    auto it = origin_.find(id);
    return (it == origin_.end()) ? std::string() : it->second;
}

} // namespace mdtodo
