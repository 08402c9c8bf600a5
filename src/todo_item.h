// todo_item.h
#pragma once

#include <cstdint>
#include <string>

namespace mdtodo {

using ItemId = std::uint64_t;

static const char* const kDefaultCategory = "uncategorized";

// --------------------------------------------------------------------
// One task line. Identity is the store-assigned id, never the text.
// --------------------------------------------------------------------
struct TodoItem {
    ItemId id = 0;
    std::string text;
    bool done = false;
    std::string category = kDefaultCategory;
};

} // namespace mdtodo
