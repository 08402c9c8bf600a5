// markdown_codec.h
#pragma once

#include <string>
#include <vector>

#include "todo_item.h"

namespace mdtodo {

// Parse every "- [ ] text #tag" line of a markdown document. Other lines are
// skipped. Items without a tag get defaultCategory. Returned items have id 0.
std::vector<TodoItem> parseMarkdown(const std::string& content,
                                    const std::string& defaultCategory = kDefaultCategory);

// Render one category file: heading, then Active and Completed sections.
// Tags are never written, the file name carries the category.
std::string serializeMarkdown(const std::vector<TodoItem>& items,
                              const std::string& categoryName);

// "work" -> "Work", "HOME" -> "Home".
std::string categoryTitle(const std::string& categoryName);

// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

// True if the bytes form well-formed UTF-8.
bool isValidUtf8(const std::string& bytes);

} // namespace mdtodo
