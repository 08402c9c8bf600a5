// markdown_codec.cpp
#include "markdown_codec.h"

#include <cctype>
#include <regex>
#include <sstream>

namespace mdtodo {

namespace {

// "- [x] text #tag", anchored at column 0, the tag is optional.
const std::regex& todoLinePattern() {
    static const std::regex pattern(R"(^- \[([ xX])\] (.+?)(?:\s+#(\w+))?\s*$)");
    return pattern;
}

// Text ending in " #word" would read back as a tag. One backslash is added
// before the '#' on write and one removed on read, so text that already ends
// in " \#word" keeps its backslashes too.
const std::regex& trailingTagPattern() {
    static const std::regex pattern(R"((\s\\*)#(\w+)$)");
    return pattern;
}

const std::regex& escapedTagPattern() {
    static const std::regex pattern(R"((\s\\*)\\#(\w+)$)");
    return pattern;
}

std::string escapeTrailingTag(const std::string& text) {
    return std::regex_replace(text, trailingTagPattern(), "$1\\#$2");
}

std::string unescapeTrailingTag(const std::string& text) {
    return std::regex_replace(text, escapedTagPattern(), "$1#$2");
}

void writeSection(std::ostringstream& out, const char* title,
                  const std::vector<const TodoItem*>& items) {
    out << "## " << title << "\n\n";
    for (const TodoItem* item : items) {
        out << "- [" << (item->done ? 'x' : ' ') << "] " << escapeTrailingTag(item->text) << "\n";
    }
}

} // namespace

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace((unsigned char)s[begin])) { begin++; }
    while (end > begin && std::isspace((unsigned char)s[end - 1])) { end--; }
    return s.substr(begin, end - begin);
}

bool isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t len = bytes.size();
    while (i < len) {
        unsigned char c = (unsigned char)bytes[i];
        int extra = 0;
        if (c < 0x80) { i++; continue; }
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) { extra = 1; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; }
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) { extra = 3; }
        else { return false; }
        if (i + extra >= len) { return false; }
        for (int k = 1; k <= extra; k++) {
            if (((unsigned char)bytes[i + k] & 0xC0) != 0x80) { return false; }
        }
        i += extra + 1;
    }
    return true;
}

std::vector<TodoItem> parseMarkdown(const std::string& content,
                                    const std::string& defaultCategory) {
    std::vector<TodoItem> items;
    std::istringstream in(content);
    std::string line;
    std::smatch match;
    while (std::getline(in, line)) {
        if (!std::regex_match(line, match, todoLinePattern())) {
            continue;
        }
        TodoItem item;
        item.text = unescapeTrailingTag(trim(match[2].str()));
        if (item.text.empty()) {
            continue;
        }
        item.done = (match[1].str() != " ");
        item.category = match[3].matched ? match[3].str() : defaultCategory;
        if (item.category.empty()) {
            item.category = kDefaultCategory;
        }
        items.push_back(item);
    }
    return items;
}

std::string categoryTitle(const std::string& categoryName) {
    std::string title = categoryName;
    for (size_t i = 0; i < title.size(); i++) {
        unsigned char c = (unsigned char)title[i];
        title[i] = (char)(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return title;
}

std::string serializeMarkdown(const std::vector<TodoItem>& items,
                              const std::string& categoryName) {
    std::vector<const TodoItem*> active;
    std::vector<const TodoItem*> completed;
    for (const TodoItem& item : items) {
        if (item.done)
            completed.push_back(&item);
        else
            active.push_back(&item);
    }

    std::ostringstream out;
    out << "# " << categoryTitle(categoryName) << " Tasks\n\n";
    if (!active.empty()) {
        writeSection(out, "Active", active);
        out << "\n";
    }
    if (!completed.empty()) {
        writeSection(out, "Completed", completed);
    }
    return out.str();
}

} // namespace mdtodo
