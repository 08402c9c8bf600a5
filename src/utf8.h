// utf8.h
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mdtodo {

// Byte 10xxxxxx: never the first byte of a code point.
inline bool isUtf8Continuation(char c) {
    return ((unsigned char)c & 0xC0) == 0x80;
}

// Start of the code point before byte offset pos.
inline size_t prevCodepoint(const std::string& s, size_t pos) {
    if (pos == 0) return 0;
    pos--;
    while (pos > 0 && isUtf8Continuation(s[pos])) pos--;
    return pos;
}

// Start of the code point after the one at byte offset pos.
inline size_t nextCodepoint(const std::string& s, size_t pos) {
    if (pos >= s.size()) return s.size();
    pos++;
    while (pos < s.size() && isUtf8Continuation(s[pos])) pos++;
    return pos;
}

// Code points in s[0, end).
inline size_t codepointCount(const std::string& s, size_t end = std::string::npos) {
    if (end > s.size()) end = s.size();
    size_t count = 0;
    for (size_t i = 0; i < end; i++) {
        if (!isUtf8Continuation(s[i])) count++;
    }
    return count;
}

// Byte offset of the code point with the given index, or s.size().
inline size_t byteOffsetOf(const std::string& s, size_t codepoint) {
    size_t pos = 0;
    while (codepoint > 0 && pos < s.size()) {
        pos = nextCodepoint(s, pos);
        codepoint--;
    }
    return pos;
}

// Code points [first, first + count) of s.
inline std::string utf8Substr(const std::string& s, size_t first, size_t count = std::string::npos) {
    size_t begin = byteOffsetOf(s, first);
    size_t end = (count == std::string::npos) ? s.size() : begin + byteOffsetOf(s.substr(begin), count);
    return s.substr(begin, end - begin);
}

// Space or tab.
inline bool isBlank(char c) {
    return c == ' ' || c == '\t';
}

// --------------------------------------------------------------------
// Split text into lines of at most width characters, breaking at the
// last blank when one fits. Widths count UTF-8 code points, so a
// multibyte character is never split. Always yields at least one line.
// --------------------------------------------------------------------
inline std::vector<std::string> wrapLines(const std::string& text, int width) {
    std::vector<std::string> lines;
    if (text.empty() || width <= 0) {
        lines.push_back(text);
        return lines;
    }
    size_t len = text.size();
    size_t pos = 0;
    while (pos < len) {
        size_t end = pos + byteOffsetOf(text.substr(pos), (size_t)width);
        if (end < len && !isBlank(text[end])) {
            size_t tmp = end;
            while (tmp > pos && !isBlank(text[tmp])) { tmp--; }
            if (tmp != pos) { end = tmp; }
        }
        lines.push_back(text.substr(pos, end - pos));
        pos = end;
        while (pos < len && isBlank(text[pos])) { pos++; }
    }
    if (lines.empty()) lines.push_back(std::string());
    return lines;
}

} // namespace mdtodo
