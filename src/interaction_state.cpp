// interaction_state.cpp
#include "interaction_state.h"

#include <algorithm>

#include "utf8.h"

namespace mdtodo {

void LineEdit::assign(const std::string& text) {
    value = text;
    cursor = value.size();
}

void LineEdit::insert(const std::string& text) {
    if (cursor > value.size()) cursor = value.size();
    value.insert(cursor, text);
    cursor += text.size();
}

void LineEdit::backspace() {
    if (cursor > 0 && !value.empty()) {
        size_t start = prevCodepoint(value, cursor);
        value.erase(start, cursor - start);
        cursor = start;
    }
}

void LineEdit::left() {
    cursor = prevCodepoint(value, cursor);
}

void LineEdit::right() {
    cursor = nextCodepoint(value, cursor);
}

void LineEdit::home() {
    cursor = 0;
}

void LineEdit::end() {
    cursor = value.size();
}

void InteractionState::clamp(int categoryCount, int itemCount) {
    activeCategoryIndex = std::max(0, std::min(activeCategoryIndex, categoryCount - 1));
    selectedIndex = std::max(0, std::min(selectedIndex, itemCount - 1));
}

void InteractionState::setStatus(const std::string& text, Clock::time_point now) {
    status = StatusMessage{text, now + kStatusDuration};
}

void InteractionState::expireStatus(Clock::time_point now) {
    if (status && now >= status->expiresAt) {
        status.reset();
    }
}

} // namespace mdtodo
