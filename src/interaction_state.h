// interaction_state.h
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "todo_item.h"

namespace mdtodo {

using Clock = std::chrono::steady_clock;

// How long an action's status message stays in the footer.
constexpr std::chrono::seconds kStatusDuration(3);

enum class ModalKind { None, Add, Edit, Delete, Help };

// --------------------------------------------------------------------
// Single-line text field. cursor is a byte offset into value and always
// sits on a UTF-8 code point boundary.
// --------------------------------------------------------------------
struct LineEdit {
    std::string value;
    size_t cursor = 0;

    void assign(const std::string& text);
    void insert(const std::string& text);
    void backspace();
    void left();
    void right();
    void home();
    void end();
};

// The open dialog. target is the item an Edit or Delete dialog acts on.
struct Modal {
    ModalKind kind = ModalKind::None;
    ItemId target = 0;
    LineEdit text;
    LineEdit category;
    int focus = 0;  // 0 = text field, 1 = category field
};

struct StatusMessage {
    std::string text;
    Clock::time_point expiresAt;
};

// --------------------------------------------------------------------
// Navigation state of the UI. Never persisted.
// --------------------------------------------------------------------
struct InteractionState {
    int activeCategoryIndex = 0;
    int selectedIndex = 0;
    Modal modal;
    std::optional<StatusMessage> status;

    bool browsing() const { return modal.kind == ModalKind::None; }

    // Pull both indices back into range after the lists changed shape.
    void clamp(int categoryCount, int itemCount);

    // Replaces any pending message and its expiry.
    void setStatus(const std::string& text, Clock::time_point now);

    // Drop the message once its expiry has passed.
    void expireStatus(Clock::time_point now);
};

} // namespace mdtodo
