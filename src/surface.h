// surface.h
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mdtodo {

struct TabView {
    std::string name;
    bool active = false;
};

struct RowView {
    std::string text;
    bool done = false;
    bool selected = false;
};

struct FieldView {
    std::string label;
    std::string value;
    size_t cursor = 0;
    bool focused = false;
};

struct DialogView {
    std::string title;
    std::vector<std::string> lines;
    std::vector<FieldView> fields;
    std::string hint;
};

// --------------------------------------------------------------------
// Everything a surface needs to draw one frame.
// --------------------------------------------------------------------
struct ScreenModel {
    std::string title;
    bool dirty = false;
    std::vector<TabView> tabs;
    std::vector<RowView> rows;
    std::string emptyHint;  // shown when rows is empty
    std::string footer;
    std::optional<DialogView> dialog;
};

// The rendering and input capability the controller drives.
class Surface {
public:
    virtual ~Surface() = default;

    virtual void draw(const ScreenModel& model) = 0;

    // Next key token ("q", "space", "enter", "esc", "up", ...), or nothing
    // if no key arrived within timeout.
    virtual std::optional<std::string> pollKey(std::chrono::milliseconds timeout) = 0;
};

} // namespace mdtodo
