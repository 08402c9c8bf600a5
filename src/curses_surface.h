// curses_surface.h
#pragma once

#include <ncurses.h>

#include "surface.h"

namespace mdtodo {

// --------------------------------------------------------------------
// ncurses implementation of Surface. Owns the terminal between
// construction and destruction.
// --------------------------------------------------------------------
class CursesSurface : public Surface {
public:
    // Throws std::runtime_error if the terminal has no color support.
    CursesSurface();
    ~CursesSurface() override;

    CursesSurface(const CursesSurface&) = delete;
    CursesSurface& operator=(const CursesSurface&) = delete;

    void draw(const ScreenModel& model) override;
    std::optional<std::string> pollKey(std::chrono::milliseconds timeout) override;

private:
    void createListWindow();
    void drawHeader(const ScreenModel& model);
    void drawTabs(const ScreenModel& model);
    void drawList(const ScreenModel& model);
    void drawFooter(const ScreenModel& model);
    void drawDialog(const DialogView& dialog);
    std::optional<std::string> readUtf8Char(int lead);

    WINDOW* listWin_ = nullptr;
    int scrollOffset_ = 0;
};

} // namespace mdtodo
