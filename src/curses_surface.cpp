// curses_surface.cpp
#include "curses_surface.h"

#include <algorithm>
#include <clocale>
#include <stdexcept>
#include <vector>

#include "utf8.h"

namespace mdtodo {

namespace {

enum ColorPair {
    CP_HEADER = 1,
    CP_FOOTER,
    CP_SELECTED,
    CP_TODO,
    CP_DONE,
    CP_CATEGORY,
    CP_ACTIVE_CATEGORY,
    CP_HELP,
};

const int kListTop = 2;

int textWidth(const std::string& text) {
    return (int)codepointCount(text);
}

// ncurses key code -> keymap token.
std::optional<std::string> keyToken(int ch) {
    switch (ch) {
        case ' ':           return std::string("space");
        case '\n':
        case '\r':
        case KEY_ENTER:     return std::string("enter");
        case 27:            return std::string("esc");
        case '\t':          return std::string("tab");
        case KEY_BACKSPACE:
        case 127:
        case '\b':          return std::string("backspace");
        case KEY_UP:        return std::string("up");
        case KEY_DOWN:      return std::string("down");
        case KEY_LEFT:      return std::string("left");
        case KEY_RIGHT:     return std::string("right");
        case KEY_HOME:      return std::string("home");
        case KEY_END:       return std::string("end");
        default:
            break;
    }
    if (ch > 32 && ch < 127) {
        return std::string(1, static_cast<char>(ch));
    }
    return std::nullopt;
}

} // namespace

CursesSurface::CursesSurface() {
    // UTF-8 output from ncursesw needs the user's locale.
    setlocale(LC_ALL, "");
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, true);
    set_escdelay(25);
    curs_set(0);
    if (!has_colors()) {
        endwin();
        throw std::runtime_error("Your terminal does not support color.");
    }
    start_color();
    init_pair(CP_HEADER, COLOR_WHITE, COLOR_BLUE);
    init_pair(CP_FOOTER, COLOR_WHITE, COLOR_RED);
    init_pair(CP_SELECTED, COLOR_BLACK, COLOR_WHITE);
    init_pair(CP_TODO, COLOR_WHITE, COLOR_BLACK);
    init_pair(CP_DONE, COLOR_BLUE, COLOR_BLACK);
    init_pair(CP_CATEGORY, COLOR_YELLOW, COLOR_BLACK);
    init_pair(CP_ACTIVE_CATEGORY, COLOR_YELLOW, COLOR_BLUE);
    init_pair(CP_HELP, COLOR_GREEN, COLOR_BLACK);

    bkgd(COLOR_PAIR(CP_TODO));
    refresh();
    createListWindow();
}

CursesSurface::~CursesSurface() {
    if (listWin_) delwin(listWin_);
    endwin();
}

void CursesSurface::createListWindow() {
    if (listWin_) delwin(listWin_);
    int height = std::max(3, LINES - kListTop - 1);
    listWin_ = newwin(height, COLS, kListTop, 0);
    wbkgd(listWin_, COLOR_PAIR(CP_TODO));
}

// --------------------------------------------------------------------
// Full redraw: title, tabs, list, footer, then the dialog on top.
// --------------------------------------------------------------------
void CursesSurface::draw(const ScreenModel& model) {
    erase();
    drawHeader(model);
    drawTabs(model);
    drawFooter(model);
    wnoutrefresh(stdscr);
    drawList(model);
    if (model.dialog) {
        drawDialog(*model.dialog);
    } else {
        curs_set(0);
    }
    doupdate();
}

void CursesSurface::drawHeader(const ScreenModel& model) {
    std::string title = " " + model.title + (model.dirty ? " [+] " : " ");
    attron(COLOR_PAIR(CP_HEADER) | A_BOLD);
    mvhline(0, 0, ' ', COLS);
    mvprintw(0, std::max(0, (COLS - textWidth(title)) / 2), "%s", utf8Substr(title, 0, COLS).c_str());
    attroff(COLOR_PAIR(CP_HEADER) | A_BOLD);
}

void CursesSurface::drawTabs(const ScreenModel& model) {
    int x = 0;
    for (const TabView& tab : model.tabs) {
        std::string label = " " + tab.name + " ";
        if (x + textWidth(label) > COLS) break;
        int attrs = tab.active ? (COLOR_PAIR(CP_ACTIVE_CATEGORY) | A_BOLD) : COLOR_PAIR(CP_CATEGORY);
        attron(attrs);
        mvprintw(1, x, "%s", label.c_str());
        attroff(attrs);
        x += textWidth(label);
    }
}

void CursesSurface::drawList(const ScreenModel& model) {
    werase(listWin_);
    box(listWin_, 0, 0);
    int maxY = getmaxy(listWin_) - 1;
    int textX = 6;
    int wrapWidth = getmaxx(listWin_) - textX - 2;

    if (model.rows.empty()) {
        scrollOffset_ = 0;
        mvwprintw(listWin_, 1, 2, "%s", utf8Substr(model.emptyHint, 0, std::max(0, wrapWidth + textX - 2)).c_str());
        wnoutrefresh(listWin_);
        return;
    }

    // Keep the selected row inside the visible area.
    int selected = 0;
    for (size_t i = 0; i < model.rows.size(); i++) {
        if (model.rows[i].selected) selected = (int)i;
    }
    scrollOffset_ = std::min(scrollOffset_, selected);
    int visibleLines = maxY - 1;
    while (scrollOffset_ < selected) {
        int used = 0;
        for (int i = scrollOffset_; i <= selected; i++) {
            used += (int)wrapLines(model.rows[i].text, wrapWidth).size();
        }
        if (used <= visibleLines) break;
        scrollOffset_++;
    }

    int y = 1;
    for (int idx = scrollOffset_; idx < (int)model.rows.size() && y < maxY; idx++) {
        const RowView& row = model.rows[idx];
        int attrs = row.selected ? COLOR_PAIR(CP_SELECTED)
                                 : (row.done ? (COLOR_PAIR(CP_DONE) | A_DIM) : COLOR_PAIR(CP_TODO));
        wattron(listWin_, attrs);
        mvwprintw(listWin_, y, 2, "%s", row.done ? "[x]" : "[ ]");
        for (const std::string& line : wrapLines(row.text, wrapWidth)) {
            if (y < maxY) {
                mvwprintw(listWin_, y, textX, "%s", line.c_str());
            }
            y++;
        }
        wattroff(listWin_, attrs);
    }
    wnoutrefresh(listWin_);
}

void CursesSurface::drawFooter(const ScreenModel& model) {
    std::string text = " " + model.footer + " ";
    attron(COLOR_PAIR(CP_FOOTER));
    mvhline(LINES - 1, 0, ' ', COLS);
    mvprintw(LINES - 1, 0, "%s", utf8Substr(text, 0, COLS).c_str());
    attroff(COLOR_PAIR(CP_FOOTER));
}

// --------------------------------------------------------------------
// Centered overlay: body lines, then input fields, then the key hint.
// --------------------------------------------------------------------
void CursesSurface::drawDialog(const DialogView& dialog) {
    int overlayHeight = (int)dialog.lines.size() + 2 * (int)dialog.fields.size() + 5;
    int overlayWidth = std::min(60, COLS - 4);
    overlayHeight = std::min(overlayHeight, LINES - 2);
    int overlayY = (LINES - overlayHeight) / 2, overlayX = (COLS - overlayWidth) / 2;
    WINDOW* overlayWin = newwin(overlayHeight, overlayWidth, overlayY, overlayX);
    wbkgd(overlayWin, COLOR_PAIR(CP_TODO));
    box(overlayWin, 0, 0);
    wattron(overlayWin, COLOR_PAIR(CP_HEADER) | A_BOLD);
    mvwprintw(overlayWin, 0, 2, " %s ", utf8Substr(dialog.title, 0, overlayWidth - 6).c_str());
    wattroff(overlayWin, COLOR_PAIR(CP_HEADER) | A_BOLD);

    int innerWidth = overlayWidth - 4;
    int y = 2;
    for (const std::string& line : dialog.lines) {
        if (y >= overlayHeight - 2) break;
        mvwprintw(overlayWin, y++, 2, "%s", utf8Substr(line, 0, innerWidth).c_str());
    }

    int cursorY = -1, cursorX = -1;
    for (const FieldView& field : dialog.fields) {
        if (y >= overlayHeight - 2) break;
        int valueX = 2 + textWidth(field.label);
        int valueWidth = std::max(1, innerWidth - textWidth(field.label));
        // Scroll long values so the cursor stays visible. Columns are
        // counted in code points, the field cursor is a byte offset.
        size_t cursorColumn = codepointCount(field.value, field.cursor);
        size_t start = (cursorColumn >= (size_t)valueWidth) ? cursorColumn - valueWidth + 1 : 0;
        int attrs = field.focused ? A_BOLD : A_NORMAL;
        wattron(overlayWin, attrs);
        mvwprintw(overlayWin, y, 2, "%s", field.label.c_str());
        wattroff(overlayWin, attrs);
        mvwprintw(overlayWin, y, valueX, "%s", utf8Substr(field.value, start, valueWidth).c_str());
        if (field.focused) {
            cursorY = y;
            cursorX = valueX + (int)(cursorColumn - start);
        }
        y += 2;
    }

    wattron(overlayWin, COLOR_PAIR(CP_HELP));
    mvwprintw(overlayWin, overlayHeight - 2, 2, "%s", utf8Substr(dialog.hint, 0, innerWidth).c_str());
    wattroff(overlayWin, COLOR_PAIR(CP_HELP));

    wnoutrefresh(overlayWin);
    delwin(overlayWin);

    // Keys are read through stdscr, so its cursor is the one shown.
    if (cursorY >= 0) {
        curs_set(1);
        move(overlayY + cursorY, overlayX + cursorX);
        wnoutrefresh(stdscr);
    } else {
        curs_set(0);
    }
}

std::optional<std::string> CursesSurface::pollKey(std::chrono::milliseconds timeout) {
    wtimeout(stdscr, (int)timeout.count());
    int ch = wgetch(stdscr);
    if (ch == ERR) {
        return std::nullopt;
    }
    if (ch == KEY_RESIZE) {
        createListWindow();
        return std::nullopt;
    }
    if (ch >= 0xC2 && ch <= 0xF4) {
        return readUtf8Char(ch);
    }
    return keyToken(ch);
}

// The terminal sends a non-ASCII character as its UTF-8 bytes, one
// wgetch() each. Collect the continuation bytes of the lead byte.
std::optional<std::string> CursesSurface::readUtf8Char(int lead) {
    int extra = (lead >= 0xF0) ? 3 : (lead >= 0xE0) ? 2 : 1;
    std::string bytes(1, static_cast<char>(lead));
    wtimeout(stdscr, 50);
    for (int i = 0; i < extra; i++) {
        int ch = wgetch(stdscr);
        if (ch == ERR || (ch & 0xC0) != 0x80 || ch > 0xFF) {
            return std::nullopt;
        }
        bytes += static_cast<char>(ch);
    }
    return bytes;
}

} // namespace mdtodo
