// app_controller.cpp
#include "app_controller.h"

#include <algorithm>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "markdown_codec.h"
#include "utf8.h"

namespace mdtodo {

namespace {

const std::chrono::milliseconds kTickInterval(250);

// "Saved with 2 errors: home.md: unwritable"
std::string describeErrors(const std::string& what, const std::vector<FileError>& errors) {
    std::string text = what + " with " + std::to_string(errors.size()) +
                       (errors.size() == 1 ? " error: " : " errors: ");
    return text + errors.front().file + ": " + errors.front().message;
}

} // namespace

AppController::AppController(TodoStore store, Keymap keymap, std::string configPath, NowFn now)
    : store_(std::move(store)),
      keymap_(std::move(keymap)),
      configPath_(std::move(configPath)),
      now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
    clampIndices();
}

// --------------------------------------------------------------------
// Key dispatch. Browsing keys go through the keymap; an open dialog
// consumes every key itself.
// --------------------------------------------------------------------
bool AppController::handleKey(const std::string& key) {
    switch (state_.modal.kind) {
        case ModalKind::None: {
            std::optional<Action> action = keymap_.actionFor(key);
            if (!action) {
                if (key == "up") action = Action::MoveUp;
                else if (key == "down") action = Action::MoveDown;
                else if (key == "left") action = Action::CategoryPrev;
                else if (key == "right") action = Action::CategoryNext;
            }
            if (action) handleAction(*action);
            break;
        }
        case ModalKind::Add:
        case ModalKind::Edit:
            handleFormKey(key);
            break;
        case ModalKind::Delete:
            handleDeleteKey(key);
            break;
        case ModalKind::Help:
            closeModal();
            break;
    }
    return !quit_;
}

void AppController::handleAction(Action action) {
    switch (action) {
        case Action::Quit:         quit_ = true; break;
        case Action::Save:         save(); break;
        case Action::Reload:       reload(); break;
        case Action::Add:          openAdd(); break;
        case Action::CategoryPrev: moveCategory(-1); break;
        case Action::CategoryNext: moveCategory(1); break;
        case Action::MoveUp:       moveSelection(-1); break;
        case Action::MoveDown:     moveSelection(1); break;
        case Action::Toggle:       toggleSelected(); break;
        case Action::Delete:       openDelete(); break;
        case Action::Edit:         openEdit(); break;
        case Action::Help:         state_.modal.kind = ModalKind::Help; break;
    }
}

void AppController::handleFormKey(const std::string& key) {
    Modal& modal = state_.modal;
    LineEdit& field = (modal.focus == 0) ? modal.text : modal.category;
    if (key == "enter") {
        if (modal.kind == ModalKind::Add)
            confirmAdd();
        else
            confirmEdit();
    } else if (key == "esc") {
        closeModal();
    } else if (key == "tab" || key == "up" || key == "down") {
        modal.focus = 1 - modal.focus;
    } else if (key == "backspace") {
        field.backspace();
    } else if (key == "left") {
        field.left();
    } else if (key == "right") {
        field.right();
    } else if (key == "home") {
        field.home();
    } else if (key == "end") {
        field.end();
    } else if (key == "space") {
        field.insert(" ");
    } else if (key.size() == 1 && key[0] >= 32 && key[0] < 127) {
        field.insert(key);
    } else if (key.size() > 1 && (unsigned char)key[0] >= 0xC2 &&
               isValidUtf8(key) && codepointCount(key) == 1) {
        // A single non-ASCII character as delivered by the surface.
        field.insert(key);
    }
}

void AppController::handleDeleteKey(const std::string& key) {
    if (key == "y" || key == "Y" || key == "enter") {
        confirmDelete();
    } else if (key == "n" || key == "N" || key == "esc") {
        closeModal();
    }
}

// --------------------------------------------------------------------
// Dialogs.
// --------------------------------------------------------------------
void AppController::openAdd() {
    state_.modal = Modal();
    state_.modal.kind = ModalKind::Add;
    state_.modal.category.assign(activeCategory());
}

void AppController::openEdit() {
    const TodoItem* item = selectedItem();
    if (!item) return;
    state_.modal = Modal();
    state_.modal.kind = ModalKind::Edit;
    state_.modal.target = item->id;
    state_.modal.text.assign(item->text);
    state_.modal.category.assign(item->category);
}

void AppController::openDelete() {
    const TodoItem* item = selectedItem();
    if (!item) return;
    state_.modal = Modal();
    state_.modal.kind = ModalKind::Delete;
    state_.modal.target = item->id;
}

void AppController::confirmAdd() {
    const std::string text = trim(state_.modal.text.value);
    const std::string category = state_.modal.category.value;
    closeModal();
    if (text.empty()) {
        return;
    }
    ItemId id = store_.addTodo(text, category);
    focusItem(id);
    setStatus("Added: " + text);
}

void AppController::confirmEdit() {
    const ItemId target = state_.modal.target;
    const std::string text = trim(state_.modal.text.value);
    const std::string category = state_.modal.category.value;
    closeModal();
    if (text.empty()) {
        setStatus("Edit discarded: empty text");
        return;
    }
    if (!store_.updateTodo(target, text, category)) {
        return;
    }
    focusItem(target);
    setStatus("Updated: " + text);
}

void AppController::confirmDelete() {
    const ItemId target = state_.modal.target;
    closeModal();
    if (!store_.find(target)) return;
    store_.deleteTodo(target);
    clampIndices();
    setStatus("Deleted todo");
}

void AppController::closeModal() {
    state_.modal = Modal();
}

// --------------------------------------------------------------------
// Browsing actions.
// --------------------------------------------------------------------
void AppController::save() {
    std::vector<FileError> errors = store_.save();
    if (errors.empty())
        setStatus("Todos saved successfully!");
    else
        setStatus(describeErrors("Saved", errors));
}

void AppController::reload() {
    const bool hadChanges = store_.dirty();
    std::vector<FileError> errors;
    try {
        errors = store_.load();
    } catch (const StoreError& ex) {
        spdlog::warn("Reload failed: {}", ex.what());
        setStatus(std::string("Reload failed: ") + ex.what());
        return;
    }
    clampIndices();
    if (!errors.empty())
        setStatus(describeErrors("Reloaded", errors));
    else if (hadChanges)
        setStatus("Reloaded todos from files (unsaved changes discarded)");
    else
        setStatus("Reloaded todos from files");
}

void AppController::moveCategory(int delta) {
    const int count = (int)store_.sortedCategories().size();
    state_.activeCategoryIndex = ((state_.activeCategoryIndex + delta) % count + count) % count;
    state_.selectedIndex = 0;
}

void AppController::moveSelection(int delta) {
    state_.selectedIndex += delta;
    clampIndices();
}

void AppController::toggleSelected() {
    const TodoItem* item = selectedItem();
    if (!item) return;
    const ItemId id = item->id;
    store_.toggle(id);
    setStatus("Toggled: " + store_.find(id)->text);
}

// --------------------------------------------------------------------
// Helpers.
// --------------------------------------------------------------------
std::string AppController::activeCategory() const {
    std::vector<std::string> categories = store_.sortedCategories();
    int idx = std::max(0, std::min(state_.activeCategoryIndex, (int)categories.size() - 1));
    return categories[idx];
}

std::vector<TodoItem> AppController::activeTodos() const {
    return store_.todosInCategory(activeCategory());
}

const TodoItem* AppController::selectedItem() const {
    std::vector<TodoItem> todos = activeTodos();
    if (state_.selectedIndex < 0 || state_.selectedIndex >= (int)todos.size()) {
        return nullptr;
    }
    return store_.find(todos[state_.selectedIndex].id);
}

// Make the item's category active and select the item.
void AppController::focusItem(ItemId id) {
    const TodoItem* item = store_.find(id);
    if (!item) return;
    std::vector<std::string> categories = store_.sortedCategories();
    auto cat = std::find(categories.begin(), categories.end(), item->category);
    if (cat != categories.end()) {
        state_.activeCategoryIndex = (int)(cat - categories.begin());
    }
    std::vector<TodoItem> todos = store_.todosInCategory(item->category);
    for (size_t i = 0; i < todos.size(); i++) {
        if (todos[i].id == id) state_.selectedIndex = (int)i;
    }
    clampIndices();
}

void AppController::clampIndices() {
    const int categoryCount = (int)store_.sortedCategories().size();
    state_.activeCategoryIndex =
        std::max(0, std::min(state_.activeCategoryIndex, categoryCount - 1));
    state_.clamp(categoryCount, (int)activeTodos().size());
}

void AppController::setStatus(const std::string& text) {
    state_.setStatus(text, now_());
}

void AppController::tick() {
    state_.expireStatus(now_());
}

std::string AppController::footerText() const {
    if (state_.status) return state_.status->text;
    return "Press " + keymap_.keyFor(Action::Help) + " for help";
}

// --------------------------------------------------------------------
// Screen model.
// --------------------------------------------------------------------
ScreenModel AppController::screen() const {
    ScreenModel model;
    model.title = "Markdown Todo Manager";
    model.dirty = store_.dirty();

    std::vector<std::string> categories = store_.sortedCategories();
    for (size_t i = 0; i < categories.size(); i++) {
        model.tabs.push_back({categories[i], (int)i == state_.activeCategoryIndex});
    }

    std::vector<TodoItem> todos = activeTodos();
    for (size_t i = 0; i < todos.size(); i++) {
        model.rows.push_back({todos[i].text, todos[i].done, (int)i == state_.selectedIndex});
    }
    if (todos.empty()) {
        model.emptyHint = "No todos in category '" + activeCategory() + "'. Press '" +
                          keymap_.keyFor(Action::Add) + "' to add one.";
    }

    model.footer = footerText();
    if (!state_.browsing()) {
        model.dialog = dialogView();
    }
    return model;
}

DialogView AppController::dialogView() const {
    DialogView view;
    const Modal& modal = state_.modal;
    switch (modal.kind) {
        case ModalKind::Add:
        case ModalKind::Edit:
            view.title = (modal.kind == ModalKind::Add) ? "Add New Todo" : "Edit Todo";
            view.fields.push_back({"Task: ", modal.text.value, modal.text.cursor, modal.focus == 0});
            view.fields.push_back({"Category: ", modal.category.value, modal.category.cursor,
                                   modal.focus == 1});
            view.hint = "enter: save   tab: switch field   esc: cancel";
            break;
        case ModalKind::Delete: {
            const TodoItem* item = store_.find(modal.target);
            view.title = "Confirm Delete";
            view.lines.push_back("Delete todo: " + (item ? item->text : std::string()) + "?");
            view.hint = "y: yes   n: no";
            break;
        }
        case ModalKind::Help:
            view.title = "Keybindings";
            for (const auto& entry : keymap_.entries()) {
                std::string action = entry.first;
                std::replace(action.begin(), action.end(), '_', ' ');
                view.lines.push_back(" " + entry.second + " : " + action);
            }
            view.lines.push_back("");
            view.lines.push_back("Configuration: " + configPath_);
            view.hint = "Press any key to close";
            break;
        case ModalKind::None:
            break;
    }
    return view;
}

// --------------------------------------------------------------------
// Main loop.
// --------------------------------------------------------------------
RunResult AppController::run(Surface& surface, const volatile std::sig_atomic_t& interrupted) {
    while (!quit_) {
        if (interrupted) {
            std::vector<FileError> errors = store_.save();
            spdlog::info("Interrupted, saved with {} errors", errors.size());
            return RunResult::Interrupted;
        }
        tick();
        surface.draw(screen());
        std::optional<std::string> key = surface.pollKey(kTickInterval);
        if (key) {
            handleKey(*key);
        }
    }
    spdlog::info("Quit");
    return RunResult::Quit;
}

} // namespace mdtodo
