// app_controller.h
#pragma once

#include <csignal>
#include <functional>
#include <string>
#include <vector>

#include "interaction_state.h"
#include "keymap.h"
#include "surface.h"
#include "todo_store.h"

namespace mdtodo {

enum class RunResult { Quit, Interrupted };

// --------------------------------------------------------------------
// AppController: turns key tokens into state transitions and store
// mutations, and builds the screen from store + state.
// --------------------------------------------------------------------
class AppController {
public:
    using NowFn = std::function<Clock::time_point()>;

    AppController(TodoStore store, Keymap keymap, std::string configPath,
                  NowFn now = NowFn());

    // Process one key. Returns false once quit was requested.
    bool handleKey(const std::string& key);

    // Render tick: expire the status message.
    void tick();

    ScreenModel screen() const;

    // Draw/poll/dispatch until quit. On interrupt the store is saved
    // before returning.
    RunResult run(Surface& surface, const volatile std::sig_atomic_t& interrupted);

    void setStatus(const std::string& text);
    std::string footerText() const;

    const InteractionState& state() const { return state_; }
    const TodoStore& store() const { return store_; }
    TodoStore& store() { return store_; }
    const Keymap& keymap() const { return keymap_; }
    bool quitRequested() const { return quit_; }

    std::string activeCategory() const;
    std::vector<TodoItem> activeTodos() const;

private:
    void handleAction(Action action);
    void handleFormKey(const std::string& key);
    void handleDeleteKey(const std::string& key);

    void openAdd();
    void openEdit();
    void openDelete();
    void confirmAdd();
    void confirmEdit();
    void confirmDelete();
    void closeModal();

    void save();
    void reload();
    void moveCategory(int delta);
    void moveSelection(int delta);
    void toggleSelected();

    const TodoItem* selectedItem() const;
    void focusItem(ItemId id);
    void clampIndices();
    DialogView dialogView() const;

    TodoStore store_;
    Keymap keymap_;
    std::string configPath_;
    NowFn now_;
    InteractionState state_;
    bool quit_ = false;
};

} // namespace mdtodo
