// main.cpp
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <signal.h>

#include <spdlog/spdlog.h>

#include "app_controller.h"
#include "curses_surface.h"
#include "keymap.h"
#include "log.h"
#include "todo_store.h"

namespace fs = std::filesystem;

static volatile std::sig_atomic_t gInterrupted = 0;

static void onInterrupt(int) {
    gInterrupted = 1;
}

static void printUsage(const char* prog) {
    fprintf(stderr, "Usage: %s [--dir <path>]\n", prog);
    fprintf(stderr, "  Markdown todo manager with vim-like keybindings.\n");
    fprintf(stderr, "  Default directory: ~/mdtodo\n");
}

// "~/x" -> "$HOME/x".
static std::string expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    if (path.size() == 1) return home;
    if (path[1] != '/') return path;
    return std::string(home) + path.substr(1);
}

int main(int argc, char* argv[]) {
    std::string dir = "~/mdtodo";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--dir" || arg == "-d") && i + 1 < argc) {
            dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }
    dir = expandHome(dir);

    const std::string configDir = mdtodo::defaultConfigDir();
    mdtodo::initLogging((fs::path(configDir) / "mdtodo.log").string());

    mdtodo::TodoStore store(dir);
    std::vector<mdtodo::FileError> loadErrors;
    try {
        loadErrors = store.load();
    } catch (const mdtodo::StoreError& ex) {
        spdlog::error("{}", ex.what());
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    const std::string keymapPath = (fs::path(configDir) / "keymap.yaml").string();
    mdtodo::KeymapLoadResult keymap = mdtodo::Keymap::loadOrCreate(keymapPath);

    mdtodo::AppController controller(std::move(store), keymap.keymap, keymapPath);
    if (!loadErrors.empty()) {
        const mdtodo::FileError& first = loadErrors.front();
        controller.setStatus("Error loading " + first.file + ": " + first.message);
    }
    if (!keymap.warning.empty()) {
        controller.setStatus(keymap.warning);
    }

    struct sigaction action {};
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);

    mdtodo::RunResult result = mdtodo::RunResult::Quit;
    try {
        mdtodo::CursesSurface surface;
        result = controller.run(surface, gInterrupted);
    } catch (const std::exception& ex) {
        spdlog::error("{}", ex.what());
        std::cerr << ex.what() << std::endl;
        return 1;
    }

    if (result == mdtodo::RunResult::Interrupted) {
        std::cout << "Todos saved. Goodbye!" << std::endl;
    }
    return 0;
}
