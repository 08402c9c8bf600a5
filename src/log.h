// log.h
#pragma once

#include <string>

namespace mdtodo {

// Route the default spdlog logger to a file so nothing is written to the
// terminal while curses owns it. Falls back to a silent logger if the
// file cannot be opened. Returns false in that case.
bool initLogging(const std::string& path);

} // namespace mdtodo
