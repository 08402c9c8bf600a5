// log.cpp
#include "log.h"

#include <filesystem>
#include <memory>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace mdtodo {

bool initLogging(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        auto logger = std::make_shared<spdlog::logger>("mdtodo", sink);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return true;
    } catch (const spdlog::spdlog_ex&) {
        auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("mdtodo", sink));
        return false;
    }
}

} // namespace mdtodo
