// log_test.cpp
#include "log.h"

#include <filesystem>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "temp_dir.h"

namespace mdtodo {
namespace test {

TEST(Logging, WritesToFileInNewDirectory) {
    TempDir dir;
    const std::filesystem::path path = dir.path() / "state" / "mdtodo.log";

    ASSERT_TRUE(initLogging(path.string()));
    spdlog::warn("disk full on {}", "work.md");
    spdlog::default_logger()->flush();

    EXPECT_NE(readFile(path).find("[warning] disk full on work.md"), std::string::npos);
}

TEST(Logging, UnusablePathInstallsSilentLogger) {
    TempDir dir;
    writeFile(dir.path() / "blocker", "x");

    EXPECT_FALSE(initLogging((dir.path() / "blocker" / "mdtodo.log").string()));
    ASSERT_NE(spdlog::default_logger(), nullptr);
    spdlog::info("dropped");
}

} // namespace test
} // namespace mdtodo
