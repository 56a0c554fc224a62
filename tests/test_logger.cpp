#include <gtest/gtest.h>

#include "logger.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using algexpr::cli::Logger;
using algexpr::cli::LogLevel;

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::size_t count_lines_with(const std::string& text, const std::string& needle) {
    std::istringstream in(text);
    std::string line;
    std::size_t n = 0;
    while (std::getline(in, line)) n += line.find(needle) != std::string::npos;
    return n;
}

TEST(Logger, ParsesLevelNames) {
    LogLevel level{};
    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(Logger::parse_level("error", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_FALSE(Logger::parse_level("verbose", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_STREQ(Logger::level_name(LogLevel::Warn), "WARN ");
}

TEST(Logger, LevelChangesWhileOtherThreadsLog) {
    const std::string path = ::testing::TempDir() + "algexpr_logger_test.log";
    std::remove(path.c_str());

    Logger& logger = Logger::instance();
    ASSERT_TRUE(logger.enable_file_logging(path));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < 200; ++i) {
                logger.set_level(i % 2 ? LogLevel::Debug : LogLevel::Error);
                logger.error("worker " + std::to_string(t));
            }
        });
    }
    for (auto& th : threads) th.join();

    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
    logger.warn("below threshold");
    logger.error("done");

    const std::string text = read_file(path);
    EXPECT_EQ(count_lines_with(text, "] [ERROR] worker "), 800u);
    EXPECT_EQ(count_lines_with(text, "below threshold"), 0u);
    EXPECT_EQ(count_lines_with(text, "] [ERROR] done"), 1u);
}

} // namespace
