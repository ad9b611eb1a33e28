// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include "LogManager.hpp"
#include "LogGlobals.hpp"
#include "LogMacros.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace gload;

namespace
{
    bool ends_with(const std::string& s, const std::string& suffix)
    {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

TEST(LogManagerTest, FormatsAndTimestampsLines)
{
    LogManager log(LogSettings{ false, {}, 10 });
    log.log("loaded %d of %s", 3, "five");

    auto lines = log.lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("[+", 0), 0u);
    EXPECT_TRUE(ends_with(lines[0], "] loaded 3 of five"));
}

TEST(LogManagerTest, HistoryIsBounded)
{
    LogManager log(LogSettings{ false, {}, 3 });
    for (int i = 0; i < 5; ++i)
        log.log("line %d", i);

    auto lines = log.lines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_TRUE(ends_with(lines.front(), "line 2"));
    EXPECT_TRUE(ends_with(lines.back(), "line 4"));
    EXPECT_EQ(log.line_count(), 5u);

    log.clear();
    EXPECT_TRUE(log.lines().empty());
    EXPECT_EQ(log.line_count(), 0u);
}

TEST(LogManagerTest, AppendsToFile)
{
    const auto path = std::filesystem::temp_directory_path() / "gload_log_test.log";
    std::filesystem::remove(path);
    {
        LogManager log(LogSettings{ false, path, 0 });
        log.log("first");
        log.log("second");
        EXPECT_TRUE(log.lines().empty());
    }

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
        lines.push_back(line);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(ends_with(lines[1], "second"));
    in.close();
    std::filesystem::remove(path);
}

TEST(LogManagerTest, ConcurrentLogging)
{
    LogManager log(LogSettings{ false, {}, 10000 });
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
        threads.emplace_back([&log, t] {
            for (int i = 0; i < 100; ++i)
                log.log("thread %d message %d", t, i);
        });
    for (auto& th : threads) th.join();

    EXPECT_EQ(log.line_count(), 800u);
    EXPECT_EQ(log.lines().size(), 800u);
}

TEST(LogGlobalsTest, MacrosRouteToInstalledLogger)
{
    auto log = std::make_shared<LogManager>(LogSettings{ false, {}, 10 });
    LogGlobals::set_logger(log);

    GLOAD_LOG_WARN("cache holds %zu entries", size_t{ 4 });
    ASSERT_EQ(log->lines().size(), 1u);
    EXPECT_TRUE(ends_with(log->lines()[0], "[WARN] cache holds 4 entries"));
    EXPECT_EQ(LogGlobals::try_get(), log.get());

    LogGlobals::clear();
    EXPECT_TRUE(log->lines().empty());

    // Expired logger: logging becomes a no-op
    log.reset();
    EXPECT_EQ(LogGlobals::try_get(), nullptr);
    GLOAD_LOG_INFO("nobody is listening");
}
