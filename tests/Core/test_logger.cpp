/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger infrastructure
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <gtest/gtest.h>
#include "Tether/Core/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace Tether::Core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().Shutdown();
        testLogPath_ = "/tmp/tether_test_logger.log";
        std::filesystem::remove(testLogPath_);
    }

    void TearDown() override {
        Logger::Instance().SetCallback(nullptr);
        Logger::Instance().Shutdown();
        std::filesystem::remove(testLogPath_);

        for (const auto& entry : std::filesystem::directory_iterator("/tmp")) {
            if (entry.path().filename().string().find("tether_test_logger.") == 0) {
                std::filesystem::remove(entry.path());
            }
        }
    }

    std::string readLog() const {
        std::ifstream logFile(testLogPath_);
        return std::string((std::istreambuf_iterator<char>(logFile)),
                           std::istreambuf_iterator<char>());
    }

    std::string testLogPath_;
};

TEST_F(LoggerTest, InitializeAndShutdown) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));

    // Second initialization is refused until shutdown
    EXPECT_FALSE(logger.Initialize(LogLevel::Debug, LogOutput::Console));

    logger.Shutdown();
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Critical));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Warning, LogOutput::Console);

    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Trace));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Error));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Critical));

    logger.SetMinLevel(LogLevel::Debug);
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_EQ(logger.GetMinLevel(), LogLevel::Debug);
}

// Test level names accepted in the configuration file
TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel(""), LogLevel::Info);
}

TEST_F(LoggerTest, FileOutput) {
    auto& logger = Logger::Instance();

    ASSERT_TRUE(logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_));

    logger.Log(LogLevel::Info, "client start");
    logger.Log(LogLevel::Error, "auth failed: Portal refused the credentials");
    logger.Flush();

    ASSERT_TRUE(std::filesystem::exists(testLogPath_));

    std::string content = readLog();
    EXPECT_NE(content.find("client start"), std::string::npos);
    EXPECT_NE(content.find("auth failed"), std::string::npos);
    EXPECT_NE(content.find("[info]"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, FormattedLogging) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);

    logger.LogFormat(LogLevel::Info, "%ssend heartbeat error: %s", "[abcde] ", "Operation timed out");
    logger.Flush();

    EXPECT_NE(readLog().find("[abcde] send heartbeat error: Operation timed out"), std::string::npos);
}

// Test that messages longer than the stack buffer are not truncated
TEST_F(LoggerTest, LongFormattedMessage) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Info, LogOutput::Callback);

    std::string received;
    logger.SetCallback([&](LogLevel, std::string_view message, std::chrono::system_clock::time_point) {
        received = std::string(message);
    });

    std::string longText(3000, 'x');
    logger.LogFormat(LogLevel::Info, "<%s>", longText.c_str());

    EXPECT_EQ(received.size(), longText.size() + 2);
    EXPECT_EQ(received.front(), '<');
    EXPECT_EQ(received.back(), '>');
}

TEST_F(LoggerTest, Statistics) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Trace, LogOutput::Console);
    logger.ResetStatistics();

    logger.Log(LogLevel::Trace, "Trace message");
    logger.Log(LogLevel::Debug, "Debug message");
    logger.Log(LogLevel::Info, "Info message");
    logger.Log(LogLevel::Warning, "Warning message");
    logger.Log(LogLevel::Error, "Error message");
    logger.Log(LogLevel::Critical, "Critical message");

    auto stats = logger.GetStatistics();

    EXPECT_EQ(stats.trace, 1u);
    EXPECT_EQ(stats.debug, 1u);
    EXPECT_EQ(stats.info, 1u);
    EXPECT_EQ(stats.warning, 1u);
    EXPECT_EQ(stats.error, 1u);
    EXPECT_EQ(stats.critical, 1u);
}

TEST_F(LoggerTest, DroppedMessages) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Error, LogOutput::Console);
    logger.ResetStatistics();

    logger.Log(LogLevel::Debug, "Debug message");
    logger.Log(LogLevel::Info, "Info message");
    logger.Log(LogLevel::Warning, "Warning message");
    logger.Log(LogLevel::Error, "Error message");

    auto stats = logger.GetStatistics();

    EXPECT_EQ(stats.dropped, 3u);
    EXPECT_EQ(stats.error, 1u);
}

// Test that concurrent sessions can share the logger
TEST_F(LoggerTest, ThreadSafety) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);
    logger.ResetStatistics();

    const int numThreads = 8;
    const int messagesPerThread = 100;

    std::vector<std::thread> threads;
    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&logger, i]() {
            for (int j = 0; j < messagesPerThread; ++j) {
                logger.LogFormat(LogLevel::Info, "[s%d] send heartbeat %d", i, j);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    logger.Flush();

    auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.info, static_cast<size_t>(numThreads * messagesPerThread));
}

TEST_F(LoggerTest, CallbackReceivesUndecoratedMessage) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Info, LogOutput::Callback);

    int callbackCount = 0;
    LogLevel lastLevel = LogLevel::Off;
    std::string lastMessage;

    logger.SetCallback([&](LogLevel level, std::string_view message,
                           std::chrono::system_clock::time_point) {
        callbackCount++;
        lastLevel = level;
        lastMessage = std::string(message);
    });

    logger.Log(LogLevel::Warning, "[k3Zq9][user:alice bind_device:sys_default] auth required");

    EXPECT_EQ(callbackCount, 1);
    EXPECT_EQ(lastLevel, LogLevel::Warning);
    EXPECT_EQ(lastMessage, "[k3Zq9][user:alice bind_device:sys_default] auth required");

    // Below the threshold nothing reaches the callback
    logger.Log(LogLevel::Debug, "hidden");
    EXPECT_EQ(callbackCount, 1);
}

TEST_F(LoggerTest, Macros) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Trace, LogOutput::File, testLogPath_);
    logger.ResetStatistics();

    TETHER_LOG_TRACE("Trace macro test");
    TETHER_LOG_DEBUG("Debug macro test");
    TETHER_LOG_INFO("Info macro test");
    TETHER_LOG_WARNING("Warning macro test");
    TETHER_LOG_ERROR("Error macro test");
    TETHER_LOG_CRITICAL("Critical macro test");

    logger.Flush();

    auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.trace, 1u);
    EXPECT_EQ(stats.debug, 1u);
    EXPECT_EQ(stats.info, 1u);
    EXPECT_EQ(stats.warning, 1u);
    EXPECT_EQ(stats.error, 1u);
    EXPECT_EQ(stats.critical, 1u);

    std::string content = readLog();
    EXPECT_NE(content.find("Trace macro test"), std::string::npos);
    // Error-level macros carry their source location
    EXPECT_NE(content.find("(test_logger.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, FormattedMacros) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);

    TETHER_LOG_INFO_F("%slog out request sent", "[rid01] ");
    TETHER_LOG_WARNING_F("Network check failed:%s", "Failed to connect to server");
    logger.Flush();

    std::string content = readLog();
    EXPECT_NE(content.find("[rid01] log out request sent"), std::string::npos);
    EXPECT_NE(content.find("Network check failed:Failed to connect to server"), std::string::npos);
}
