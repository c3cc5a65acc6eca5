/**
 * @file Logger.cpp
 * @brief Implementation of the logging infrastructure
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * This implementation uses spdlog for synchronous logging with
 * console, rotating file and callback sinks.
 */

#include "Tether/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace Tether {
namespace Core {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

LogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

// Forwards the undecorated payload to a std::function
class FunctionSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    using Handler = std::function<void(LogLevel, std::string_view)>;

    explicit FunctionSink(Handler handler) : handler_(std::move(handler)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (handler_) {
            handler_(FromSpdlogLevel(msg.level),
                     std::string_view(msg.payload.data(), msg.payload.size()));
        }
    }

    void flush_() override {}

private:
    Handler handler_;
};

} // namespace

LogLevel parseLogLevel(std::string_view name) noexcept {
    if (name == "trace")    return LogLevel::Trace;
    if (name == "debug")    return LogLevel::Debug;
    if (name == "info")     return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error")    return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off")      return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    minLevel_ = minLevel;
    outputs_ = outputs;
    logFilePath_ = logFilePath;
    maxFileSizeBytes_ = maxFileSizeMB * 1024 * 1024;

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(outputs_, LogOutput::Console)) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(console_sink);
        }

        if (hasFlag(outputs_, LogOutput::File) && !logFilePath_.empty()) {
            std::filesystem::path logPath(logFilePath_);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath_,
                maxFileSizeBytes_,
                3 // Keep 3 rotated files
            );
            file_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(file_sink);
        }

        if (hasFlag(outputs_, LogOutput::Callback)) {
            auto callback_sink = std::make_shared<FunctionSink>(
                [this](LogLevel level, std::string_view message) {
                    DispatchCallback(level, message);
                }
            );
            callback_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(callback_sink);
        }

        if (sinks.empty()) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(console_sink);
        }

        spdlogger_ = std::make_shared<spdlog::logger>(
            "tether",
            sinks.begin(),
            sinks.end()
        );

        // [timestamp] [level] [thread] message
        spdlogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlogger_->set_level(ToSpdlogLevel(minLevel_));
        spdlogger_->flush_on(spdlog::level::trace);

        initialized_ = true;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        spdlogger_.reset();
        return false;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }

    initialized_ = false;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
        for (auto& sink : spdlogger_->sinks()) {
            sink->set_level(ToSpdlogLevel(level));
        }
    }
}

LogLevel Logger::GetMinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

void Logger::DispatchCallback(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    if (callback_) {
        callback_(level, message, std::chrono::system_clock::now());
    }
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && level >= minLevel_ && level != LogLevel::Off;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.dropped++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        switch (level) {
            case LogLevel::Trace:    stats_.trace++; break;
            case LogLevel::Debug:    stats_.debug++; break;
            case LogLevel::Info:     stats_.info++; break;
            case LogLevel::Warning:  stats_.warning++; break;
            case LogLevel::Error:    stats_.error++; break;
            case LogLevel::Critical: stats_.critical++; break;
            default: break;
        }
    }

    std::shared_ptr<spdlog::logger> target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = spdlogger_;
    }
    if (!target) {
        return;
    }

    std::string formattedMsg;
    if (file && line > 0) {
        // Keep only the file name
        const char* filename = file;
        for (const char* p = file; *p; ++p) {
            if (*p == '/' || *p == '\\') {
                filename = p + 1;
            }
        }
        formattedMsg = std::string("(") + filename + ":" + std::to_string(line) + ") " + std::string(message);
    } else {
        formattedMsg = std::string(message);
    }

    target->log(ToSpdlogLevel(level), formattedMsg);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void Logger::ResetStatistics() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = Statistics{};
}

} // namespace Core
} // namespace Tether
