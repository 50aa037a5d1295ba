#include "core/logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace duelnet::core {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<LogLevel>& MinLevelStorage() {
    static std::atomic<LogLevel> level{LogLevel::Info};
    return level;
}

std::string BuildTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
#if defined(_WIN32)
    localtime_s(&local_tm, &time);
#else
    localtime_r(&time, &local_tm);
#endif

    std::ostringstream stream;
    stream << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
           << std::setw(3) << std::setfill('0') << millis;
    return stream.str();
}

}  // namespace

bool TryParseLogLevel(std::string_view text, LogLevel& out_level) {
    if (text == "debug") {
        out_level = LogLevel::Debug;
        return true;
    }
    if (text == "info") {
        out_level = LogLevel::Info;
        return true;
    }
    if (text == "warn") {
        out_level = LogLevel::Warn;
        return true;
    }
    if (text == "error") {
        out_level = LogLevel::Error;
        return true;
    }
    return false;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }

    return "UNKNOWN";
}

void Logger::SetMinLevel(LogLevel level) {
    MinLevelStorage().store(level);
}

LogLevel Logger::MinLevel() {
    return MinLevelStorage().load();
}

void Logger::Debug(std::string_view module, std::string_view message) {
    Log(LogLevel::Debug, module, message);
}

void Logger::Info(std::string_view module, std::string_view message) {
    Log(LogLevel::Info, module, message);
}

void Logger::Warn(std::string_view module, std::string_view message) {
    Log(LogLevel::Warn, module, message);
}

void Logger::Error(std::string_view module, std::string_view message) {
    Log(LogLevel::Error, module, message);
}

void Logger::Log(
    LogLevel level,
    std::string_view module,
    std::string_view message) {
    if (static_cast<std::uint8_t>(level) < static_cast<std::uint8_t>(MinLevel())) {
        return;
    }

    std::lock_guard<std::mutex> lock(LogMutex());
    std::ostream& stream = level == LogLevel::Error ? std::cerr : std::cout;
    stream << '[' << BuildTimestamp() << "] [" << LogLevelName(level) << "] [" << module << "] "
           << message << '\n';
}

}  // namespace duelnet::core
