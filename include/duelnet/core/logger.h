#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace duelnet::core {

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

bool TryParseLogLevel(std::string_view text, LogLevel& out_level);
const char* LogLevelName(LogLevel level);

class Logger final {
public:
    static void SetMinLevel(LogLevel level);
    static LogLevel MinLevel();

    static void Debug(std::string_view module, std::string_view message);
    static void Info(std::string_view module, std::string_view message);
    static void Warn(std::string_view module, std::string_view message);
    static void Error(std::string_view module, std::string_view message);

private:
    static void Log(LogLevel level, std::string_view module, std::string_view message);
};

}  // namespace duelnet::core
