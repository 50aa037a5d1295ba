#include "core/config.h"

#include "core/cfg_parser.h"

#include <string>
#include <vector>

namespace duelnet::core {
namespace {

constexpr int kMaxIntervalMs = 60 * 1000;
constexpr int kMaxTtlSeconds = 7 * 24 * 60 * 60;

std::string LineSuffix(const cfg::KeyValueLine& line) {
    return ": line " + std::to_string(line.line_number);
}

bool ApplyLogLevel(const cfg::KeyValueLine& line, LogLevel& out_level, std::string& out_error) {
    std::string text;
    if (!cfg::ParseQuotedString(line.value, text) || !TryParseLogLevel(text, out_level)) {
        out_error =
            "log_level expects one of \"debug\"|\"info\"|\"warn\"|\"error\"" + LineSuffix(line);
        return false;
    }
    return true;
}

bool ApplyServerLine(const cfg::KeyValueLine& line, ServerConfig& config, std::string& out_error) {
    if (line.key == "bind_host") {
        if (!cfg::ParseQuotedString(line.value, config.bind_host)) {
            out_error = "bind_host expects string" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "port") {
        if (!cfg::ParsePort(line.value, config.port)) {
            out_error = "port expects integer within [0,65535]" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "receive_timeout_ms") {
        if (!cfg::ParseIntInRange(line.value, 1, kMaxIntervalMs, config.receive_timeout_ms)) {
            out_error = "receive_timeout_ms expects integer within [1,60000]" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "completed_session_ttl_seconds") {
        if (!cfg::ParseIntInRange(
                line.value, 0, kMaxTtlSeconds, config.completed_session_ttl_seconds)) {
            out_error = "completed_session_ttl_seconds expects non-negative integer" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "session_sweep_interval_seconds") {
        if (!cfg::ParseIntInRange(
                line.value, 1, kMaxTtlSeconds, config.session_sweep_interval_seconds)) {
            out_error = "session_sweep_interval_seconds expects positive integer" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "log_level") {
        return ApplyLogLevel(line, config.log_level, out_error);
    }

    Logger::Warn("config", "Unknown server config key ignored: " + line.key + LineSuffix(line));
    return true;
}

bool ApplyClientLine(const cfg::KeyValueLine& line, ClientConfig& config, std::string& out_error) {
    if (line.key == "window_title") {
        if (!cfg::ParseQuotedString(line.value, config.window_title)) {
            out_error = "window_title expects string" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "window_width") {
        if (!cfg::ParseInt(line.value, config.window_width)) {
            out_error = "window_width expects integer" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "window_height") {
        if (!cfg::ParseInt(line.value, config.window_height)) {
            out_error = "window_height expects integer" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "vsync") {
        if (!cfg::ParseBool(line.value, config.vsync)) {
            out_error = "vsync expects boolean" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "server_host") {
        if (!cfg::ParseQuotedString(line.value, config.server_host)) {
            out_error = "server_host expects string" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "server_port") {
        if (!cfg::ParsePort(line.value, config.server_port)) {
            out_error = "server_port expects integer within [0,65535]" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "player_name") {
        if (!cfg::ParseQuotedString(line.value, config.player_name)) {
            out_error = "player_name expects string" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "game_id") {
        if (!cfg::ParseQuotedString(line.value, config.game_id)) {
            out_error = "game_id expects string" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "physics_tick_ms") {
        if (!cfg::ParseIntInRange(line.value, 1, kMaxIntervalMs, config.physics_tick_ms)) {
            out_error = "physics_tick_ms expects integer within [1,60000]" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "network_tick_ms") {
        if (!cfg::ParseIntInRange(line.value, 1, kMaxIntervalMs, config.network_tick_ms)) {
            out_error = "network_tick_ms expects integer within [1,60000]" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "wait_poll_ms") {
        if (!cfg::ParseIntInRange(line.value, 1, kMaxIntervalMs, config.wait_poll_ms)) {
            out_error = "wait_poll_ms expects integer within [1,60000]" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "request_timeout_ms") {
        if (!cfg::ParseIntInRange(line.value, 1, kMaxIntervalMs, config.request_timeout_ms)) {
            out_error = "request_timeout_ms expects integer within [1,60000]" + LineSuffix(line);
            return false;
        }
        return true;
    }

    if (line.key == "log_level") {
        return ApplyLogLevel(line, config.log_level, out_error);
    }

    Logger::Warn("config", "Unknown client config key ignored: " + line.key + LineSuffix(line));
    return true;
}

bool ApplyServerLines(
    const std::vector<cfg::KeyValueLine>& lines,
    ServerConfig& out_config,
    std::string& out_error) {
    ServerConfig parsed = out_config;
    for (const cfg::KeyValueLine& line : lines) {
        if (!ApplyServerLine(line, parsed, out_error)) {
            return false;
        }
    }
    if (!ConfigLoader::ValidateServer(parsed, out_error)) {
        return false;
    }

    out_config = std::move(parsed);
    out_error.clear();
    return true;
}

bool ApplyClientLines(
    const std::vector<cfg::KeyValueLine>& lines,
    ClientConfig& out_config,
    std::string& out_error) {
    ClientConfig parsed = out_config;
    for (const cfg::KeyValueLine& line : lines) {
        if (!ApplyClientLine(line, parsed, out_error)) {
            return false;
        }
    }
    if (!ConfigLoader::ValidateClient(parsed, out_error)) {
        return false;
    }

    out_config = std::move(parsed);
    out_error.clear();
    return true;
}

}  // namespace

bool ConfigLoader::LoadServer(
    const std::filesystem::path& file_path,
    ServerConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseFile(file_path, lines, out_error)) {
        return false;
    }
    return ApplyServerLines(lines, out_config, out_error);
}

bool ConfigLoader::LoadServerText(
    std::string_view text,
    ServerConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseText(text, lines, out_error)) {
        return false;
    }
    return ApplyServerLines(lines, out_config, out_error);
}

bool ConfigLoader::LoadClient(
    const std::filesystem::path& file_path,
    ClientConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseFile(file_path, lines, out_error)) {
        return false;
    }
    return ApplyClientLines(lines, out_config, out_error);
}

bool ConfigLoader::LoadClientText(
    std::string_view text,
    ClientConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseText(text, lines, out_error)) {
        return false;
    }
    return ApplyClientLines(lines, out_config, out_error);
}

bool ConfigLoader::ValidateServer(const ServerConfig& config, std::string& out_error) {
    if (config.bind_host.empty()) {
        out_error = "bind_host cannot be empty";
        return false;
    }
    if (config.receive_timeout_ms <= 0) {
        out_error = "receive_timeout_ms must be > 0";
        return false;
    }
    if (config.session_sweep_interval_seconds <= 0) {
        out_error = "session_sweep_interval_seconds must be > 0";
        return false;
    }

    out_error.clear();
    return true;
}

bool ConfigLoader::ValidateClient(const ClientConfig& config, std::string& out_error) {
    if (config.window_width <= 0 || config.window_height <= 0) {
        out_error = "Window size must be greater than zero.";
        return false;
    }
    if (config.player_name.empty()) {
        out_error = "player_name cannot be empty";
        return false;
    }
    if (config.server_port == 0) {
        out_error = "server_port must be non-zero";
        return false;
    }
    if (config.network_tick_ms > config.physics_tick_ms) {
        out_error = "network_tick_ms (" + std::to_string(config.network_tick_ms) +
            ") must not exceed physics_tick_ms (" + std::to_string(config.physics_tick_ms) + ")";
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace duelnet::core
