#pragma once

#include "core/logger.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace duelnet::core {

inline constexpr std::uint16_t kDefaultServerPort = 7878;

struct ServerConfig final {
    std::string bind_host = "0.0.0.0";
    std::uint16_t port = kDefaultServerPort;
    int receive_timeout_ms = 200;
    int completed_session_ttl_seconds = 300;
    int session_sweep_interval_seconds = 30;
    LogLevel log_level = LogLevel::Info;
};

struct ClientConfig final {
    std::string window_title = "DuelNet";
    int window_width = 640;
    int window_height = 480;
    bool vsync = true;
    std::string server_host = "127.0.0.1";
    std::uint16_t server_port = kDefaultServerPort;
    std::string player_name = "player";
    std::string game_id;
    int physics_tick_ms = 33;
    int network_tick_ms = 20;
    int wait_poll_ms = 500;
    int request_timeout_ms = 50;
    LogLevel log_level = LogLevel::Info;
};

class ConfigLoader final {
public:
    static bool LoadServer(
        const std::filesystem::path& file_path,
        ServerConfig& out_config,
        std::string& out_error);
    static bool LoadServerText(
        std::string_view text,
        ServerConfig& out_config,
        std::string& out_error);

    static bool LoadClient(
        const std::filesystem::path& file_path,
        ClientConfig& out_config,
        std::string& out_error);
    static bool LoadClientText(
        std::string_view text,
        ClientConfig& out_config,
        std::string& out_error);

    static bool ValidateServer(const ServerConfig& config, std::string& out_error);
    static bool ValidateClient(const ClientConfig& config, std::string& out_error);
};

}  // namespace duelnet::core
