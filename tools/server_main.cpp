#include "core/cfg_parser.h"
#include "core/config.h"
#include "core/logger.h"
#include "server/datagram_server.h"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace {

struct ServerOptions final {
    std::filesystem::path config_path = "config/duelnet_server.cfg";
    std::optional<std::string> bind_host;
    std::optional<std::uint16_t> port;
};

std::atomic_bool g_keep_running{true};

void OnSignal(int signal_code) {
    (void)signal_code;
    g_keep_running.store(false);
}

bool ParseArguments(
    int argc,
    char** argv,
    ServerOptions& out_options,
    std::string& out_error) {
    for (int index = 1; index < argc; ++index) {
        const std::string arg = argv[index];
        auto read_value = [&](const char* key) -> std::string {
            if (index + 1 >= argc) {
                out_error = std::string("Missing value for option: ") + key;
                return {};
            }
            ++index;
            return argv[index];
        };

        if (arg == "--config") {
            const std::string value = read_value("--config");
            if (value.empty()) {
                return false;
            }
            out_options.config_path = value;
            continue;
        }

        if (arg == "--bind") {
            const std::string value = read_value("--bind");
            if (value.empty()) {
                return false;
            }
            out_options.bind_host = value;
            continue;
        }

        if (arg == "--port") {
            const std::string value = read_value("--port");
            if (value.empty()) {
                return false;
            }
            std::uint16_t port = 0;
            if (!duelnet::core::cfg::ParsePort(value, port)) {
                out_error = "Invalid --port value";
                return false;
            }
            out_options.port = port;
            continue;
        }

        out_error = "Unknown option: " + arg;
        return false;
    }

    out_error.clear();
    return true;
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  duelnet_server [--config <path>] [--bind <host>] [--port <port>]\n"
        << "\n"
        << "Examples:\n"
        << "  duelnet_server --config config/duelnet_server.cfg\n"
        << "  duelnet_server --port 7878\n";
}

}  // namespace

int main(int argc, char** argv) {
    ServerOptions options{};
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    duelnet::core::ServerConfig config{};
    std::error_code exists_error;
    if (std::filesystem::exists(options.config_path, exists_error)) {
        if (!duelnet::core::ConfigLoader::LoadServer(options.config_path, config, error)) {
            std::cerr << "[ERROR] config load failed: " << error << '\n';
            return 1;
        }
        duelnet::core::Logger::Info("server", "Config loaded: " + options.config_path.string());
    } else {
        duelnet::core::Logger::Info(
            "server",
            "Config not found, using defaults: " + options.config_path.string());
    }

    if (options.bind_host.has_value()) {
        config.bind_host = *options.bind_host;
    }
    if (options.port.has_value()) {
        config.port = *options.port;
    }
    if (!duelnet::core::ConfigLoader::ValidateServer(config, error)) {
        std::cerr << "[ERROR] invalid server settings: " << error << '\n';
        return 1;
    }
    duelnet::core::Logger::SetMinLevel(config.log_level);

    duelnet::server::DatagramServer server(config);
    if (!server.Open(error)) {
        std::cerr << "[ERROR] server open failed: " << error << '\n';
        return 1;
    }

    server.Run(g_keep_running);
    server.Close();
    duelnet::core::Logger::Info("server", "Server stopped.");
    return 0;
}
