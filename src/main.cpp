#include "app/game_app.h"
#include "core/cfg_parser.h"
#include "core/logger.h"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

struct ClientOptions final {
    std::filesystem::path config_path = "config/duelnet_client.cfg";
    duelnet::app::ClientOverrides overrides;
};

bool ParseArguments(int argc, char** argv, ClientOptions& out_options, std::string& out_error) {
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

        if (arg == "--name") {
            const std::string value = read_value("--name");
            if (value.empty()) {
                return false;
            }
            out_options.overrides.player_name = value;
            continue;
        }

        if (arg == "--game-id") {
            const std::string value = read_value("--game-id");
            if (value.empty()) {
                return false;
            }
            out_options.overrides.game_id = value;
            continue;
        }

        if (arg == "--server") {
            const std::string value = read_value("--server");
            if (value.empty()) {
                return false;
            }
            out_options.overrides.server_host = value;
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
            out_options.overrides.server_port = port;
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
        << "  duelnet_client [--config <path>] [--name <player>] [--game-id <id>] "
        << "[--server <host>] [--port <port>]\n"
        << "\n"
        << "Without --game-id a new game is created and its id is logged.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientOptions options;
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        duelnet::core::Logger::Error("client", error);
        PrintUsage();
        return 1;
    }

    duelnet::app::GameApp app;
    if (!app.Initialize(options.config_path, options.overrides)) {
        return 1;
    }

    const int exit_code = app.Run();
    app.Shutdown();
    return exit_code;
}
