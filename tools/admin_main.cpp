#include "client/request_channel.h"
#include "core/cfg_parser.h"
#include "core/config.h"
#include "core/logger.h"
#include "protocol/codec.h"
#include "protocol/messages.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct AdminOptions final {
    std::string host = "127.0.0.1";
    std::uint16_t port = duelnet::core::kDefaultServerPort;
    int timeout_ms = 1000;
    std::vector<std::string> command;
};

bool ParseArguments(int argc, char** argv, AdminOptions& out_options, std::string& out_error) {
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

        if (arg == "--server") {
            out_options.host = read_value("--server");
            if (out_options.host.empty()) {
                return false;
            }
            continue;
        }

        if (arg == "--port") {
            const std::string value = read_value("--port");
            if (value.empty()) {
                return false;
            }
            if (!duelnet::core::cfg::ParsePort(value, out_options.port) || out_options.port == 0) {
                out_error = "Invalid --port value";
                return false;
            }
            continue;
        }

        if (arg == "--timeout-ms") {
            const std::string value = read_value("--timeout-ms");
            if (value.empty()) {
                return false;
            }
            if (!duelnet::core::cfg::ParseIntInRange(value, 1, 60000, out_options.timeout_ms)) {
                out_error = "Invalid --timeout-ms value";
                return false;
            }
            continue;
        }

        out_options.command.push_back(arg);
    }

    if (out_options.command.empty()) {
        out_error = "Missing command";
        return false;
    }

    out_error.clear();
    return true;
}

bool ExpectArgumentCount(
    const std::vector<std::string>& command,
    std::size_t expected,
    std::string& out_error) {
    if (command.size() != expected) {
        out_error = command.front() + " expects " + std::to_string(expected - 1) + " argument(s)";
        return false;
    }
    return true;
}

// Builds the request text for one command line. "raw" sends its argument verbatim.
bool BuildRequestText(
    const std::vector<std::string>& command,
    std::string& out_text,
    std::string& out_error) {
    const std::string& name = command.front();
    if (name == "raw") {
        if (!ExpectArgumentCount(command, 2, out_error)) {
            return false;
        }
        out_text = command[1];
        return true;
    }

    duelnet::protocol::CommandKind kind{};
    if (!duelnet::protocol::TryParseCommandName(name, kind)) {
        out_error = "Unknown command: " + name;
        return false;
    }

    duelnet::protocol::Request request;
    switch (kind) {
        case duelnet::protocol::CommandKind::NewGame:
            if (!ExpectArgumentCount(command, 1, out_error)) {
                return false;
            }
            request = duelnet::protocol::NewGameRequest{};
            break;
        case duelnet::protocol::CommandKind::ListGames:
            if (!ExpectArgumentCount(command, 1, out_error)) {
                return false;
            }
            request = duelnet::protocol::ListGamesRequest{};
            break;
        case duelnet::protocol::CommandKind::JoinGame:
            if (!ExpectArgumentCount(command, 3, out_error)) {
                return false;
            }
            request = duelnet::protocol::JoinGameRequest{.game_id = command[1], .name = command[2]};
            break;
        case duelnet::protocol::CommandKind::GameInfo:
            if (!ExpectArgumentCount(command, 2, out_error)) {
                return false;
            }
            request = duelnet::protocol::GameInfoRequest{.game_id = command[1]};
            break;
        case duelnet::protocol::CommandKind::GetWorld:
            if (!ExpectArgumentCount(command, 2, out_error)) {
                return false;
            }
            request = duelnet::protocol::GetWorldRequest{.game_id = command[1]};
            break;
        case duelnet::protocol::CommandKind::EndGame:
            if (!ExpectArgumentCount(command, 2, out_error)) {
                return false;
            }
            request = duelnet::protocol::EndGameRequest{.game_id = command[1]};
            break;
        case duelnet::protocol::CommandKind::SendPosition:
            out_error = "sendposition is only issued by game clients; use raw";
            return false;
    }

    out_text = duelnet::protocol::Codec::EncodeRequest(request);
    return true;
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  duelnet_admin [--server <host>] [--port <port>] [--timeout-ms <ms>] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  newgame\n"
        << "  listgames\n"
        << "  joingame <game_id> <name>\n"
        << "  gameinfo <game_id>\n"
        << "  getworld <game_id>\n"
        << "  endgame <game_id>\n"
        << "  raw '<json>'\n";
}

}  // namespace

int main(int argc, char** argv) {
    AdminOptions options{};
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }

    std::string request_text;
    if (!BuildRequestText(options.command, request_text, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }

    duelnet::core::Logger::SetMinLevel(duelnet::core::LogLevel::Warn);
    duelnet::client::UdpRequestChannel channel(duelnet::client::UdpChannelSettings{
        .server = duelnet::net::UdpEndpoint{
            .host = options.host,
            .port = options.port,
        },
        .reply_timeout = std::chrono::milliseconds(options.timeout_ms),
    });

    std::string reply_text;
    if (!channel.ExchangeText(request_text, reply_text, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        return 2;
    }

    std::cout << reply_text << '\n';
    return 0;
}
