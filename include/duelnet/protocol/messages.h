#pragma once

#include "game/player.h"
#include "session/session.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace duelnet::protocol {

enum class CommandKind : std::uint8_t {
    NewGame = 0,
    ListGames,
    JoinGame,
    GameInfo,
    SendPosition,
    GetWorld,
    EndGame,
};

const char* CommandName(CommandKind kind);
bool TryParseCommandName(std::string_view text, CommandKind& out_kind);

struct NewGameRequest final {};

struct ListGamesRequest final {};

struct JoinGameRequest final {
    std::string game_id;
    std::string name;
};

struct GameInfoRequest final {
    std::string game_id;
};

struct SendPositionRequest final {
    std::string game_id;
    std::string name;
    game::Player player;
};

struct GetWorldRequest final {
    std::string game_id;
};

struct EndGameRequest final {
    std::string game_id;
};

using Request = std::variant<
    NewGameRequest,
    ListGamesRequest,
    JoinGameRequest,
    GameInfoRequest,
    SendPositionRequest,
    GetWorldRequest,
    EndGameRequest>;

CommandKind KindOf(const Request& request);

struct ErrorResponse final {
    std::string message;
};

struct GameCreatedResponse final {
    std::string game_id;
};

struct GameListResponse final {
    std::vector<session::SessionSummary> games;
};

struct InfoResponse final {
    std::string info;
};

struct GameInfoResponse final {
    session::SessionSummary game;
};

struct WorldResponse final {
    session::Session session;
};

using Response = std::variant<
    ErrorResponse,
    GameCreatedResponse,
    GameListResponse,
    InfoResponse,
    GameInfoResponse,
    WorldResponse>;

bool IsError(const Response& response);

}  // namespace duelnet::protocol
