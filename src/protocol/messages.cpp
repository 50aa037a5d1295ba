#include "protocol/messages.h"

#include <type_traits>

namespace duelnet::protocol {

const char* CommandName(CommandKind kind) {
    switch (kind) {
        case CommandKind::NewGame:
            return "newgame";
        case CommandKind::ListGames:
            return "listgames";
        case CommandKind::JoinGame:
            return "joingame";
        case CommandKind::GameInfo:
            return "gameinfo";
        case CommandKind::SendPosition:
            return "sendposition";
        case CommandKind::GetWorld:
            return "getworld";
        case CommandKind::EndGame:
            return "endgame";
    }

    return "unknown";
}

bool TryParseCommandName(std::string_view text, CommandKind& out_kind) {
    constexpr CommandKind kAllKinds[] = {
        CommandKind::NewGame,
        CommandKind::ListGames,
        CommandKind::JoinGame,
        CommandKind::GameInfo,
        CommandKind::SendPosition,
        CommandKind::GetWorld,
        CommandKind::EndGame,
    };
    for (const CommandKind kind : kAllKinds) {
        if (text == CommandName(kind)) {
            out_kind = kind;
            return true;
        }
    }
    return false;
}

CommandKind KindOf(const Request& request) {
    return std::visit(
        [](const auto& typed_request) -> CommandKind {
            using T = std::decay_t<decltype(typed_request)>;
            if constexpr (std::is_same_v<T, NewGameRequest>) {
                return CommandKind::NewGame;
            } else if constexpr (std::is_same_v<T, ListGamesRequest>) {
                return CommandKind::ListGames;
            } else if constexpr (std::is_same_v<T, JoinGameRequest>) {
                return CommandKind::JoinGame;
            } else if constexpr (std::is_same_v<T, GameInfoRequest>) {
                return CommandKind::GameInfo;
            } else if constexpr (std::is_same_v<T, SendPositionRequest>) {
                return CommandKind::SendPosition;
            } else if constexpr (std::is_same_v<T, GetWorldRequest>) {
                return CommandKind::GetWorld;
            } else {
                static_assert(std::is_same_v<T, EndGameRequest>);
                return CommandKind::EndGame;
            }
        },
        request);
}

bool IsError(const Response& response) {
    return std::holds_alternative<ErrorResponse>(response);
}

}  // namespace duelnet::protocol
