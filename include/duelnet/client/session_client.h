#pragma once

#include "client/request_channel.h"
#include "game/player.h"
#include "session/session.h"

#include <string>
#include <string_view>
#include <vector>

namespace duelnet::client {

// Typed wrappers over one request channel. Each call returns false with a
// readable out_error on transport failure or on an error response.
class SessionClient final {
public:
    explicit SessionClient(IRequestChannel& channel);

    bool NewGame(std::string& out_game_id, std::string& out_error);
    bool ListGames(std::vector<session::SessionSummary>& out_games, std::string& out_error);
    bool JoinGame(
        std::string_view game_id,
        std::string_view name,
        std::string& out_info,
        std::string& out_error);
    bool GameInfo(
        std::string_view game_id,
        session::SessionSummary& out_summary,
        std::string& out_error);
    bool SendPosition(
        std::string_view game_id,
        const game::Player& player,
        session::Session& out_session,
        std::string& out_error);
    bool GetWorld(std::string_view game_id, session::Session& out_session, std::string& out_error);
    bool EndGame(std::string_view game_id, std::string& out_info, std::string& out_error);

private:
    template <typename ResponseT>
    bool Call(const protocol::Request& request, ResponseT& out_typed, std::string& out_error);

    IRequestChannel& channel_;
};

}  // namespace duelnet::client
