#include "client/session_client.h"

#include <utility>
#include <variant>

namespace duelnet::client {

SessionClient::SessionClient(IRequestChannel& channel)
    : channel_(channel) {}

template <typename ResponseT>
bool SessionClient::Call(
    const protocol::Request& request,
    ResponseT& out_typed,
    std::string& out_error) {
    protocol::Response response;
    if (!channel_.Exchange(request, response, out_error)) {
        return false;
    }

    if (const auto* error = std::get_if<protocol::ErrorResponse>(&response)) {
        out_error = error->message;
        return false;
    }

    auto* typed = std::get_if<ResponseT>(&response);
    if (typed == nullptr) {
        out_error = std::string("unexpected reply shape for ") +
            protocol::CommandName(protocol::KindOf(request));
        return false;
    }

    out_typed = std::move(*typed);
    out_error.clear();
    return true;
}

bool SessionClient::NewGame(std::string& out_game_id, std::string& out_error) {
    protocol::GameCreatedResponse created{};
    if (!Call(protocol::NewGameRequest{}, created, out_error)) {
        return false;
    }
    out_game_id = std::move(created.game_id);
    return true;
}

bool SessionClient::ListGames(
    std::vector<session::SessionSummary>& out_games,
    std::string& out_error) {
    protocol::GameListResponse list{};
    if (!Call(protocol::ListGamesRequest{}, list, out_error)) {
        return false;
    }
    out_games = std::move(list.games);
    return true;
}

bool SessionClient::JoinGame(
    std::string_view game_id,
    std::string_view name,
    std::string& out_info,
    std::string& out_error) {
    protocol::InfoResponse info{};
    const protocol::JoinGameRequest request{
        .game_id = std::string(game_id),
        .name = std::string(name),
    };
    if (!Call(request, info, out_error)) {
        return false;
    }
    out_info = std::move(info.info);
    return true;
}

bool SessionClient::GameInfo(
    std::string_view game_id,
    session::SessionSummary& out_summary,
    std::string& out_error) {
    protocol::GameInfoResponse info{};
    if (!Call(protocol::GameInfoRequest{.game_id = std::string(game_id)}, info, out_error)) {
        return false;
    }
    out_summary = std::move(info.game);
    return true;
}

bool SessionClient::SendPosition(
    std::string_view game_id,
    const game::Player& player,
    session::Session& out_session,
    std::string& out_error) {
    protocol::WorldResponse world{};
    const protocol::SendPositionRequest request{
        .game_id = std::string(game_id),
        .name = player.name,
        .player = player,
    };
    if (!Call(request, world, out_error)) {
        return false;
    }
    out_session = std::move(world.session);
    return true;
}

bool SessionClient::GetWorld(
    std::string_view game_id,
    session::Session& out_session,
    std::string& out_error) {
    protocol::WorldResponse world{};
    if (!Call(protocol::GetWorldRequest{.game_id = std::string(game_id)}, world, out_error)) {
        return false;
    }
    out_session = std::move(world.session);
    return true;
}

bool SessionClient::EndGame(std::string_view game_id, std::string& out_info, std::string& out_error) {
    protocol::InfoResponse info{};
    if (!Call(protocol::EndGameRequest{.game_id = std::string(game_id)}, info, out_error)) {
        return false;
    }
    out_info = std::move(info.info);
    return true;
}

}  // namespace duelnet::client
