#include "server/command_dispatcher.h"

#include <string>
#include <utility>

namespace duelnet::server {

CommandDispatcher::CommandDispatcher(session::SessionRegistry& registry, NowFn now)
    : registry_(registry),
      now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

protocol::Response CommandDispatcher::Dispatch(const protocol::Request& request) {
    return std::visit(
        [this](const auto& typed_request) -> protocol::Response {
            return Handle(typed_request);
        },
        request);
}

protocol::Response CommandDispatcher::InvalidCommand() {
    return protocol::ErrorResponse{.message = "Invalid Command"};
}

protocol::Response CommandDispatcher::InvalidGame(std::string_view game_id) {
    return protocol::ErrorResponse{.message = "Invalid Game " + std::string(game_id)};
}

protocol::Response CommandDispatcher::Handle(const protocol::NewGameRequest& request) {
    (void)request;
    return protocol::GameCreatedResponse{.game_id = registry_.CreateSession().id};
}

protocol::Response CommandDispatcher::Handle(const protocol::ListGamesRequest& request) {
    (void)request;
    return protocol::GameListResponse{.games = registry_.ListOpen()};
}

protocol::Response CommandDispatcher::Handle(const protocol::JoinGameRequest& request) {
    const session::JoinResult result = registry_.Join(request.game_id, request.name);
    switch (result.outcome) {
        case session::JoinOutcome::Joined:
            return protocol::InfoResponse{
                .info = std::string("joined ") + (result.started ? "started" : "not started") +
                    " game " + request.game_id + " with " +
                    std::to_string(result.player_count) + " players",
            };
        case session::JoinOutcome::GameFull:
            return protocol::ErrorResponse{.message = "game " + request.game_id + " is full"};
        case session::JoinOutcome::NameTaken:
            return protocol::ErrorResponse{
                .message = "player " + request.name + " already in game " + request.game_id,
            };
        case session::JoinOutcome::InvalidGame:
            break;
    }

    return InvalidGame(request.game_id);
}

protocol::Response CommandDispatcher::Handle(const protocol::GameInfoRequest& request) {
    const session::Session* session = registry_.Find(request.game_id);
    if (session == nullptr) {
        return InvalidGame(request.game_id);
    }
    return protocol::GameInfoResponse{.game = session::Summarize(*session)};
}

protocol::Response CommandDispatcher::Handle(const protocol::SendPositionRequest& request) {
    const session::Session* session =
        registry_.ReplacePlayer(request.game_id, request.name, request.player);
    if (session == nullptr) {
        return InvalidGame(request.game_id);
    }
    return protocol::WorldResponse{.session = *session};
}

protocol::Response CommandDispatcher::Handle(const protocol::GetWorldRequest& request) {
    const session::Session* session = registry_.Find(request.game_id);
    if (session == nullptr) {
        return InvalidGame(request.game_id);
    }
    return protocol::WorldResponse{.session = *session};
}

protocol::Response CommandDispatcher::Handle(const protocol::EndGameRequest& request) {
    if (!registry_.MarkCompleted(request.game_id, now_())) {
        return InvalidGame(request.game_id);
    }
    return protocol::InfoResponse{.info = "completed game " + request.game_id};
}

}  // namespace duelnet::server
