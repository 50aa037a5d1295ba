#pragma once

#include "protocol/messages.h"
#include "session/session_registry.h"

#include <functional>
#include <string_view>

namespace duelnet::server {

// Resolves one decoded request against the registry. Every outcome, including
// bad game ids and full sessions, is a response value.
class CommandDispatcher final {
public:
    using Clock = session::SessionRegistry::Clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit CommandDispatcher(session::SessionRegistry& registry, NowFn now = {});

    protocol::Response Dispatch(const protocol::Request& request);

    static protocol::Response InvalidCommand();
    static protocol::Response InvalidGame(std::string_view game_id);

private:
    protocol::Response Handle(const protocol::NewGameRequest& request);
    protocol::Response Handle(const protocol::ListGamesRequest& request);
    protocol::Response Handle(const protocol::JoinGameRequest& request);
    protocol::Response Handle(const protocol::GameInfoRequest& request);
    protocol::Response Handle(const protocol::SendPositionRequest& request);
    protocol::Response Handle(const protocol::GetWorldRequest& request);
    protocol::Response Handle(const protocol::EndGameRequest& request);

    session::SessionRegistry& registry_;
    NowFn now_;
};

}  // namespace duelnet::server
