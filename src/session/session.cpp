#include "session/session.h"

#include <algorithm>

namespace duelnet::session {

std::size_t Session::PlayerCount() const {
    return players.size();
}

bool Session::IsFull() const {
    return players.size() >= kMaxPlayers;
}

bool Session::HasPlayer(std::string_view name) const {
    return FindPlayer(name) != nullptr;
}

game::Player* Session::FindPlayer(std::string_view name) {
    const auto it = std::find_if(players.begin(), players.end(), [name](const game::Player& player) {
        return player.name == name;
    });
    return it != players.end() ? &*it : nullptr;
}

const game::Player* Session::FindPlayer(std::string_view name) const {
    const auto it = std::find_if(players.begin(), players.end(), [name](const game::Player& player) {
        return player.name == name;
    });
    return it != players.end() ? &*it : nullptr;
}

SessionSummary Summarize(const Session& session) {
    return SessionSummary{
        .id = session.id,
        .player_count = session.players.size(),
    };
}

}  // namespace duelnet::session
