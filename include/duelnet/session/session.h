#pragma once

#include "game/player.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace duelnet::session {

inline constexpr std::size_t kMaxPlayers = 2;

// One match. players.size() never exceeds kMaxPlayers and started implies the
// session is full.
struct Session final {
    std::string id;
    std::vector<game::Player> players;
    bool started = false;
    bool completed = false;

    // Server-local bookkeeping for the completed-session collector.
    std::optional<std::chrono::steady_clock::time_point> completed_at;

    std::size_t PlayerCount() const;
    bool IsFull() const;
    bool HasPlayer(std::string_view name) const;

    // First player with that name, or nullptr.
    game::Player* FindPlayer(std::string_view name);
    const game::Player* FindPlayer(std::string_view name) const;
};

struct SessionSummary final {
    std::string id;
    std::size_t player_count = 0;

    bool operator==(const SessionSummary&) const = default;
};

SessionSummary Summarize(const Session& session);

}  // namespace duelnet::session
