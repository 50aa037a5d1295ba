#pragma once

#include "game/player.h"
#include "session/session.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace duelnet::session {

enum class JoinOutcome : std::uint8_t {
    Joined = 0,
    GameFull = 1,
    InvalidGame = 2,
    NameTaken = 3,
};

struct JoinResult final {
    JoinOutcome outcome = JoinOutcome::InvalidGame;
    bool started = false;
    std::size_t player_count = 0;
};

// Owns every session hosted by one server process. Not thread-safe: the
// datagram server is its only caller and processes one request at a time.
class SessionRegistry final {
public:
    using Clock = std::chrono::steady_clock;

    SessionRegistry();
    explicit SessionRegistry(std::uint64_t id_seed);

    // The returned reference is valid until the next mutating call.
    const Session& CreateSession();

    Session* Find(std::string_view id);
    const Session* Find(std::string_view id) const;

    JoinResult Join(std::string_view id, std::string_view player_name);

    std::vector<SessionSummary> ListOpen() const;

    // Overwrites the first player named player_name with record, keeping
    // player_name as its name. An unknown name leaves the session untouched.
    // Returns nullptr for an unknown id.
    const Session* ReplacePlayer(
        std::string_view id,
        std::string_view player_name,
        const game::Player& record);

    bool MarkCompleted(std::string_view id, Clock::time_point now);

    // Removes sessions completed at least ttl before now.
    std::size_t CollectCompleted(Clock::time_point now, std::chrono::seconds ttl);

    std::size_t Size() const;

private:
    std::string GenerateUniqueId();

    std::vector<Session> sessions_;
    std::mt19937_64 id_rng_;
};

}  // namespace duelnet::session
