#include "session/session_registry.h"

#include "core/logger.h"

#include <algorithm>
#include <array>
#include <utility>

namespace duelnet::session {
namespace {

constexpr std::array<char, 16> kHexDigits = {
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f',
};

void AppendHex(std::uint64_t value, int nibble_count, std::string& out_text) {
    for (int shift = (nibble_count - 1) * 4; shift >= 0; shift -= 4) {
        out_text.push_back(kHexDigits[(value >> shift) & 0xFU]);
    }
}

// Random (version 4) UUID text.
std::string FormatUuid(std::uint64_t high, std::uint64_t low) {
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string text;
    text.reserve(36);
    AppendHex(high >> 32, 8, text);
    text.push_back('-');
    AppendHex((high >> 16) & 0xFFFFU, 4, text);
    text.push_back('-');
    AppendHex(high & 0xFFFFU, 4, text);
    text.push_back('-');
    AppendHex(low >> 48, 4, text);
    text.push_back('-');
    AppendHex(low & 0xFFFFFFFFFFFFULL, 12, text);
    return text;
}

std::uint64_t RandomSeed() {
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32) ^ static_cast<std::uint64_t>(device());
}

}  // namespace

SessionRegistry::SessionRegistry()
    : SessionRegistry(RandomSeed()) {}

SessionRegistry::SessionRegistry(std::uint64_t id_seed)
    : id_rng_(id_seed) {}

const Session& SessionRegistry::CreateSession() {
    Session session{};
    session.id = GenerateUniqueId();
    sessions_.push_back(std::move(session));
    core::Logger::Info("session", "Created game " + sessions_.back().id);
    return sessions_.back();
}

Session* SessionRegistry::Find(std::string_view id) {
    const auto it = std::find_if(sessions_.begin(), sessions_.end(), [id](const Session& session) {
        return session.id == id;
    });
    return it != sessions_.end() ? &*it : nullptr;
}

const Session* SessionRegistry::Find(std::string_view id) const {
    const auto it = std::find_if(sessions_.begin(), sessions_.end(), [id](const Session& session) {
        return session.id == id;
    });
    return it != sessions_.end() ? &*it : nullptr;
}

JoinResult SessionRegistry::Join(std::string_view id, std::string_view player_name) {
    Session* session = Find(id);
    if (session == nullptr) {
        return JoinResult{.outcome = JoinOutcome::InvalidGame};
    }

    JoinResult result{
        .outcome = JoinOutcome::Joined,
        .started = session->started,
        .player_count = session->players.size(),
    };
    if (session->started || session->IsFull()) {
        result.outcome = JoinOutcome::GameFull;
        return result;
    }
    if (session->HasPlayer(player_name)) {
        result.outcome = JoinOutcome::NameTaken;
        return result;
    }

    session->players.push_back(game::MakePlayer(std::string(player_name)));
    if (session->players.size() == kMaxPlayers) {
        session->started = true;
        core::Logger::Info("session", "Game " + session->id + " started");
    }

    result.started = session->started;
    result.player_count = session->players.size();
    core::Logger::Info(
        "session",
        std::string(player_name) + " joined game " + session->id +
            " (" + std::to_string(result.player_count) + "/" + std::to_string(kMaxPlayers) + ")");
    return result;
}

std::vector<SessionSummary> SessionRegistry::ListOpen() const {
    std::vector<SessionSummary> open_sessions;
    for (const Session& session : sessions_) {
        if (!session.started) {
            open_sessions.push_back(Summarize(session));
        }
    }
    return open_sessions;
}

const Session* SessionRegistry::ReplacePlayer(
    std::string_view id,
    std::string_view player_name,
    const game::Player& record) {
    Session* session = Find(id);
    if (session == nullptr) {
        return nullptr;
    }

    game::Player* player = session->FindPlayer(player_name);
    if (player == nullptr) {
        core::Logger::Debug(
            "session",
            "Position update for unknown player " + std::string(player_name) +
                " in game " + session->id + " ignored");
        return session;
    }

    // The request name is the key; a record cannot rename its player.
    *player = record;
    player->name = std::string(player_name);
    return session;
}

bool SessionRegistry::MarkCompleted(std::string_view id, Clock::time_point now) {
    Session* session = Find(id);
    if (session == nullptr) {
        return false;
    }

    if (!session->completed) {
        session->completed = true;
        session->completed_at = now;
        core::Logger::Info("session", "Game " + session->id + " completed");
    }
    return true;
}

std::size_t SessionRegistry::CollectCompleted(Clock::time_point now, std::chrono::seconds ttl) {
    const std::size_t size_before = sessions_.size();
    sessions_.erase(
        std::remove_if(
            sessions_.begin(),
            sessions_.end(),
            [now, ttl](const Session& session) {
                return session.completed &&
                    session.completed_at.has_value() &&
                    now - *session.completed_at >= ttl;
            }),
        sessions_.end());

    const std::size_t removed = size_before - sessions_.size();
    if (removed > 0) {
        core::Logger::Info(
            "session",
            "Collected " + std::to_string(removed) + " completed game(s), " +
                std::to_string(sessions_.size()) + " remaining");
    }
    return removed;
}

std::size_t SessionRegistry::Size() const {
    return sessions_.size();
}

std::string SessionRegistry::GenerateUniqueId() {
    while (true) {
        const std::uint64_t high = id_rng_();
        const std::uint64_t low = id_rng_();
        std::string id = FormatUuid(high, low);
        if (Find(id) == nullptr) {
            return id;
        }
    }
}

}  // namespace duelnet::session
