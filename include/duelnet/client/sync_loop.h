#pragma once

#include "client/request_channel.h"
#include "client/session_client.h"
#include "core/config.h"
#include "game/local_simulation.h"
#include "session/session.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace duelnet::client {

enum class SyncPhase : std::uint8_t {
    WaitingForStart = 0,
    Running = 1,
};

const char* SyncPhaseName(SyncPhase phase);

struct SyncSettings final {
    std::chrono::milliseconds physics_period{33};
    std::chrono::milliseconds network_period{20};
    std::chrono::milliseconds wait_poll_period{500};
};

SyncSettings SyncSettingsFromConfig(const core::ClientConfig& config);

struct SyncDiagnostics final {
    std::uint64_t physics_tick_count = 0;
    std::uint64_t network_tick_count = 0;
    std::uint64_t wait_poll_count = 0;
    std::uint64_t push_failure_count = 0;
    std::uint64_t pull_failure_count = 0;
    std::uint64_t opponent_update_count = 0;
    std::uint64_t stale_tick_count = 0;
};

// Drives the physics and network cadences of one client against wall-clock
// time. A network round trip that fails or times out leaves the opponent at
// its last known state for that tick.
class ClientSyncLoop final {
public:
    using Clock = std::chrono::steady_clock;

    ClientSyncLoop(
        IRequestChannel& channel,
        std::string game_id,
        game::LocalSimulation& simulation,
        const SyncSettings& settings);

    void Tick(Clock::time_point now);

    SyncPhase Phase() const;
    const std::string& GameId() const;
    const SyncDiagnostics& Diagnostics() const;
    const std::string& LastError() const;
    std::uint64_t ConsecutiveFailures() const;

private:
    static bool IsDue(
        const std::optional<Clock::time_point>& last_fired,
        std::chrono::milliseconds period,
        Clock::time_point now);

    void PollForStart();
    void RunNetworkTick();
    bool ReconcileOpponent(const session::Session& session);
    void RecordFailure(const std::string& error);
    void RecordSuccess();

    SessionClient session_client_;
    std::string game_id_;
    game::LocalSimulation& simulation_;
    SyncSettings settings_;
    SyncPhase phase_ = SyncPhase::WaitingForStart;
    SyncDiagnostics diagnostics_;
    std::optional<Clock::time_point> last_physics_tick_;
    std::optional<Clock::time_point> last_network_tick_;
    std::optional<Clock::time_point> last_wait_poll_;
    std::uint64_t consecutive_failures_ = 0;
    std::string last_error_;
};

}  // namespace duelnet::client
