#include "client/sync_loop.h"

#include "core/logger.h"

#include <utility>

namespace duelnet::client {

const char* SyncPhaseName(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::WaitingForStart:
            return "waiting_for_start";
        case SyncPhase::Running:
            return "running";
    }

    return "unknown";
}

SyncSettings SyncSettingsFromConfig(const core::ClientConfig& config) {
    return SyncSettings{
        .physics_period = std::chrono::milliseconds(config.physics_tick_ms),
        .network_period = std::chrono::milliseconds(config.network_tick_ms),
        .wait_poll_period = std::chrono::milliseconds(config.wait_poll_ms),
    };
}

ClientSyncLoop::ClientSyncLoop(
    IRequestChannel& channel,
    std::string game_id,
    game::LocalSimulation& simulation,
    const SyncSettings& settings)
    : session_client_(channel),
      game_id_(std::move(game_id)),
      simulation_(simulation),
      settings_(settings) {}

bool ClientSyncLoop::IsDue(
    const std::optional<Clock::time_point>& last_fired,
    std::chrono::milliseconds period,
    Clock::time_point now) {
    return !last_fired.has_value() || now - *last_fired >= period;
}

void ClientSyncLoop::Tick(Clock::time_point now) {
    if (IsDue(last_physics_tick_, settings_.physics_period, now)) {
        last_physics_tick_ = now;
        ++diagnostics_.physics_tick_count;
        simulation_.Step();
    }

    if (phase_ == SyncPhase::WaitingForStart) {
        if (IsDue(last_wait_poll_, settings_.wait_poll_period, now)) {
            last_wait_poll_ = now;
            PollForStart();
        }
        return;
    }

    if (IsDue(last_network_tick_, settings_.network_period, now)) {
        last_network_tick_ = now;
        RunNetworkTick();
    }
}

SyncPhase ClientSyncLoop::Phase() const {
    return phase_;
}

const std::string& ClientSyncLoop::GameId() const {
    return game_id_;
}

const SyncDiagnostics& ClientSyncLoop::Diagnostics() const {
    return diagnostics_;
}

const std::string& ClientSyncLoop::LastError() const {
    return last_error_;
}

std::uint64_t ClientSyncLoop::ConsecutiveFailures() const {
    return consecutive_failures_;
}

void ClientSyncLoop::PollForStart() {
    ++diagnostics_.wait_poll_count;

    session::Session session{};
    std::string error;
    if (!session_client_.GetWorld(game_id_, session, error)) {
        ++diagnostics_.pull_failure_count;
        RecordFailure(error);
        return;
    }
    RecordSuccess();

    if (!session.started) {
        core::Logger::Debug(
            "sync",
            "Game " + game_id_ + " waiting for players (" +
                std::to_string(session.players.size()) + "/" +
                std::to_string(session::kMaxPlayers) + ")");
        return;
    }

    phase_ = SyncPhase::Running;
    core::Logger::Info("sync", "Game " + game_id_ + " started, switching to running phase");
    if (!ReconcileOpponent(session)) {
        core::Logger::Warn("sync", "Started game " + game_id_ + " has no opponent entry");
    }
}

void ClientSyncLoop::RunNetworkTick() {
    ++diagnostics_.network_tick_count;

    session::Session pushed{};
    std::string error;
    const bool push_ok = session_client_.SendPosition(game_id_, simulation_.LocalPlayer(), pushed, error);
    if (!push_ok) {
        ++diagnostics_.push_failure_count;
        RecordFailure(error);
    }

    session::Session world{};
    if (!session_client_.GetWorld(game_id_, world, error)) {
        ++diagnostics_.pull_failure_count;
        ++diagnostics_.stale_tick_count;
        RecordFailure(error);
        return;
    }
    if (push_ok) {
        RecordSuccess();
    }

    if (!ReconcileOpponent(world)) {
        ++diagnostics_.stale_tick_count;
    }
}

bool ClientSyncLoop::ReconcileOpponent(const session::Session& session) {
    const std::string& local_name = simulation_.LocalPlayer().name;
    for (const game::Player& player : session.players) {
        if (player.name != local_name) {
            simulation_.ApplyOpponentState(player);
            ++diagnostics_.opponent_update_count;
            return true;
        }
    }
    return false;
}

void ClientSyncLoop::RecordFailure(const std::string& error) {
    last_error_ = error;
    ++consecutive_failures_;
    if (consecutive_failures_ == 1) {
        core::Logger::Warn("sync", "Round trip failed, keeping last known state: " + error);
    } else {
        core::Logger::Debug("sync", "Round trip failed: " + error);
    }
}

void ClientSyncLoop::RecordSuccess() {
    if (consecutive_failures_ > 0) {
        core::Logger::Info(
            "sync",
            "Server reachable again after " + std::to_string(consecutive_failures_) +
                " failed round trip(s)");
    }
    consecutive_failures_ = 0;
}

}  // namespace duelnet::client
