#include "app/game_app.h"

#include "app/game_loop.h"
#include "client/session_client.h"
#include "core/logger.h"

#include <random>
#include <string>
#include <system_error>
#include <utility>

namespace duelnet::app {

GameApp::GameApp() = default;

bool GameApp::Initialize(
    const std::filesystem::path& config_path,
    const ClientOverrides& overrides) {
    if (!LoadConfig(config_path, overrides)) {
        return false;
    }

    channel_ = std::make_unique<client::UdpRequestChannel>(client::UdpChannelSettings{
        .server = net::UdpEndpoint{
            .host = config_.server_host,
            .port = config_.server_port,
        },
        .reply_timeout = std::chrono::milliseconds(config_.request_timeout_ms),
    });

    std::string game_id;
    std::string error;
    if (!EnterGame(game_id, error)) {
        core::Logger::Error("app", "Could not enter a game: " + error);
        channel_.reset();
        return false;
    }

    if (!sdl_context_.Initialize(config_)) {
        core::Logger::Error("app", "SDL3 initialization failed.");
        channel_.reset();
        return false;
    }

    std::random_device seed_source;
    simulation_ = std::make_unique<game::LocalSimulation>(
        game::MakePlayer(config_.player_name),
        seed_source());
    sync_loop_ = std::make_unique<client::ClientSyncLoop>(
        *channel_,
        game_id,
        *simulation_,
        client::SyncSettingsFromConfig(config_));

    initialized_ = true;
    core::Logger::Info(
        "app",
        "Client ready: player=" + config_.player_name + ", game=" + game_id + ", server=" +
            net::EndpointToString(channel_->Settings().server));
    return true;
}

int GameApp::Run() {
    if (!initialized_) {
        return 1;
    }

    GameLoop game_loop;
    const std::uint64_t frame_count = game_loop.Run(
        [this]() {
            frame_actions_ = {};
            if (!sdl_context_.PumpEvents(quit_requested_, frame_actions_)) {
                return false;
            }
            return !quit_requested_;
        },
        [this](GameLoop::Clock::time_point now) { Update(now); },
        [this]() { Render(); });

    const client::SyncDiagnostics& diagnostics = sync_loop_->Diagnostics();
    core::Logger::Info(
        "app",
        "Session finished: frames=" + std::to_string(frame_count) +
            ", physics_ticks=" + std::to_string(diagnostics.physics_tick_count) +
            ", network_ticks=" + std::to_string(diagnostics.network_tick_count) +
            ", push_failures=" + std::to_string(diagnostics.push_failure_count) +
            ", pull_failures=" + std::to_string(diagnostics.pull_failure_count) +
            ", pickups=" + std::to_string(simulation_->PickupCount()));
    return 0;
}

void GameApp::Shutdown() {
    if (initialized_ && sync_loop_->Phase() == client::SyncPhase::Running) {
        client::SessionClient session_client(*channel_);
        std::string info;
        std::string error;
        if (session_client.EndGame(sync_loop_->GameId(), info, error)) {
            core::Logger::Info("app", info);
        } else {
            core::Logger::Warn("app", "endgame failed: " + error);
        }
    }

    sync_loop_.reset();
    simulation_.reset();
    channel_.reset();
    sdl_context_.Shutdown();
    initialized_ = false;
}

bool GameApp::LoadConfig(
    const std::filesystem::path& config_path,
    const ClientOverrides& overrides) {
    std::string config_error;
    std::error_code exists_error;
    if (!config_path.empty() && std::filesystem::exists(config_path, exists_error)) {
        if (!core::ConfigLoader::LoadClient(config_path, config_, config_error)) {
            core::Logger::Error("config", "Config load failed: " + config_error);
            return false;
        }
        core::Logger::Info("config", "Config loaded: " + config_path.string());
    } else {
        core::Logger::Info(
            "config",
            "Config file not found, using defaults: " + config_path.string());
    }

    if (overrides.player_name.has_value()) {
        config_.player_name = *overrides.player_name;
    }
    if (overrides.game_id.has_value()) {
        config_.game_id = *overrides.game_id;
    }
    if (overrides.server_host.has_value()) {
        config_.server_host = *overrides.server_host;
    }
    if (overrides.server_port.has_value()) {
        config_.server_port = *overrides.server_port;
    }

    if (!core::ConfigLoader::ValidateClient(config_, config_error)) {
        core::Logger::Error("config", "Invalid client settings: " + config_error);
        return false;
    }

    core::Logger::SetMinLevel(config_.log_level);
    return true;
}

bool GameApp::EnterGame(std::string& out_game_id, std::string& out_error) {
    client::SessionClient session_client(*channel_);

    out_game_id = config_.game_id;
    if (out_game_id.empty()) {
        if (!session_client.NewGame(out_game_id, out_error)) {
            return false;
        }
        core::Logger::Info("app", "Created game " + out_game_id);
    }

    std::string info;
    if (!session_client.JoinGame(out_game_id, config_.player_name, info, out_error)) {
        return false;
    }

    core::Logger::Info("app", info);
    out_error.clear();
    return true;
}

void GameApp::Update(client::ClientSyncLoop::Clock::time_point now) {
    const PlayerInputIntent intent = input_command_mapper_.Map(frame_actions_);
    (void)input_command_mapper_.Apply(intent, simulation_->LocalPlayer());
    sync_loop_->Tick(now);
}

void GameApp::Render() {
    sdl_context_.RenderFrame(render_scene_builder_.Build(
        *simulation_,
        sync_loop_->Phase(),
        sync_loop_->ConsecutiveFailures() > 0));
}

}  // namespace duelnet::app
