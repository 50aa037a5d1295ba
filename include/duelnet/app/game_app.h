#pragma once

#include "app/input_command_mapper.h"
#include "app/render_scene_builder.h"
#include "client/request_channel.h"
#include "client/sync_loop.h"
#include "core/config.h"
#include "game/local_simulation.h"
#include "platform/input_actions.h"
#include "platform/sdl_context.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace duelnet::app {

// Command-line values that win over the config file.
struct ClientOverrides final {
    std::optional<std::string> player_name;
    std::optional<std::string> game_id;
    std::optional<std::string> server_host;
    std::optional<std::uint16_t> server_port;
};

class GameApp final {
public:
    GameApp();

    bool Initialize(const std::filesystem::path& config_path, const ClientOverrides& overrides);
    int Run();
    void Shutdown();

private:
    bool LoadConfig(const std::filesystem::path& config_path, const ClientOverrides& overrides);
    bool EnterGame(std::string& out_game_id, std::string& out_error);
    void Update(client::ClientSyncLoop::Clock::time_point now);
    void Render();

    bool initialized_ = false;
    bool quit_requested_ = false;
    core::ClientConfig config_;
    platform::SdlContext sdl_context_;
    platform::InputActions frame_actions_;
    std::unique_ptr<client::UdpRequestChannel> channel_;
    std::unique_ptr<game::LocalSimulation> simulation_;
    std::unique_ptr<client::ClientSyncLoop> sync_loop_;
    InputCommandMapper input_command_mapper_;
    RenderSceneBuilder render_scene_builder_;
};

}  // namespace duelnet::app
