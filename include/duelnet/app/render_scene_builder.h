#pragma once

#include "client/sync_loop.h"
#include "game/local_simulation.h"
#include "platform/render_scene.h"

namespace duelnet::app {

class RenderSceneBuilder final {
public:
    platform::RenderScene Build(
        const game::LocalSimulation& simulation,
        client::SyncPhase phase,
        bool link_degraded) const;
};

}  // namespace duelnet::app
