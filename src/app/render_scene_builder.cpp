#include "app/render_scene_builder.h"

#include <cstdint>
#include <string>

namespace duelnet::app {
namespace {

platform::RenderActor ToRenderActor(const game::Player& player) {
    const game::Direction& facing_source =
        player.direction.Any() ? player.direction : player.last_direction;
    return platform::RenderActor{
        .x = player.body.x,
        .y = player.body.y,
        .width = player.body.w,
        .height = player.body.h,
        .jump_offset = player.jump.jumping ? player.jump.offset : 0.0F,
        .facing = static_cast<std::uint8_t>(game::FacingOf(facing_source)),
        .visible = true,
    };
}

}  // namespace

platform::RenderScene RenderSceneBuilder::Build(
    const game::LocalSimulation& simulation,
    client::SyncPhase phase,
    bool link_degraded) const {
    const game::Player& local = simulation.LocalPlayer();
    const game::Potion& potion = simulation.CurrentPotion();

    platform::RenderScene scene{};
    scene.local_player = ToRenderActor(local);
    if (simulation.HasOpponent()) {
        scene.opponent = ToRenderActor(simulation.Opponent());
    }
    scene.potion = platform::RenderActor{
        .x = potion.position.x,
        .y = potion.position.y,
        .width = potion.position.w,
        .height = potion.position.h,
        .visible = true,
    };
    scene.potion_kind = potion.type == game::PotionType::Mana
        ? platform::RenderPotionKind::Mana
        : platform::RenderPotionKind::Health;

    scene.hud = platform::RenderHudState{
        .hp = local.hp,
        .hp_max = game::kPlayerMaxHp,
        .mp = local.mp,
        .mp_max = game::kPlayerMaxMp,
        .str = local.str,
        .str_max = game::kPlayerMaxStr,
        .waiting_for_opponent = phase == client::SyncPhase::WaitingForStart,
        .link_degraded = link_degraded,
    };

    if (phase == client::SyncPhase::WaitingForStart) {
        scene.title_suffix = local.name + " (waiting for opponent)";
    } else if (simulation.HasOpponent()) {
        scene.title_suffix = local.name + " vs " + simulation.Opponent().name;
    } else {
        scene.title_suffix = local.name;
    }
    return scene;
}

}  // namespace duelnet::app
