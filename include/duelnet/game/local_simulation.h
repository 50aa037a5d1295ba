#pragma once

#include "game/player.h"
#include "game/player_motion.h"
#include "game/potion.h"

#include <cstdint>
#include <optional>

namespace duelnet::game {

// Client-side world: the locally controlled player, a replicated copy of the
// opponent and the locally spawned potion.
class LocalSimulation final {
public:
    LocalSimulation(
        Player local_player,
        std::uint32_t potion_seed,
        const MotionSettings& settings = DefaultMotionSettings());

    void Step();

    Player& LocalPlayer();
    const Player& LocalPlayer() const;

    bool HasOpponent() const;
    const Player& Opponent() const;
    void ApplyOpponentState(const Player& remote);

    const Potion& CurrentPotion() const;
    std::uint64_t PickupCount() const;
    std::uint64_t StepCount() const;

private:
    MotionSettings settings_;
    Player local_player_;
    std::optional<Player> opponent_;
    PotionSpawner potion_spawner_;
    Potion potion_;
    std::uint64_t pickup_count_ = 0;
    std::uint64_t step_count_ = 0;
};

}  // namespace duelnet::game
