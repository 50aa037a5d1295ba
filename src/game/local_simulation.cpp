#include "game/local_simulation.h"

#include "core/logger.h"

#include <string>
#include <utility>

namespace duelnet::game {

LocalSimulation::LocalSimulation(
    Player local_player,
    std::uint32_t potion_seed,
    const MotionSettings& settings)
    : settings_(settings),
      local_player_(std::move(local_player)),
      potion_spawner_(potion_seed, settings.area_width, settings.area_height),
      potion_(potion_spawner_.Spawn()) {}

void LocalSimulation::Step() {
    ++step_count_;
    StepPlayerMotion(local_player_, settings_);

    if (TryPickup(local_player_, potion_)) {
        ++pickup_count_;
        core::Logger::Debug(
            "game",
            local_player_.name + " picked up " + PotionTypeName(potion_.type) + " potion");
        potion_ = potion_spawner_.Spawn();
    }

    if (opponent_.has_value()) {
        StepJump(opponent_->jump, settings_);
    }
}

Player& LocalSimulation::LocalPlayer() {
    return local_player_;
}

const Player& LocalSimulation::LocalPlayer() const {
    return local_player_;
}

bool LocalSimulation::HasOpponent() const {
    return opponent_.has_value();
}

const Player& LocalSimulation::Opponent() const {
    return *opponent_;
}

void LocalSimulation::ApplyOpponentState(const Player& remote) {
    if (!opponent_.has_value()) {
        opponent_ = MakePlayer(remote.name);
        core::Logger::Info("game", "Opponent joined the local view: " + remote.name);
    }

    Player& opponent = *opponent_;
    opponent.name = remote.name;
    opponent.body = remote.body;
    opponent.direction = remote.direction;
    opponent.last_direction = remote.last_direction;
    if (remote.jump.jumping && !opponent.jump.jumping) {
        (void)TriggerJump(opponent.jump);
    } else if (!remote.jump.jumping) {
        opponent.jump = JumpState{};
    }
}

const Potion& LocalSimulation::CurrentPotion() const {
    return potion_;
}

std::uint64_t LocalSimulation::PickupCount() const {
    return pickup_count_;
}

std::uint64_t LocalSimulation::StepCount() const {
    return step_count_;
}

}  // namespace duelnet::game
