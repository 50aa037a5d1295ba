#pragma once

#include "game/player.h"
#include "game/potion.h"

namespace duelnet::game {

struct MotionSettings final {
    float move_speed = 10.0F;
    float acceleration_step = 0.2F;
    float friction_step = 0.1F;
    float max_acceleration = 1.0F;
    float min_acceleration = 0.0F;
    float jump_peak = 32.0F;
    float jump_speed = 8.0F;
    float min_jump_step = 1.0F;
    float area_width = kScreenWidth;
    float area_height = kScreenHeight;
};

const MotionSettings& DefaultMotionSettings();

// Signed modulo: maps any value into [0, extent).
float WrapCoordinate(float value, float extent);

// Starts a jump cycle. Returns false when one is already running.
bool TriggerJump(JumpState& jump);

void StepJump(JumpState& jump, const MotionSettings& settings);

void StepPlayerMotion(Player& player, const MotionSettings& settings);

// Records the potion type in player.ate on overlap, clears it otherwise.
bool TryPickup(Player& player, const Potion& potion);

}  // namespace duelnet::game
