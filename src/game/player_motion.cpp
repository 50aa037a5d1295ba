#include "game/player_motion.h"

#include <algorithm>
#include <cmath>

namespace duelnet::game {
namespace {

float JumpStepSize(const JumpState& jump, const MotionSettings& settings) {
    if (settings.jump_peak <= 0.0F) {
        return settings.min_jump_step;
    }
    const float progress = std::clamp(jump.offset / settings.jump_peak, 0.0F, 1.0F);
    return std::max(settings.jump_speed * (1.0F - progress), settings.min_jump_step);
}

}  // namespace

const MotionSettings& DefaultMotionSettings() {
    static const MotionSettings settings{};
    return settings;
}

float WrapCoordinate(float value, float extent) {
    if (extent <= 0.0F) {
        return value;
    }
    const float wrapped = std::fmod(std::fmod(value, extent) + extent, extent);
    // fmod can round up to exactly extent for tiny negative inputs.
    return wrapped >= extent ? 0.0F : wrapped;
}

bool TriggerJump(JumpState& jump) {
    if (jump.jumping) {
        return false;
    }

    jump.jumping = true;
    jump.ascending = true;
    jump.offset = 0.0F;
    return true;
}

void StepJump(JumpState& jump, const MotionSettings& settings) {
    if (!jump.jumping) {
        return;
    }

    const float step = JumpStepSize(jump, settings);
    if (jump.ascending) {
        jump.offset += step;
        if (jump.offset >= settings.jump_peak) {
            jump.offset = settings.jump_peak;
            jump.ascending = false;
        }
        return;
    }

    jump.offset -= step;
    if (jump.offset <= 0.0F) {
        jump.offset = 0.0F;
        jump.ascending = true;
        jump.jumping = false;
    }
}

void StepPlayerMotion(Player& player, const MotionSettings& settings) {
    const bool has_intent = player.direction.Any();
    if (has_intent) {
        player.last_direction = player.direction;
        player.acceleration =
            std::min(player.acceleration + settings.acceleration_step, settings.max_acceleration);
    } else {
        player.acceleration =
            std::max(player.acceleration - settings.friction_step, settings.min_acceleration);
    }

    if (player.acceleration > 0.0F) {
        const Direction& motion = has_intent ? player.direction : player.last_direction;
        const float distance = settings.move_speed * player.acceleration;
        if (motion.up) {
            player.body.y -= distance;
        }
        if (motion.down) {
            player.body.y += distance;
        }
        if (motion.left) {
            player.body.x -= distance;
        }
        if (motion.right) {
            player.body.x += distance;
        }
        player.body.x = WrapCoordinate(player.body.x, settings.area_width);
        player.body.y = WrapCoordinate(player.body.y, settings.area_height);
        ++player.animation_frame;
    }

    StepJump(player.jump, settings);
}

bool TryPickup(Player& player, const Potion& potion) {
    if (Overlaps(player.body, potion.position)) {
        player.ate = potion.type;
        return true;
    }

    player.ate.reset();
    return false;
}

}  // namespace duelnet::game
