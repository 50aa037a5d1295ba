#include "app/input_command_mapper.h"

#include "game/player_motion.h"

namespace duelnet::app {

PlayerInputIntent InputCommandMapper::Map(const platform::InputActions& frame_actions) const {
    PlayerInputIntent intent{
        .direction = game::Direction{
            .up = frame_actions.move_up,
            .down = frame_actions.move_down,
            .left = frame_actions.move_left,
            .right = frame_actions.move_right,
        },
        .jump_pressed = frame_actions.jump_pressed,
    };

    if (intent.direction.left && intent.direction.right) {
        intent.direction.left = false;
        intent.direction.right = false;
    }
    if (intent.direction.up && intent.direction.down) {
        intent.direction.up = false;
        intent.direction.down = false;
    }

    return intent;
}

bool InputCommandMapper::Apply(const PlayerInputIntent& intent, game::Player& player) const {
    player.direction = intent.direction;
    if (!intent.jump_pressed) {
        return false;
    }
    return game::TriggerJump(player.jump);
}

}  // namespace duelnet::app
