#pragma once

#include "game/player.h"
#include "platform/input_actions.h"

namespace duelnet::app {

struct PlayerInputIntent final {
    game::Direction direction{};
    bool jump_pressed = false;
};

class InputCommandMapper final {
public:
    // Opposite directions held together cancel out.
    PlayerInputIntent Map(const platform::InputActions& frame_actions) const;

    // Writes direction intent and starts a jump. Returns true when a jump began.
    bool Apply(const PlayerInputIntent& intent, game::Player& player) const;
};

}  // namespace duelnet::app
