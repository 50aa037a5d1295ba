#pragma once

namespace duelnet::platform {

struct InputActions final {
    bool move_left = false;
    bool move_right = false;
    bool move_up = false;
    bool move_down = false;
    bool jump_pressed = false;
};

}  // namespace duelnet::platform
