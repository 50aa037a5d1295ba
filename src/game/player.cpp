#include "game/player.h"

#include <utility>

namespace duelnet::game {

Facing FacingOf(const Direction& direction) {
    if (direction.left) {
        return Facing::Left;
    }
    if (direction.right) {
        return Facing::Right;
    }
    if (direction.up) {
        return Facing::Up;
    }
    return Facing::Down;
}

Player MakePlayer(std::string name) {
    Player player{};
    player.name = std::move(name);
    player.body = Rect{
        .x = kPlayerSpawnX,
        .y = kPlayerSpawnY,
        .w = kPlayerWidth,
        .h = kPlayerHeight,
    };
    return player;
}

}  // namespace duelnet::game
