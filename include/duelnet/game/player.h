#pragma once

#include "game/potion.h"
#include "game/rect.h"

#include <cstdint>
#include <optional>
#include <string>

namespace duelnet::game {

inline constexpr float kScreenWidth = 640.0F;
inline constexpr float kScreenHeight = 480.0F;
inline constexpr float kPlayerWidth = 34.0F;
inline constexpr float kPlayerHeight = 44.0F;
inline constexpr float kPlayerSpawnX = 100.0F;
inline constexpr float kPlayerSpawnY = 100.0F;
inline constexpr int kPlayerMaxHp = 100;
inline constexpr int kPlayerMaxMp = 30;
inline constexpr int kPlayerMaxStr = 10;

struct Direction final {
    bool up = false;
    bool down = false;
    bool left = false;
    bool right = false;

    bool Any() const {
        return up || down || left || right;
    }

    bool operator==(const Direction&) const = default;
};

enum class Facing : std::uint8_t {
    Down = 0,
    Up = 1,
    Left = 2,
    Right = 3,
};

// Horizontal wins on diagonals; no intent at all faces down.
Facing FacingOf(const Direction& direction);

struct JumpState final {
    bool jumping = false;
    float offset = 0.0F;
    bool ascending = true;

    bool operator==(const JumpState&) const = default;
};

struct Player final {
    std::string name;
    Rect body{};
    Direction direction{};
    Direction last_direction{};
    float acceleration = 0.0F;
    JumpState jump{};
    int hp = kPlayerMaxHp;
    int mp = kPlayerMaxMp;
    int str = kPlayerMaxStr;
    std::optional<PotionType> ate;

    // Local animation counter, never sent over the wire.
    std::uint32_t animation_frame = 0;
};

Player MakePlayer(std::string name);

}  // namespace duelnet::game
