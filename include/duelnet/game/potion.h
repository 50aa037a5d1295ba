#pragma once

#include "game/rect.h"

#include <cstdint>
#include <random>
#include <string_view>

namespace duelnet::game {

inline constexpr float kPotionSize = 32.0F;

enum class PotionType : std::uint8_t {
    Health = 0,
    Mana = 1,
};

const char* PotionTypeName(PotionType type);
bool TryParsePotionType(std::string_view text, PotionType& out_type);

struct Potion final {
    Rect position{};
    PotionType type = PotionType::Health;
};

class PotionSpawner final {
public:
    PotionSpawner(std::uint32_t seed, float area_width, float area_height);

    Potion Spawn();

private:
    std::mt19937 rng_;
    float area_width_ = 0.0F;
    float area_height_ = 0.0F;
};

}  // namespace duelnet::game
