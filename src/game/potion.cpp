#include "game/potion.h"

#include <algorithm>

namespace duelnet::game {

const char* PotionTypeName(PotionType type) {
    switch (type) {
        case PotionType::Health:
            return "health";
        case PotionType::Mana:
            return "mana";
    }

    return "unknown";
}

bool TryParsePotionType(std::string_view text, PotionType& out_type) {
    if (text == "health") {
        out_type = PotionType::Health;
        return true;
    }
    if (text == "mana") {
        out_type = PotionType::Mana;
        return true;
    }
    return false;
}

PotionSpawner::PotionSpawner(std::uint32_t seed, float area_width, float area_height)
    : rng_(seed),
      area_width_(area_width),
      area_height_(area_height) {}

Potion PotionSpawner::Spawn() {
    std::uniform_real_distribution<float> x_distribution(
        0.0F, std::max(0.0F, area_width_ - kPotionSize));
    std::uniform_real_distribution<float> y_distribution(
        0.0F, std::max(0.0F, area_height_ - kPotionSize));
    std::bernoulli_distribution type_distribution(0.5);

    return Potion{
        .position = Rect{
            .x = x_distribution(rng_),
            .y = y_distribution(rng_),
            .w = kPotionSize,
            .h = kPotionSize,
        },
        .type = type_distribution(rng_) ? PotionType::Mana : PotionType::Health,
    };
}

}  // namespace duelnet::game
