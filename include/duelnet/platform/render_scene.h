#pragma once

#include <cstdint>
#include <string>

namespace duelnet::platform {

enum class RenderPotionKind : std::uint8_t {
    Health = 0,
    Mana = 1,
};

struct RenderActor final {
    float x = 0.0F;
    float y = 0.0F;
    float width = 0.0F;
    float height = 0.0F;
    float jump_offset = 0.0F;
    std::uint8_t facing = 0;
    bool visible = false;
};

struct RenderHudState final {
    int hp = 0;
    int hp_max = 0;
    int mp = 0;
    int mp_max = 0;
    int str = 0;
    int str_max = 0;
    bool waiting_for_opponent = true;
    bool link_degraded = false;
};

struct RenderScene final {
    RenderActor local_player{};
    RenderActor opponent{};
    RenderActor potion{};
    RenderPotionKind potion_kind = RenderPotionKind::Health;
    RenderHudState hud{};
    std::string title_suffix;
};

}  // namespace duelnet::platform
