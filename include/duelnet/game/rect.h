#pragma once

namespace duelnet::game {

struct Rect final {
    float x = 0.0F;
    float y = 0.0F;
    float w = 0.0F;
    float h = 0.0F;

    bool operator==(const Rect&) const = default;
};

// Touching edges do not count as overlap.
bool Overlaps(const Rect& lhs, const Rect& rhs);

}  // namespace duelnet::game
