#include "game/rect.h"

namespace duelnet::game {

bool Overlaps(const Rect& lhs, const Rect& rhs) {
    return lhs.x < rhs.x + rhs.w &&
        rhs.x < lhs.x + lhs.w &&
        lhs.y < rhs.y + rhs.h &&
        rhs.y < lhs.y + lhs.h;
}

}  // namespace duelnet::game
