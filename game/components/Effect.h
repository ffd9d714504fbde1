// Short-lived visual marker (muzzle flash, impact burst).
#pragma once

#include <cstdint>

#include "../../engine/math/Vec2.h"

namespace Game {

struct Effect {
    std::uint32_t id{0};
    Engine::Vec2 position{};
    float duration{0.0f};  // seconds remaining
    float radius{0.0f};    // impact bursts only
};

}  // namespace Game
