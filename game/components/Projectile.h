// Homing shot locked onto a single enemy until it hits or the enemy is gone.
#pragma once

#include <cstdint>

#include "../../engine/math/Vec2.h"

namespace Game {

struct Projectile {
    std::uint32_t id{0};
    Engine::Vec2 position{};
    std::uint32_t targetId{0};
    float speed{8.0f};  // cells per second
    float damage{0.0f};
    std::uint32_t towerId{0};
};

}  // namespace Game
