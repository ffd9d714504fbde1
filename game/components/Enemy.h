// Mobile hostile walking a planned route from spawn to goal.
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

#include "../../engine/gameplay/Combat.h"
#include "../../engine/gameplay/PathPlanner.h"
#include "../../engine/math/Vec2.h"
#include "../Definitions.h"

namespace Game {

struct Enemy {
    std::uint32_t id{0};
    Engine::Vec2 position{};
    EnemyType type{EnemyType::Basic};
    Engine::Gameplay::UnitHealth health{};
    float speed{0.0f};
    Engine::Gameplay::Route path{};
    std::size_t pathIndex{0};  // next unvisited waypoint
    // Route is a single hold waypoint because the goal is walled off.
    bool trapped{false};

    bool routeExhausted() const { return pathIndex >= path.size(); }
};

inline Enemy makeEnemy(std::uint32_t id, EnemyType type, Engine::Gameplay::Route route) {
    const EnemyDefinition& def = enemyDefinition(type);
    Enemy e;
    e.id = id;
    e.type = type;
    e.health = Engine::Gameplay::makeHealth(def.health);
    e.speed = def.speed;
    e.path = std::move(route);
    if (!e.path.empty()) {
        e.position = e.path.front();
    }
    return e;
}

}  // namespace Game
