// Stationary defender occupying one grid cell.
#pragma once

#include <cstdint>

#include "../../engine/gameplay/GridMap.h"
#include "../../engine/math/Vec2.h"
#include "../Definitions.h"

namespace Game {

struct Tower {
    std::uint32_t id{0};
    Engine::Gameplay::Cell cell{};
    TowerType type{TowerType::Basic};
    int level{1};
    float range{0.0f};
    float damage{0.0f};
    float fireRate{1.0f};
    float projectileSpeed{8.0f};
    float rotation{0.0f};            // radians, facing the current target
    float cooldown{0.0f};            // seconds until the next shot
    std::uint32_t currentTarget{0};  // enemy id, 0 = none

    Engine::Vec2 position() const { return Engine::Gameplay::GridMap::toPosition(cell); }
};

inline Tower makeTower(std::uint32_t id, const Engine::Gameplay::Cell& cell, TowerType type) {
    const TowerDefinition& def = towerDefinition(type);
    Tower t;
    t.id = id;
    t.cell = cell;
    t.type = type;
    t.range = def.range;
    t.damage = def.damage;
    t.fireRate = def.fireRate;
    t.projectileSpeed = def.projectileSpeed;
    return t;
}

}  // namespace Game
