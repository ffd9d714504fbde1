// Aggregate state of one room; the unit a snapshot serializes.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../engine/gameplay/GridMap.h"
#include "components/Effect.h"
#include "components/Enemy.h"
#include "components/Projectile.h"
#include "components/Tower.h"

namespace Game {

struct RoomState {
    std::string roomId;
    std::vector<std::string> players;

    std::vector<Tower> towers;
    std::vector<Enemy> enemies;
    std::vector<Projectile> projectiles;
    std::vector<Effect> muzzleFlashes;
    std::vector<Effect> explosions;

    int gold{0};
    int health{0};
    int wave{1};
    double gameTime{0.0};
    bool paused{false};

    Engine::Gameplay::Cell spawn{};
    Engine::Gameplay::Cell goal{};

    std::uint32_t nextTowerId{1};
    std::uint32_t nextEnemyId{1};
    std::uint32_t nextProjectileId{1};
    std::uint32_t nextEffectId{1};

    Enemy* findEnemy(std::uint32_t id);
    const Enemy* findEnemy(std::uint32_t id) const;
    Tower* findTowerAt(const Engine::Gameplay::Cell& cell);
    const Tower* findTowerAt(const Engine::Gameplay::Cell& cell) const;
};

inline Enemy* RoomState::findEnemy(std::uint32_t id) {
    for (auto& e : enemies) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

inline const Enemy* RoomState::findEnemy(std::uint32_t id) const {
    for (const auto& e : enemies) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

inline Tower* RoomState::findTowerAt(const Engine::Gameplay::Cell& cell) {
    for (auto& t : towers) {
        if (t.cell == cell) return &t;
    }
    return nullptr;
}

inline const Tower* RoomState::findTowerAt(const Engine::Gameplay::Cell& cell) const {
    for (const auto& t : towers) {
        if (t.cell == cell) return &t;
    }
    return nullptr;
}

}  // namespace Game
