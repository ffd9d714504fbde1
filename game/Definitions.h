// Closed tower/enemy categories, their base stats, and room-wide tuning.
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "../engine/gameplay/GridMap.h"

namespace Game {

enum class TowerType { Basic, Sniper, Splash, Slow };
constexpr std::size_t kTowerTypeCount = 4;

enum class EnemyType { Basic, Fast, Tank, Flying, Boss };
constexpr std::size_t kEnemyTypeCount = 5;

struct TowerDefinition {
    TowerType type{TowerType::Basic};
    std::string_view id;
    float range{0.0f};            // cells
    float damage{0.0f};
    float fireRate{1.0f};         // shots per second
    float projectileSpeed{8.0f};  // cells per second
};

struct EnemyDefinition {
    EnemyType type{EnemyType::Basic};
    std::string_view id;
    float health{0.0f};
    float speed{0.0f};  // cells per second
};

const TowerDefinition& towerDefinition(TowerType type);
const EnemyDefinition& enemyDefinition(EnemyType type);

// Wire names are lowercase ids ("basic", "sniper", ...). Unknown names
// return std::nullopt; there is no fallback category.
std::optional<TowerType> parseTowerType(std::string_view id);
std::optional<EnemyType> parseEnemyType(std::string_view id);
std::string_view toString(TowerType type);
std::string_view toString(EnemyType type);

struct SimulationSettings {
    int gridWidth{20};
    int gridHeight{15};
    Engine::Gameplay::Cell spawn{0, 7};
    Engine::Gameplay::Cell goal{19, 7};

    int startingGold{200};
    int startingHealth{100};
    int killReward{10};
    int leakPenalty{10};

    float hitRadius{0.3f};
    float arrivalEpsilon{0.1f};
    float muzzleFlashSeconds{0.1f};
    float explosionSeconds{0.3f};
    float explosionRadius{0.5f};
};

}  // namespace Game
