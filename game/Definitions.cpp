#include "Definitions.h"

#include <array>

namespace Game {

namespace {
// Indexed by enum value; order must match the enum declarations.
constexpr std::array<TowerDefinition, kTowerTypeCount> kTowers{{
    {TowerType::Basic, "basic", 3.0f, 15.0f, 1.0f, 8.0f},
    {TowerType::Sniper, "sniper", 6.0f, 50.0f, 0.5f, 12.0f},
    {TowerType::Splash, "splash", 2.5f, 10.0f, 1.5f, 8.0f},
    {TowerType::Slow, "slow", 3.5f, 8.0f, 0.8f, 8.0f},
}};

constexpr std::array<EnemyDefinition, kEnemyTypeCount> kEnemies{{
    {EnemyType::Basic, "basic", 100.0f, 2.0f},
    {EnemyType::Fast, "fast", 50.0f, 4.0f},
    {EnemyType::Tank, "tank", 300.0f, 1.0f},
    {EnemyType::Flying, "flying", 80.0f, 3.0f},
    {EnemyType::Boss, "boss", 1000.0f, 0.5f},
}};

template <typename Defs>
constexpr bool orderedByType(const Defs& defs) {
    for (std::size_t i = 0; i < defs.size(); ++i) {
        if (static_cast<std::size_t>(defs[i].type) != i) return false;
    }
    return true;
}

static_assert(orderedByType(kTowers), "tower table out of enum order");
static_assert(orderedByType(kEnemies), "enemy table out of enum order");
}  // namespace

const TowerDefinition& towerDefinition(TowerType type) { return kTowers[static_cast<std::size_t>(type)]; }
const EnemyDefinition& enemyDefinition(EnemyType type) { return kEnemies[static_cast<std::size_t>(type)]; }

std::optional<TowerType> parseTowerType(std::string_view id) {
    for (const auto& def : kTowers) {
        if (def.id == id) return def.type;
    }
    return std::nullopt;
}

std::optional<EnemyType> parseEnemyType(std::string_view id) {
    for (const auto& def : kEnemies) {
        if (def.id == id) return def.type;
    }
    return std::nullopt;
}

std::string_view toString(TowerType type) { return towerDefinition(type).id; }
std::string_view toString(EnemyType type) { return enemyDefinition(type).id; }

}  // namespace Game
