// Authoritative per-room simulation: command surface plus the fixed tick.
//
// Not thread-safe. A Room's tick driver is the only caller once the room is
// running; everything else reaches it through the room's command queue.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../engine/core/Time.h"
#include "../engine/gameplay/GridMap.h"
#include "../engine/gameplay/PathPlanner.h"
#include "Definitions.h"
#include "RoomState.h"
#include "SimError.h"
#include "systems/EffectSystem.h"
#include "systems/MovementSystem.h"
#include "systems/ProjectileSystem.h"
#include "systems/TargetingSystem.h"

namespace Game {

struct PlaceTowerResult {
    bool ok{false};
    SimError error{SimError::None};
    Tower tower{};
};

struct RemoveTowerResult {
    bool ok{false};
    SimError error{SimError::None};
    Tower tower{};
};

struct SpawnEnemyResult {
    bool ok{false};
    SimError error{SimError::None};
    Enemy enemy{};
};

// Obstacle layer for the planner: every tower cell.
Engine::Gameplay::CellMask blockedCellsOf(const Engine::Gameplay::GridMap& grid, const std::vector<Tower>& towers);

// What one tick did; used for diagnostics only.
struct TickReport {
    bool ran{false};
    int shots{0};
    int hits{0};
    int killed{0};
    int leaked{0};
};

class Simulation {
public:
    explicit Simulation(std::string roomId, SimulationSettings settings = {});

    PlaceTowerResult placeTower(const Engine::Gameplay::Cell& cell, TowerType type);
    RemoveTowerResult removeTower(const Engine::Gameplay::Cell& cell);
    // Without a route one is planned from spawn to goal.
    SpawnEnemyResult spawnEnemy(EnemyType type, std::optional<Engine::Gameplay::Route> route = std::nullopt);
    void clearAll();

    void setPaused(bool paused) { state_.paused = paused; }
    bool togglePaused();
    bool paused() const { return state_.paused; }

    bool addMember(const std::string& memberId);
    bool removeMember(const std::string& memberId);

    // Runs phases 1-5 unless paused.
    TickReport tick(const Engine::TimeStep& step);

    // Re-routes every enemy after an obstacle change.
    void replanAll();
    std::optional<Engine::Gameplay::Route> planRoute(const Engine::Gameplay::Cell& from) const;
    Engine::Gameplay::CellMask blockedCells() const;

    const RoomState& state() const { return state_; }
    RoomState snapshot() const { return state_; }
    const Engine::Gameplay::GridMap& grid() const { return grid_; }
    const SimulationSettings& settings() const { return settings_; }

private:
    SimulationSettings settings_;
    Engine::Gameplay::GridMap grid_;
    RoomState state_{};

    TargetingSystem targeting_;
    ProjectileSystem projectiles_;
    MovementSystem movement_;
    EffectSystem effects_{};
};

}  // namespace Game
