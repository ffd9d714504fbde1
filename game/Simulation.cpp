#include "Simulation.h"

#include <algorithm>
#include <utility>

#include "../engine/core/Logger.h"

namespace Game {

using Engine::Gameplay::Cell;
using Engine::Gameplay::CellMask;
using Engine::Gameplay::GridMap;
using Engine::Gameplay::Route;

Simulation::Simulation(std::string roomId, SimulationSettings settings)
    : settings_(settings),
      grid_(settings.gridWidth, settings.gridHeight),
      targeting_(settings),
      projectiles_(settings),
      movement_(settings) {
    state_.roomId = std::move(roomId);
    state_.gold = settings_.startingGold;
    state_.health = settings_.startingHealth;
    state_.wave = 1;
    state_.spawn = settings_.spawn;
    state_.goal = settings_.goal;
}

CellMask blockedCellsOf(const GridMap& grid, const std::vector<Tower>& towers) {
    CellMask blocked(grid);
    for (const auto& tower : towers) {
        blocked.set(tower.cell);
    }
    return blocked;
}

CellMask Simulation::blockedCells() const { return blockedCellsOf(grid_, state_.towers); }

std::optional<Route> Simulation::planRoute(const Cell& from) const {
    return Engine::Gameplay::findRoute(grid_, from, state_.goal, blockedCells());
}

void Simulation::replanAll() {
    const CellMask blocked = blockedCells();
    int trapped = 0;
    for (auto& enemy : state_.enemies) {
        const Cell here = GridMap::toCell(enemy.position);
        auto route = Engine::Gameplay::findRoute(grid_, here, state_.goal, blocked);
        if (route) {
            enemy.path = std::move(*route);
            enemy.pathIndex = Engine::Gameplay::nearestWaypointIndex(enemy.path, enemy.position);
            enemy.trapped = false;
        } else {
            enemy.path = Route{GridMap::toPosition(here)};
            enemy.pathIndex = 0;
            enemy.trapped = true;
            ++trapped;
        }
    }
    if (trapped > 0) {
        Engine::logDebug("Room " + state_.roomId + ": " + std::to_string(trapped) + " enemies trapped after re-plan");
    }
}

PlaceTowerResult Simulation::placeTower(const Cell& cell, TowerType type) {
    PlaceTowerResult result;
    if (!grid_.inBounds(cell)) {
        result.error = SimError::OutOfBounds;
        return result;
    }
    if (state_.findTowerAt(cell)) {
        result.error = SimError::CellOccupied;
        return result;
    }

    state_.towers.push_back(makeTower(state_.nextTowerId++, cell, type));
    result.tower = state_.towers.back();
    result.ok = true;

    replanAll();
    return result;
}

RemoveTowerResult Simulation::removeTower(const Cell& cell) {
    RemoveTowerResult result;
    if (!grid_.inBounds(cell)) {
        result.error = SimError::OutOfBounds;
        return result;
    }
    auto it = std::find_if(state_.towers.begin(), state_.towers.end(), [&](const Tower& t) { return t.cell == cell; });
    if (it == state_.towers.end()) {
        result.error = SimError::DefenderNotFound;
        return result;
    }

    result.tower = *it;
    result.ok = true;
    state_.towers.erase(it);
    const auto towerId = result.tower.id;
    state_.projectiles.erase(std::remove_if(state_.projectiles.begin(), state_.projectiles.end(),
                                            [towerId](const Projectile& p) { return p.towerId == towerId; }),
                             state_.projectiles.end());

    replanAll();
    return result;
}

SpawnEnemyResult Simulation::spawnEnemy(EnemyType type, std::optional<Route> route) {
    SpawnEnemyResult result;
    if (route) {
        if (route->empty()) {
            result.error = SimError::MalformedMessage;
            return result;
        }
        for (const auto& waypoint : *route) {
            if (!grid_.inBounds(GridMap::toCell(waypoint))) {
                result.error = SimError::MalformedMessage;
                return result;
            }
        }
    } else {
        route = planRoute(state_.spawn);
        if (!route) {
            result.error = SimError::NoRouteAvailable;
            return result;
        }
    }

    state_.enemies.push_back(makeEnemy(state_.nextEnemyId++, type, std::move(*route)));
    result.enemy = state_.enemies.back();
    result.ok = true;
    return result;
}

void Simulation::clearAll() {
    state_.towers.clear();
    state_.enemies.clear();
    state_.projectiles.clear();
    state_.muzzleFlashes.clear();
    state_.explosions.clear();
}

bool Simulation::togglePaused() {
    state_.paused = !state_.paused;
    return state_.paused;
}

bool Simulation::addMember(const std::string& memberId) {
    auto& players = state_.players;
    if (std::find(players.begin(), players.end(), memberId) != players.end()) {
        return false;
    }
    players.push_back(memberId);
    return true;
}

bool Simulation::removeMember(const std::string& memberId) {
    auto& players = state_.players;
    auto it = std::find(players.begin(), players.end(), memberId);
    if (it == players.end()) {
        return false;
    }
    players.erase(it);
    return true;
}

TickReport Simulation::tick(const Engine::TimeStep& step) {
    TickReport report;
    if (state_.paused) {
        return report;
    }
    report.ran = true;
    report.shots = targeting_.update(state_, step);
    report.hits = projectiles_.update(state_, step);
    const MovementOutcome moved = movement_.update(state_, step);
    report.killed = moved.killed;
    report.leaked = moved.leaked;
    effects_.update(state_, step);
    state_.gameTime += step.deltaSeconds;
    return report;
}

}  // namespace Game
