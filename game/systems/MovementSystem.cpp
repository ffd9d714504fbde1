#include "MovementSystem.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace Game {

void MovementSystem::advance(Enemy& enemy, float dt) const {
    float budget = enemy.speed * dt;

    if (enemy.trapped) {
        // Hold on the single waypoint; never advance past it.
        if (!enemy.path.empty()) {
            enemy.position = Engine::moveTowards(enemy.position, enemy.path.front(), budget);
        }
        return;
    }

    while (!enemy.routeExhausted()) {
        const Engine::Vec2& waypoint = enemy.path[enemy.pathIndex];
        const float dist = Engine::distance(enemy.position, waypoint);
        if (dist < settings_.arrivalEpsilon) {
            enemy.position = waypoint;
            ++enemy.pathIndex;
            continue;
        }
        if (budget <= 0.0f) {
            break;
        }
        const float step = std::min(budget, dist);
        enemy.position = Engine::moveTowards(enemy.position, waypoint, step);
        budget -= step;
    }
}

MovementOutcome MovementSystem::update(RoomState& state, const Engine::TimeStep& step) {
    const float dt = static_cast<float>(step.deltaSeconds);
    MovementOutcome outcome;
    std::vector<Enemy> remaining;
    remaining.reserve(state.enemies.size());

    for (auto& enemy : state.enemies) {
        // Death is checked first: a unit killed on its final step pays out
        // the reward, not the leak penalty.
        if (enemy.health.isDead()) {
            state.gold += settings_.killReward;
            ++outcome.killed;
            continue;
        }

        advance(enemy, dt);

        if (!enemy.trapped && enemy.routeExhausted()) {
            state.health -= settings_.leakPenalty;
            ++outcome.leaked;
            continue;
        }
        remaining.push_back(std::move(enemy));
    }

    state.enemies = std::move(remaining);
    return outcome;
}

}  // namespace Game
