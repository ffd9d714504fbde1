#include "TargetingSystem.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace Game {

const Enemy* findNearestEnemy(const RoomState& state, const Engine::Vec2& from, float range) {
    const Enemy* nearest = nullptr;
    float bestDist = std::numeric_limits<float>::max();
    for (const auto& enemy : state.enemies) {
        if (!enemy.health.alive()) continue;
        const float d = Engine::distance(from, enemy.position);
        if (d <= range && d < bestDist) {
            bestDist = d;
            nearest = &enemy;
        }
    }
    return nearest;
}

int TargetingSystem::update(RoomState& state, const Engine::TimeStep& step) {
    const float dt = static_cast<float>(step.deltaSeconds);
    int shots = 0;
    for (auto& tower : state.towers) {
        tower.cooldown = std::max(0.0f, tower.cooldown - dt);

        const Engine::Vec2 origin = tower.position();
        const Enemy* target = findNearestEnemy(state, origin, tower.range);
        if (!target) {
            tower.currentTarget = 0;
            continue;
        }

        tower.currentTarget = target->id;
        const Engine::Vec2 aim = target->position - origin;
        tower.rotation = std::atan2(aim.y, aim.x);

        if (tower.cooldown > 0.0f) {
            continue;
        }

        Projectile shot;
        shot.id = state.nextProjectileId++;
        shot.position = origin;
        shot.targetId = target->id;
        shot.speed = tower.projectileSpeed;
        shot.damage = tower.damage;
        shot.towerId = tower.id;
        state.projectiles.push_back(shot);

        tower.cooldown = 1.0f / tower.fireRate;

        Effect flash;
        flash.id = state.nextEffectId++;
        flash.position = origin;
        flash.duration = settings_.muzzleFlashSeconds;
        state.muzzleFlashes.push_back(flash);
        ++shots;
    }
    return shots;
}

}  // namespace Game
