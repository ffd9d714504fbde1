#include "ProjectileSystem.h"

#include <utility>
#include <vector>

#include "../../engine/gameplay/Combat.h"

namespace Game {

int ProjectileSystem::update(RoomState& state, const Engine::TimeStep& step) {
    const float dt = static_cast<float>(step.deltaSeconds);
    int hits = 0;
    std::vector<Projectile> inFlight;
    inFlight.reserve(state.projectiles.size());

    for (auto& proj : state.projectiles) {
        Enemy* target = state.findEnemy(proj.targetId);
        if (!target) {
            continue;  // target gone: discard, never retarget
        }

        const float dist = Engine::distance(proj.position, target->position);
        if (dist < settings_.hitRadius) {
            Engine::Gameplay::applyDamage(target->health, Engine::Gameplay::DamageEvent{proj.damage});

            Effect burst;
            burst.id = state.nextEffectId++;
            burst.position = proj.position;
            burst.duration = settings_.explosionSeconds;
            burst.radius = settings_.explosionRadius;
            state.explosions.push_back(burst);
            ++hits;
            continue;
        }

        proj.position = Engine::moveTowards(proj.position, target->position, proj.speed * dt);
        inFlight.push_back(proj);
    }

    state.projectiles = std::move(inFlight);
    return hits;
}

}  // namespace Game
