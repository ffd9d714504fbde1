#include "EffectSystem.h"

#include <algorithm>

namespace Game {

void EffectSystem::decay(std::vector<Effect>& effects, float dt) {
    for (auto& fx : effects) {
        fx.duration -= dt;
    }
    effects.erase(std::remove_if(effects.begin(), effects.end(), [](const Effect& fx) { return fx.duration <= 0.0f; }),
                  effects.end());
}

void EffectSystem::update(RoomState& state, const Engine::TimeStep& step) {
    const float dt = static_cast<float>(step.deltaSeconds);
    decay(state.muzzleFlashes, dt);
    decay(state.explosions, dt);
}

}  // namespace Game
