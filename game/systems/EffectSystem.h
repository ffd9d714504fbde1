// Phase 4: muzzle flash and explosion decay.
#pragma once

#include <vector>

#include "../../engine/core/Time.h"
#include "../RoomState.h"

namespace Game {

class EffectSystem {
public:
    void update(RoomState& state, const Engine::TimeStep& step);

private:
    static void decay(std::vector<Effect>& effects, float dt);
};

}  // namespace Game
