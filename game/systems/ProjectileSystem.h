// Phase 2: homing projectile flight and hit resolution.
#pragma once

#include "../../engine/core/Time.h"
#include "../Definitions.h"
#include "../RoomState.h"

namespace Game {

class ProjectileSystem {
public:
    explicit ProjectileSystem(const SimulationSettings& settings) : settings_(settings) {}

    // Returns the number of hits landed this tick.
    int update(RoomState& state, const Engine::TimeStep& step);

private:
    SimulationSettings settings_;
};

}  // namespace Game
