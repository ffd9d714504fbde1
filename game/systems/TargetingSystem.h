// Phase 1: tower cooldowns, target acquisition, aiming and firing.
#pragma once

#include "../../engine/core/Time.h"
#include "../Definitions.h"
#include "../RoomState.h"

namespace Game {

class TargetingSystem {
public:
    explicit TargetingSystem(const SimulationSettings& settings) : settings_(settings) {}

    // Returns the number of shots fired this tick.
    int update(RoomState& state, const Engine::TimeStep& step);

private:
    SimulationSettings settings_;
};

// Nearest living enemy within `range` of `from`; the earliest in the list wins
// an exact distance tie. Returns nullptr when none qualifies.
const Enemy* findNearestEnemy(const RoomState& state, const Engine::Vec2& from, float range);

}  // namespace Game
