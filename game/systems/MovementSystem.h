// Phase 3: enemy route following plus kill/leak bookkeeping.
#pragma once

#include "../../engine/core/Time.h"
#include "../Definitions.h"
#include "../RoomState.h"

namespace Game {

struct MovementOutcome {
    int killed{0};
    int leaked{0};
};

class MovementSystem {
public:
    explicit MovementSystem(const SimulationSettings& settings) : settings_(settings) {}

    MovementOutcome update(RoomState& state, const Engine::TimeStep& step);

private:
    // Walks the enemy along its route with a travel budget of speed * dt.
    void advance(Enemy& enemy, float dt) const;

    SimulationSettings settings_;
};

}  // namespace Game
