// Fixed-step time carrier handed to every simulation phase.
#pragma once

#include <cstdint>

namespace Engine {

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};
    std::uint64_t tick{0};
};

inline TimeStep advance(const TimeStep& prev, double deltaSeconds) {
    return TimeStep{deltaSeconds, prev.elapsedSeconds + deltaSeconds, prev.tick + 1};
}

}  // namespace Engine
