// Breadth-first route search on the 4-connected grid.
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "../math/Vec2.h"
#include "GridMap.h"

namespace Engine::Gameplay {

// Ordered waypoints, start and goal included. Length in steps is size() - 1.
using Route = std::vector<Vec2>;

// Neighbour expansion order; fixed so equal-length routes are reproducible.
constexpr Cell kNeighbourOffsets[4] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

// Returns std::nullopt when the goal is unreachable. That is a normal
// planning outcome (the caller decides whether it means "trapped" or
// "cannot spawn"), not a failure.
// The start cell is never treated as blocked so a unit standing on a freshly
// occupied cell can still walk off it.
std::optional<Route> findRoute(const GridMap& grid, const Cell& start, const Cell& goal, const CellMask& blocked);

// Index of the waypoint closest to `position`; earliest index wins ties.
// Returns 0 for an empty route.
std::size_t nearestWaypointIndex(const Route& route, const Vec2& position);

}  // namespace Engine::Gameplay
