#include "PathPlanner.h"

#include <algorithm>
#include <deque>
#include <limits>

namespace Engine::Gameplay {

namespace {
constexpr int kNoParent = -1;
}

std::optional<Route> findRoute(const GridMap& grid, const Cell& start, const Cell& goal, const CellMask& blocked) {
    if (!grid.inBounds(start) || !grid.inBounds(goal)) {
        return std::nullopt;
    }

    const std::size_t total = grid.cellCount();
    std::vector<int> parent(total, kNoParent);
    CellMask visited(grid);
    std::deque<Cell> frontier;

    visited.set(start);
    frontier.push_back(start);

    bool reached = false;
    while (!frontier.empty()) {
        const Cell current = frontier.front();
        frontier.pop_front();

        if (current == goal) {
            reached = true;
            break;
        }

        for (const Cell& offset : kNeighbourOffsets) {
            const Cell next{current.x + offset.x, current.y + offset.y};
            if (!grid.inBounds(next)) {
                continue;
            }
            if (blocked.test(next) || visited.test(next)) {
                continue;
            }
            visited.set(next);
            parent[grid.index(next)] = static_cast<int>(grid.index(current));
            frontier.push_back(next);
        }
    }

    if (!reached) {
        return std::nullopt;
    }

    Route route;
    int idx = static_cast<int>(grid.index(goal));
    const int startIdx = static_cast<int>(grid.index(start));
    while (true) {
        const Cell c{idx % grid.width(), idx / grid.width()};
        route.push_back(GridMap::toPosition(c));
        if (idx == startIdx) {
            break;
        }
        idx = parent[static_cast<std::size_t>(idx)];
    }
    std::reverse(route.begin(), route.end());
    return route;
}

std::size_t nearestWaypointIndex(const Route& route, const Vec2& position) {
    std::size_t best = 0;
    float bestDist = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < route.size(); ++i) {
        const float d = distance(route[i], position);
        if (d < bestDist) {
            bestDist = d;
            best = i;
        }
    }
    return best;
}

}  // namespace Engine::Gameplay
