// Grid bounds and breadth-first route planning.
#undef NDEBUG
#include <cassert>
#include <cmath>

#include "../engine/gameplay/GridMap.h"
#include "../engine/gameplay/PathPlanner.h"

using namespace Engine::Gameplay;
using Engine::Vec2;

namespace {
bool routeVisits(const Route& route, const Cell& cell) {
    for (const auto& p : route) {
        if (GridMap::toCell(p) == cell) return true;
    }
    return false;
}

bool routeIsContiguous(const Route& route) {
    for (std::size_t i = 1; i < route.size(); ++i) {
        if (manhattan(GridMap::toCell(route[i - 1]), GridMap::toCell(route[i])) != 1) return false;
    }
    return true;
}
}  // namespace

int main() {
    GridMap grid(20, 15);
    {
        assert(grid.inBounds(0, 0));
        assert(grid.inBounds(19, 14));
        assert(!grid.inBounds(20, 0));
        assert(!grid.inBounds(0, -1));
        assert(GridMap::toCell(Vec2{4.6f, 6.4f}) == (Cell{5, 6}));
        CellMask mask(grid);
        mask.set(Cell{3, 3});
        mask.set(Cell{99, 3});  // ignored
        assert(mask.test(Cell{3, 3}));
        assert(!mask.test(Cell{-1, 3}));
        assert(mask.count() == 1);
    }
    {
        // Open field: straight line, one waypoint per cell.
        CellMask blocked(grid);
        auto route = findRoute(grid, Cell{0, 7}, Cell{19, 7}, blocked);
        assert(route);
        assert(route->size() == 20);
        for (std::size_t i = 0; i < route->size(); ++i) {
            assert((*route)[i] == (Vec2{static_cast<float>(i), 7.0f}));
        }
    }
    {
        CellMask blocked(grid);
        const Cell from{2, 3};
        const Cell to{10, 12};
        auto route = findRoute(grid, from, to, blocked);
        assert(route);
        assert(route->size() == static_cast<std::size_t>(manhattan(from, to) + 1));
        assert(GridMap::toCell(route->front()) == from);
        assert(GridMap::toCell(route->back()) == to);
        assert(routeIsContiguous(*route));
    }
    {
        // A single obstacle on the straight line costs a two-step detour.
        CellMask blocked(grid);
        blocked.set(Cell{5, 7});
        auto route = findRoute(grid, Cell{0, 7}, Cell{19, 7}, blocked);
        assert(route);
        assert(route->size() == 22);
        assert(!routeVisits(*route, Cell{5, 7}));
        assert(routeIsContiguous(*route));
    }
    {
        // Full wall across the grid.
        CellMask blocked(grid);
        for (int y = 0; y < grid.height(); ++y) blocked.set(Cell{10, y});
        assert(!findRoute(grid, Cell{0, 7}, Cell{19, 7}, blocked));
    }
    {
        // Enclosed goal.
        CellMask blocked(grid);
        blocked.set(Cell{18, 7});
        blocked.set(Cell{19, 6});
        blocked.set(Cell{19, 8});
        assert(!findRoute(grid, Cell{0, 7}, Cell{19, 7}, blocked));
    }
    {
        // The start cell may be occupied; the unit can still walk off it.
        CellMask blocked(grid);
        blocked.set(Cell{0, 7});
        auto route = findRoute(grid, Cell{0, 7}, Cell{19, 7}, blocked);
        assert(route && route->size() == 20);
    }
    {
        CellMask blocked(grid);
        assert(!findRoute(grid, Cell{-1, 7}, Cell{19, 7}, blocked));
        assert(!findRoute(grid, Cell{0, 7}, Cell{19, 15}, blocked));
        auto same = findRoute(grid, Cell{4, 4}, Cell{4, 4}, blocked);
        assert(same && same->size() == 1);
    }
    {
        Route route{{0, 7}, {1, 7}, {2, 7}, {3, 7}};
        assert(nearestWaypointIndex(route, Vec2{2.4f, 7.0f}) == 2);
        // Exact tie: the earlier waypoint wins.
        assert(nearestWaypointIndex(route, Vec2{1.5f, 7.0f}) == 1);
        assert(nearestWaypointIndex(Route{}, Vec2{1.0f, 1.0f}) == 0);
    }
    {
        // Whole-route search: a later waypoint that doubles back can be nearest.
        Route route{{0, 0}, {1, 0}, {2, 0}, {2, 1}, {1, 1}, {0, 1}};
        assert(nearestWaypointIndex(route, Vec2{0.9f, 0.6f}) == 4);
    }
    return 0;
}
