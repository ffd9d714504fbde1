#include "GridMap.h"

#include <algorithm>
#include <cmath>

namespace Engine::Gameplay {

GridMap::GridMap(int width, int height) : width_(std::max(1, width)), height_(std::max(1, height)) {}

Cell GridMap::toCell(const Vec2& position) {
    return Cell{static_cast<int>(std::lround(position.x)), static_cast<int>(std::lround(position.y))};
}

Vec2 GridMap::toPosition(const Cell& cell) { return Vec2{static_cast<float>(cell.x), static_cast<float>(cell.y)}; }

CellMask::CellMask(const GridMap& grid)
    : width_(grid.width()), height_(grid.height()), bits_(grid.cellCount(), 0) {}

void CellMask::set(const Cell& c, bool value) {
    if (c.x < 0 || c.y < 0 || c.x >= width_ || c.y >= height_) {
        return;
    }
    bits_[static_cast<std::size_t>(c.y * width_ + c.x)] = value ? 1 : 0;
}

bool CellMask::test(const Cell& c) const {
    if (c.x < 0 || c.y < 0 || c.x >= width_ || c.y >= height_) {
        return false;
    }
    return bits_[static_cast<std::size_t>(c.y * width_ + c.x)] != 0;
}

std::size_t CellMask::count() const {
    return static_cast<std::size_t>(std::count(bits_.begin(), bits_.end(), std::uint8_t{1}));
}

}  // namespace Engine::Gameplay
