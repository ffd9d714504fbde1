// Static playfield geometry: bounds and cell <-> continuous position mapping.
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

#include "../math/Vec2.h"

namespace Engine::Gameplay {

struct Cell {
    int x{0};
    int y{0};
};

inline bool operator==(const Cell& a, const Cell& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }

inline int manhattan(const Cell& a, const Cell& b) { return std::abs(a.x - b.x) + std::abs(a.y - b.y); }

class GridMap {
public:
    GridMap(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    std::size_t cellCount() const { return static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_); }

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }
    bool inBounds(const Cell& c) const { return inBounds(c.x, c.y); }

    // Row-major index; caller guarantees inBounds(c).
    std::size_t index(const Cell& c) const {
        return static_cast<std::size_t>(c.y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(c.x);
    }

    // Nearest cell, rounding halves away from zero.
    static Cell toCell(const Vec2& position);
    static Vec2 toPosition(const Cell& cell);

private:
    int width_;
    int height_;
};

// Per-cell flag layer sized to a grid (obstacles, visited sets).
class CellMask {
public:
    explicit CellMask(const GridMap& grid);

    void set(const Cell& c, bool value = true);
    bool test(const Cell& c) const;
    std::size_t count() const;

private:
    int width_;
    int height_;
    std::vector<std::uint8_t> bits_;
};

}  // namespace Engine::Gameplay
