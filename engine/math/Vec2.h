// Minimal 2D vector for grid positions (units are cells).
#pragma once

#include <cmath>

namespace Engine {

struct Vec2 {
    float x{0.0f};
    float y{0.0f};

    Vec2() = default;
    Vec2(float xIn, float yIn) : x(xIn), y(yIn) {}

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    float length() const { return std::sqrt(x * x + y * y); }
};

inline Vec2 operator*(const Vec2& v, float scalar) { return Vec2{v.x * scalar, v.y * scalar}; }
inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }

inline float distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }

// Moves `from` toward `to` by at most `maxStep`; never passes `to`.
inline Vec2 moveTowards(const Vec2& from, const Vec2& to, float maxStep) {
    const Vec2 delta = to - from;
    const float dist = delta.length();
    if (dist <= maxStep || dist <= 0.0f) {
        return to;
    }
    return from + delta * (maxStep / dist);
}

}  // namespace Engine
