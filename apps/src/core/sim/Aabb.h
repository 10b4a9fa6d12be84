#pragma once

namespace DashSim {

/**
 * Axis-aligned box in playfield coordinates (y grows downward).
 */
struct Aabb {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double left() const { return x; }
    double right() const { return x + width; }
    double top() const { return y; }
    double bottom() const { return y + height; }
};

/**
 * Inclusive overlap test: boxes that only touch along an edge count as overlapping.
 * Symmetric in its arguments.
 */
inline bool overlaps(const Aabb& a, const Aabb& b)
{
    return !(
        a.right() < b.left() || a.left() > b.right() || a.bottom() < b.top()
        || a.top() > b.bottom());
}

} // namespace DashSim
