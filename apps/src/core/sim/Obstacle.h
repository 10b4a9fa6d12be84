#pragma once

#include "Aabb.h"

#include <string>

namespace DashSim {

struct Obstacle {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double speed = 0.0; // px/s, leftward.
    std::string color = "red"; // Presentation only.

    void update(double deltaTime) { x -= speed * deltaTime; }

    bool isOffScreen() const { return x + width < 0.0; }

    Aabb bounds() const { return Aabb{ x, y, width, height }; }
};

} // namespace DashSim
