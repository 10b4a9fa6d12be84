#pragma once

#include "Aabb.h"

namespace DashSim {

struct EpisodeConfig;

/**
 * The player square. Only moves vertically; obstacles scroll past it.
 */
struct Agent {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double velocityY = 0.0;
    bool grounded = false;

    // Spawned centered horizontally, hovering agentSpawnClearance above the ground.
    static Agent spawn(const EpisodeConfig& config);

    // Gravity integration and ground clamp for one fixed step.
    void applyPhysics(double deltaTime, double gravity, double groundY);

    // Returns false (and does nothing) when airborne.
    bool jump(double impulse);

    Aabb bounds() const { return Aabb{ x, y, width, height }; }
};

} // namespace DashSim
