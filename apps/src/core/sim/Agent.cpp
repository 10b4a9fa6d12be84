#include "Agent.h"
#include "EpisodeConfig.h"

namespace DashSim {

Agent Agent::spawn(const EpisodeConfig& config)
{
    Agent agent;
    agent.width = config.agentWidth;
    agent.height = config.agentHeight;
    agent.x = config.playfieldWidth / 2.0 - config.agentWidth / 2.0;
    agent.y = config.playfieldHeight - config.agentHeight - config.agentSpawnClearance;
    agent.velocityY = 0.0;
    agent.grounded = false;
    return agent;
}

void Agent::applyPhysics(double deltaTime, double gravity, double groundY)
{
    if (!grounded) {
        velocityY += gravity * deltaTime;
    }
    y += velocityY * deltaTime;

    if (y >= groundY) {
        y = groundY;
        velocityY = 0.0;
        grounded = true;
    }
    else {
        grounded = false;
    }
}

bool Agent::jump(double impulse)
{
    if (!grounded) {
        return false;
    }
    velocityY = impulse;
    grounded = false;
    return true;
}

} // namespace DashSim
