#include "core/sim/Agent.h"
#include "core/sim/EpisodeConfig.h"

#include <algorithm>
#include <gtest/gtest.h>

using namespace DashSim;

class AgentTest : public ::testing::Test {
protected:
    EpisodeConfig config;

    double groundY() const { return config.playfieldHeight - config.agentHeight; }
};

TEST_F(AgentTest, SpawnsCenteredAboveGround)
{
    const Agent agent = Agent::spawn(config);

    EXPECT_DOUBLE_EQ(agent.x, 390.0);
    EXPECT_DOUBLE_EQ(agent.y, 420.0);
    EXPECT_DOUBLE_EQ(agent.width, 20.0);
    EXPECT_DOUBLE_EQ(agent.height, 20.0);
    EXPECT_FALSE(agent.grounded);
}

TEST_F(AgentTest, FallsAndLandsOnGround)
{
    Agent agent = Agent::spawn(config);

    for (int i = 0; i < 120; i++) {
        agent.applyPhysics(config.timestep, config.gravity, groundY());
    }

    EXPECT_TRUE(agent.grounded);
    EXPECT_EQ(agent.y, groundY());
    EXPECT_EQ(agent.velocityY, 0.0);
}

TEST_F(AgentTest, GroundedAgentDoesNotDrift)
{
    Agent agent = Agent::spawn(config);
    agent.y = groundY();
    agent.grounded = true;

    for (int i = 0; i < 10000; i++) {
        agent.applyPhysics(config.timestep, config.gravity, groundY());
        ASSERT_EQ(agent.y, groundY());
        ASSERT_TRUE(agent.grounded);
    }
}

TEST_F(AgentTest, JumpOnlyWhenGrounded)
{
    Agent agent = Agent::spawn(config);
    agent.y = groundY();
    agent.grounded = true;

    EXPECT_TRUE(agent.jump(config.jumpImpulse));
    EXPECT_EQ(agent.velocityY, config.jumpImpulse);
    EXPECT_FALSE(agent.grounded);

    // Airborne: a second jump is ignored.
    EXPECT_FALSE(agent.jump(config.jumpImpulse * 2.0));
    EXPECT_EQ(agent.velocityY, config.jumpImpulse);
}

TEST_F(AgentTest, JumpRisesThenReturnsToGround)
{
    Agent agent = Agent::spawn(config);
    agent.y = groundY();
    agent.grounded = true;
    ASSERT_TRUE(agent.jump(config.jumpImpulse));

    double highest = agent.y;
    int steps = 0;
    do {
        agent.applyPhysics(config.timestep, config.gravity, groundY());
        highest = std::min(highest, agent.y);
        steps++;
    } while (!agent.grounded && steps < 1000);

    EXPECT_TRUE(agent.grounded);
    EXPECT_LT(highest, groundY() - config.obstacleHeight);
    EXPECT_EQ(agent.y, groundY());
}
