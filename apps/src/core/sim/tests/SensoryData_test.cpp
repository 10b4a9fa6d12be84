#include "core/sim/Agent.h"
#include "core/sim/EpisodeConfig.h"
#include "core/sim/Obstacle.h"
#include "core/sim/SensoryData.h"

#include <gtest/gtest.h>

using namespace DashSim;

class SensoryDataTest : public ::testing::Test {
protected:
    EpisodeConfig config;
    Agent agent = Agent::spawn(config);

    Obstacle obstacleAt(double x) const
    {
        return Obstacle{
            .x = x,
            .y = config.playfieldHeight - config.obstacleHeight,
            .width = config.obstacleWidth,
            .height = config.obstacleHeight,
            .speed = config.obstacleSpeed,
        };
    }
};

TEST_F(SensoryDataTest, NoObstacleSaturatesDistance)
{
    const SensoryData data = gatherSensoryData(agent, {}, config);

    EXPECT_FALSE(data.obstacleAhead);
    EXPECT_DOUBLE_EQ(data.rawDistance, config.noObstacleDistance);
    EXPECT_DOUBLE_EQ(data.normalizedDistance, 1.0);
}

TEST_F(SensoryDataTest, DistanceIsNormalizedByWidth)
{
    const SensoryData data = gatherSensoryData(agent, { obstacleAt(600.0) }, config);

    EXPECT_TRUE(data.obstacleAhead);
    EXPECT_DOUBLE_EQ(data.rawDistance, 600.0 - agent.x);
    EXPECT_DOUBLE_EQ(data.normalizedDistance, (600.0 - agent.x) / config.playfieldWidth);
}

TEST_F(SensoryDataTest, HeightIsNormalizedByPlayfieldHeight)
{
    agent.y = 225.0;
    const SensoryData data = gatherSensoryData(agent, {}, config);
    EXPECT_DOUBLE_EQ(data.normalizedHeight, 0.5);
}

TEST_F(SensoryDataTest, SkipsObstaclesAlreadyPassed)
{
    // Right edge at 325 is behind the agent at 390.
    const SensoryData data =
        gatherSensoryData(agent, { obstacleAt(300.0), obstacleAt(700.0) }, config);

    EXPECT_DOUBLE_EQ(data.rawDistance, 700.0 - agent.x);
}

TEST_F(SensoryDataTest, OverlappingObstacleClampsToZero)
{
    // Right edge at 405 is still past agent.x, left edge is behind it.
    const SensoryData data = gatherSensoryData(agent, { obstacleAt(380.0) }, config);

    EXPECT_TRUE(data.obstacleAhead);
    EXPECT_LT(data.rawDistance, 0.0);
    EXPECT_DOUBLE_EQ(data.normalizedDistance, 0.0);
}

TEST_F(SensoryDataTest, FirstObstacleInSpawnOrderWins)
{
    const SensoryData data =
        gatherSensoryData(agent, { obstacleAt(500.0), obstacleAt(450.0) }, config);
    EXPECT_DOUBLE_EQ(data.rawDistance, 500.0 - agent.x);
}
