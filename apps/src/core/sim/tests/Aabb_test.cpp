#include "core/sim/Aabb.h"

#include <gtest/gtest.h>
#include <random>

using namespace DashSim;

class AabbTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    Aabb randomBox()
    {
        std::uniform_real_distribution<double> pos(-100.0, 100.0);
        std::uniform_real_distribution<double> size(0.0, 50.0);
        return Aabb{ pos(rng), pos(rng), size(rng), size(rng) };
    }
};

TEST_F(AabbTest, OverlapIsSymmetric)
{
    for (int i = 0; i < 1000; i++) {
        const Aabb a = randomBox();
        const Aabb b = randomBox();
        EXPECT_EQ(overlaps(a, b), overlaps(b, a));
    }
}

TEST_F(AabbTest, BoxOverlapsItself)
{
    for (int i = 0; i < 100; i++) {
        const Aabb a = randomBox();
        EXPECT_TRUE(overlaps(a, a));
    }
}

TEST_F(AabbTest, TouchingEdgesCountAsOverlap)
{
    const Aabb a{ 0.0, 0.0, 10.0, 10.0 };
    const Aabb right{ 10.0, 0.0, 10.0, 10.0 };
    const Aabb below{ 0.0, 10.0, 10.0, 10.0 };

    EXPECT_TRUE(overlaps(a, right));
    EXPECT_TRUE(overlaps(a, below));
}

TEST_F(AabbTest, SeparatedBoxesDoNotOverlap)
{
    const Aabb a{ 0.0, 0.0, 10.0, 10.0 };
    const Aabb farRight{ 10.5, 0.0, 10.0, 10.0 };
    const Aabb farBelow{ 0.0, 10.5, 10.0, 10.0 };

    EXPECT_FALSE(overlaps(a, farRight));
    EXPECT_FALSE(overlaps(a, farBelow));
}

TEST_F(AabbTest, ContainedBoxOverlaps)
{
    const Aabb outer{ 0.0, 0.0, 100.0, 100.0 };
    const Aabb inner{ 40.0, 40.0, 5.0, 5.0 };
    EXPECT_TRUE(overlaps(outer, inner));
}
