#include "core/brains/Genome.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/Mutation.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace DashSim;

class MutationTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    GeneSigmas uniformSigmas(double sigma) const
    {
        GeneSigmas sigmas;
        sigmas.fill(sigma);
        return sigmas;
    }
};

TEST_F(MutationTest, ZeroRateProducesIdenticalGenome)
{
    const Genome parent = Genome::of(0.3, -1.2, 1.9);
    MutationStats stats;

    const Genome child = mutate(parent, uniformSigmas(0.5), 0.0, rng, &stats);

    EXPECT_EQ(parent.weights, child.weights);
    EXPECT_EQ(stats.perturbations, 0);
    EXPECT_EQ(stats.clamped, 0);
}

TEST_F(MutationTest, FullRatePerturbsEveryGene)
{
    const Genome parent = Genome::constant(0.0);
    MutationStats stats;

    const Genome child = mutate(parent, uniformSigmas(0.2), 1.0, rng, &stats);

    EXPECT_EQ(stats.perturbations, static_cast<int>(Genome::GENE_COUNT));
    for (size_t i = 0; i < Genome::GENE_COUNT; i++) {
        EXPECT_NE(child.weights[i], parent.weights[i]);
    }
}

TEST_F(MutationTest, GenesStayWithinBoundsForAnyRate)
{
    const double rates[] = { 0.0, 0.1, 0.5, 1.0 };
    for (const double rate : rates) {
        Genome genome = Genome::of(1.99, -1.99, 0.0);
        // Huge sigma and repeated mutation would run away without the clamp.
        for (int i = 0; i < 2000; i++) {
            genome = mutate(genome, uniformSigmas(5.0), rate, rng);
            ASSERT_TRUE(genome.isWithinBounds()) << "rate " << rate << " " << genome.toString();
        }
    }
}

TEST_F(MutationTest, ClampCountsEveryGeneThatHitABound)
{
    MutationStats stats;
    const Genome child = mutate(Genome::constant(2.0), uniformSigmas(1000.0), 1.0, rng, &stats);

    EXPECT_TRUE(child.isWithinBounds());
    EXPECT_GT(stats.clamped, 0);
}

TEST_F(MutationTest, ClampGeneHandlesNonFinite)
{
    EXPECT_EQ(clampGene(std::nan("")), 0.0);
    EXPECT_EQ(clampGene(std::numeric_limits<double>::infinity()), Genome::GENE_MAX);
    EXPECT_EQ(clampGene(-std::numeric_limits<double>::infinity()), Genome::GENE_MIN);
    EXPECT_EQ(clampGene(0.75), 0.75);
}

TEST_F(MutationTest, FixedScaleUsesConfiguredSigma)
{
    MutationConfig config;
    config.scale = MutationScale::Fixed;
    config.fixedSigma = 0.2;

    const std::vector<Genome> elites = { Genome::constant(-1.0), Genome::constant(1.0) };
    const GeneSigmas sigmas = computeGeneSigmas(elites, config);

    for (const double sigma : sigmas) {
        EXPECT_DOUBLE_EQ(sigma, 0.2);
    }
}

TEST_F(MutationTest, AdaptiveScaleUsesEliteSpreadPerGene)
{
    MutationConfig config;
    config.scale = MutationScale::Adaptive;
    config.adaptiveSigmaFloor = 0.1;

    const std::vector<Genome> elites = {
        Genome::of(0.0, 0.50, 1.0),
        Genome::of(1.5, 0.55, 1.0),
        Genome::of(0.5, 0.52, 1.0),
    };
    const GeneSigmas sigmas = computeGeneSigmas(elites, config);

    EXPECT_DOUBLE_EQ(sigmas[Genome::DistanceWeight], 1.5);
    // Spread 0.05 and 0 fall back to the floor.
    EXPECT_DOUBLE_EQ(sigmas[Genome::HeightWeight], 0.1);
    EXPECT_DOUBLE_EQ(sigmas[Genome::Bias], 0.1);
}

TEST_F(MutationTest, AdaptiveScaleWithSingleEliteUsesFloor)
{
    MutationConfig config;
    config.scale = MutationScale::Adaptive;
    config.adaptiveSigmaFloor = 0.1;

    const GeneSigmas sigmas = computeGeneSigmas({ Genome::of(0.3, 0.6, -0.9) }, config);
    for (const double sigma : sigmas) {
        EXPECT_DOUBLE_EQ(sigma, 0.1);
    }
}

TEST_F(MutationTest, RateControlsHowOftenGenesChange)
{
    int perturbations = 0;
    const int trials = 10000;
    for (int i = 0; i < trials; i++) {
        MutationStats stats;
        mutate(Genome::constant(0.0), uniformSigmas(0.2), 0.1, rng, &stats);
        perturbations += stats.perturbations;
    }

    const double observed =
        static_cast<double>(perturbations) / (trials * static_cast<double>(Genome::GENE_COUNT));
    EXPECT_NEAR(observed, 0.1, 0.01);
}
