#include "core/evolution/TrainingConfig.h"

#include <cmath>
#include <gtest/gtest.h>

using namespace DashSim;

namespace {
void expectInvalid(const TrainingConfig& config, const std::string& fragment)
{
    const auto result = validate(config);
    ASSERT_TRUE(result.isError()) << "expected error mentioning " << fragment;
    EXPECT_NE(result.errorValue().find(fragment), std::string::npos) << result.errorValue();
}
} // namespace

TEST(TrainingConfigTest, DefaultsAreValid)
{
    const TrainingConfig config;

    EXPECT_TRUE(validate(config).isValue());
    EXPECT_EQ(config.evolution.populationSize, 50);
    EXPECT_EQ(config.evolution.maxGenerations, 100);
    EXPECT_DOUBLE_EQ(config.evolution.eliteFraction, 0.1);
    EXPECT_DOUBLE_EQ(config.mutation.rate, 0.1);
    EXPECT_EQ(config.mutation.scale, MutationScale::Adaptive);
    EXPECT_DOUBLE_EQ(config.episode.playfieldWidth, 800.0);
    EXPECT_DOUBLE_EQ(config.episode.playfieldHeight, 450.0);
    EXPECT_FALSE(config.presentation.ghostBlend);
}

TEST(TrainingConfigTest, RejectsNonPositivePopulation)
{
    TrainingConfig config;
    config.evolution.populationSize = 0;
    expectInvalid(config, "populationSize");
}

TEST(TrainingConfigTest, RejectsNonPositiveGenerations)
{
    TrainingConfig config;
    config.evolution.maxGenerations = -3;
    expectInvalid(config, "maxGenerations");
}

TEST(TrainingConfigTest, RejectsMutationRateOutsideUnitInterval)
{
    TrainingConfig config;
    config.mutation.rate = 1.5;
    expectInvalid(config, "mutation.rate");

    config.mutation.rate = -0.1;
    expectInvalid(config, "mutation.rate");

    config.mutation.rate = std::nan("");
    expectInvalid(config, "mutation.rate");
}

TEST(TrainingConfigTest, AcceptsMutationRateBounds)
{
    TrainingConfig config;
    config.mutation.rate = 0.0;
    EXPECT_TRUE(validate(config).isValue());
    config.mutation.rate = 1.0;
    EXPECT_TRUE(validate(config).isValue());
}

TEST(TrainingConfigTest, RejectsEliteFractionOutsideRange)
{
    TrainingConfig config;
    config.evolution.eliteFraction = 0.0;
    expectInvalid(config, "eliteFraction");

    config.evolution.eliteFraction = 1.01;
    expectInvalid(config, "eliteFraction");
}

TEST(TrainingConfigTest, RejectsBadEpisode)
{
    TrainingConfig config;
    config.episode.playfieldWidth = 0.0;
    expectInvalid(config, "playfieldWidth");

    config = TrainingConfig{};
    config.episode.maxTime = -1.0;
    expectInvalid(config, "maxTime");
}

TEST(TrainingConfigTest, RejectsBadSigmas)
{
    TrainingConfig config;
    config.mutation.fixedSigma = 0.0;
    expectInvalid(config, "fixedSigma");

    config = TrainingConfig{};
    config.mutation.adaptiveSigmaFloor = std::nan("");
    expectInvalid(config, "adaptiveSigmaFloor");
}

TEST(TrainingConfigTest, RejectsBadSeedGenomes)
{
    TrainingConfig config;
    config.seedGenomes = { Genome::of(0.0, std::nan(""), 0.0) };
    expectInvalid(config, "non-finite");

    config.seedGenomes = { Genome::of(0.0, 3.0, 0.0) };
    expectInvalid(config, "outside");

    config.evolution.populationSize = 2;
    config.seedGenomes = { Genome::constant(0.1), Genome::constant(0.2), Genome::constant(0.3) };
    expectInvalid(config, "seedGenomes");
}

TEST(TrainingConfigTest, PartialJsonKeepsDefaults)
{
    const nlohmann::json j = {
        { "evolution", { { "populationSize", 20 } } },
        { "mutation", { { "scale", "Fixed" } } },
        { "seed", 99 },
    };

    const TrainingConfig config = j.get<TrainingConfig>();

    EXPECT_EQ(config.evolution.populationSize, 20);
    EXPECT_EQ(config.evolution.maxGenerations, 100);
    EXPECT_EQ(config.mutation.scale, MutationScale::Fixed);
    EXPECT_DOUBLE_EQ(config.mutation.rate, 0.1);
    EXPECT_DOUBLE_EQ(config.episode.obstacleSpeed, 250.0);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(config.seed.value(), 99u);
}

TEST(TrainingConfigTest, JsonWritesEnumsByName)
{
    const nlohmann::json j = TrainingConfig{};

    EXPECT_EQ(j["mutation"]["scale"], "Adaptive");
    EXPECT_FALSE(j.contains("seed"));
    EXPECT_TRUE(j["seedGenomes"].is_array());
}

TEST(TrainingConfigTest, SeedGenomesParseFromArrays)
{
    const nlohmann::json j = { { "seedGenomes", { { 0.1, 0.2, 0.3 }, { -1.0, 0.0, 1.0 } } } };

    const TrainingConfig config = j.get<TrainingConfig>();

    ASSERT_EQ(config.seedGenomes.size(), 2u);
    EXPECT_EQ(config.seedGenomes[0], Genome::of(0.1, 0.2, 0.3));
    EXPECT_EQ(config.seedGenomes[1], Genome::of(-1.0, 0.0, 1.0));
}

TEST(TrainingConfigTest, UnknownEnumNameThrows)
{
    const nlohmann::json j = { { "mutation", { { "scale", "Sometimes" } } } };
    EXPECT_THROW(j.get<TrainingConfig>(), std::runtime_error);
}
