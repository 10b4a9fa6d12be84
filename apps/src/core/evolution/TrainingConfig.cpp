#include "TrainingConfig.h"
#include "core/ReflectSerializer.h"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace DashSim {

namespace {
using ValidationResult = Result<std::monostate, std::string>;

ValidationResult validateEvolution(const EvolutionConfig& config)
{
    if (config.populationSize <= 0) {
        return ValidationResult::error(fmt::format(
            "evolution.populationSize must be > 0 (got {})", config.populationSize));
    }
    if (config.maxGenerations <= 0) {
        return ValidationResult::error(fmt::format(
            "evolution.maxGenerations must be > 0 (got {})", config.maxGenerations));
    }
    if (!std::isfinite(config.eliteFraction) || config.eliteFraction <= 0.0
        || config.eliteFraction > 1.0) {
        return ValidationResult::error(fmt::format(
            "evolution.eliteFraction must be in (0, 1] (got {})", config.eliteFraction));
    }
    if (config.maxParallelEvaluations < 0) {
        return ValidationResult::error(fmt::format(
            "evolution.maxParallelEvaluations must be >= 0 (got {})",
            config.maxParallelEvaluations));
    }
    return ValidationResult::okay(std::monostate{});
}

ValidationResult validateMutation(const MutationConfig& config)
{
    if (!std::isfinite(config.rate) || config.rate < 0.0 || config.rate > 1.0) {
        return ValidationResult::error(
            fmt::format("mutation.rate must be in [0, 1] (got {})", config.rate));
    }
    if (!std::isfinite(config.fixedSigma) || config.fixedSigma <= 0.0) {
        return ValidationResult::error(fmt::format(
            "mutation.fixedSigma must be a positive finite number (got {})", config.fixedSigma));
    }
    if (!std::isfinite(config.adaptiveSigmaFloor) || config.adaptiveSigmaFloor <= 0.0) {
        return ValidationResult::error(fmt::format(
            "mutation.adaptiveSigmaFloor must be a positive finite number (got {})",
            config.adaptiveSigmaFloor));
    }
    return ValidationResult::okay(std::monostate{});
}
} // namespace

Result<std::monostate, std::string> validate(const TrainingConfig& config)
{
    if (auto result = validateEvolution(config.evolution); result.isError()) {
        return result;
    }
    if (auto result = validateMutation(config.mutation); result.isError()) {
        return result;
    }
    if (auto result = validate(config.episode); result.isError()) {
        return result;
    }

    if (static_cast<int>(config.seedGenomes.size()) > config.evolution.populationSize) {
        return ValidationResult::error(fmt::format(
            "seedGenomes has {} entries but populationSize is {}",
            config.seedGenomes.size(),
            config.evolution.populationSize));
    }
    for (size_t i = 0; i < config.seedGenomes.size(); ++i) {
        const Genome& genome = config.seedGenomes[i];
        if (!genome.isFinite()) {
            return ValidationResult::error(
                fmt::format("seedGenomes[{}] has a non-finite gene: {}", i, genome.toString()));
        }
        if (!genome.isWithinBounds()) {
            return ValidationResult::error(fmt::format(
                "seedGenomes[{}] has a gene outside [{}, {}]: {}",
                i,
                Genome::GENE_MIN,
                Genome::GENE_MAX,
                genome.toString()));
        }
    }

    return ValidationResult::okay(std::monostate{});
}

void to_json(nlohmann::json& j, const PresentationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, PresentationConfig& config)
{
    ReflectSerializer::update_from_json(j, config);
}

void to_json(nlohmann::json& j, const TrainingConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, TrainingConfig& config)
{
    ReflectSerializer::update_from_json(j, config);
}

} // namespace DashSim
