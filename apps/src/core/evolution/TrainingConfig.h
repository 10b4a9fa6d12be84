#pragma once

#include "EvolutionConfig.h"
#include "core/Result.h"
#include "core/brains/Genome.h"
#include "core/sim/EpisodeConfig.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace DashSim {

/**
 * Display-only options accepted from a front end. Nothing here changes training results.
 */
struct PresentationConfig {
    bool ghostBlend = false; // Draw non-elite agents translucent.
};

/**
 * Everything a training run needs.
 */
struct TrainingConfig {
    EvolutionConfig evolution;
    MutationConfig mutation;
    EpisodeConfig episode;
    PresentationConfig presentation;
    std::optional<uint32_t> seed; // Unset = seed from std::random_device.
    std::vector<Genome> seedGenomes; // Start of the initial population; the rest is random.
};

Result<std::monostate, std::string> validate(const TrainingConfig& config);

void to_json(nlohmann::json& j, const PresentationConfig& config);
void from_json(const nlohmann::json& j, PresentationConfig& config);

void to_json(nlohmann::json& j, const TrainingConfig& config);
void from_json(const nlohmann::json& j, TrainingConfig& config);

} // namespace DashSim
