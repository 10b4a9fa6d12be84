#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace DashSim {

/**
 * Configuration for the generational loop.
 */
struct EvolutionConfig {
    int populationSize = 50;
    int maxGenerations = 100;
    double eliteFraction = 0.1;     // Top share carried over unmutated; at least one elite.
    int maxParallelEvaluations = 1; // 0 = auto (use detected core count).
};

/**
 * How the per-gene Gaussian noise is scaled.
 */
enum class MutationScale : uint8_t {
    // Same sigma for every gene and every generation (interactive trainer).
    Fixed = 0,
    // Per-gene sigma from the spread of that gene across the current elites (headless trainer).
    Adaptive = 1,
};

/**
 * Configuration for offspring mutation. One scale policy is used for a whole run.
 */
struct MutationConfig {
    double rate = 0.1; // Probability each gene is perturbed.
    MutationScale scale = MutationScale::Adaptive;
    double fixedSigma = 0.2;
    // Lower bound on adaptive sigma. Once the elites agree on a gene their spread collapses
    // toward zero; the floor keeps that gene searchable.
    double adaptiveSigmaFloor = 0.1;
};

const char* toString(MutationScale scale);

void to_json(nlohmann::json& j, const EvolutionConfig& config);
void from_json(const nlohmann::json& j, EvolutionConfig& config);

void to_json(nlohmann::json& j, const MutationConfig& config);
void from_json(const nlohmann::json& j, MutationConfig& config);

} // namespace DashSim
