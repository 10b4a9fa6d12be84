#pragma once

#include "EvolutionConfig.h"
#include "core/brains/Genome.h"

#include <array>
#include <random>
#include <vector>

namespace DashSim {

using GeneSigmas = std::array<double, Genome::GENE_COUNT>;

struct MutationStats {
    int perturbations = 0;
    int clamped = 0;
};

/**
 * Noise scale per gene for this generation.
 *
 * Fixed: config.fixedSigma everywhere.
 * Adaptive: max(config.adaptiveSigmaFloor, max(elite gene) - min(elite gene)).
 */
GeneSigmas computeGeneSigmas(const std::vector<Genome>& elites, const MutationConfig& config);

/**
 * Copy the parent and, per gene with probability `rate`, add N(0, sigma[gene]).
 * Every gene of the child is then clamped to [Genome::GENE_MIN, Genome::GENE_MAX];
 * a non-finite gene becomes 0.
 */
Genome mutate(
    const Genome& parent,
    const GeneSigmas& sigmas,
    double rate,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

double clampGene(double value);

} // namespace DashSim
