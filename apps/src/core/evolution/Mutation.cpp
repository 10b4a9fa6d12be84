#include "Mutation.h"

#include <algorithm>
#include <cmath>

namespace DashSim {

double clampGene(double value)
{
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, Genome::GENE_MIN, Genome::GENE_MAX);
}

GeneSigmas computeGeneSigmas(const std::vector<Genome>& elites, const MutationConfig& config)
{
    GeneSigmas sigmas;
    sigmas.fill(config.fixedSigma);

    if (config.scale == MutationScale::Fixed) {
        return sigmas;
    }

    sigmas.fill(config.adaptiveSigmaFloor);
    if (elites.empty()) {
        return sigmas;
    }

    for (size_t gene = 0; gene < Genome::GENE_COUNT; ++gene) {
        const auto [minIt, maxIt] =
            std::minmax_element(elites.begin(), elites.end(), [gene](const auto& a, const auto& b) {
                return a.weights[gene] < b.weights[gene];
            });
        const double spread = maxIt->weights[gene] - minIt->weights[gene];
        if (std::isfinite(spread)) {
            sigmas[gene] = std::max(config.adaptiveSigmaFloor, spread);
        }
    }

    return sigmas;
}

Genome mutate(
    const Genome& parent,
    const GeneSigmas& sigmas,
    double rate,
    std::mt19937& rng,
    MutationStats* stats)
{
    if (stats) {
        stats->perturbations = 0;
        stats->clamped = 0;
    }

    Genome child = parent;
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::normal_distribution<double> noise(0.0, 1.0);

    for (size_t gene = 0; gene < Genome::GENE_COUNT; ++gene) {
        double value = child.weights[gene];
        if (coin(rng) < rate) {
            value += noise(rng) * sigmas[gene];
            if (stats) {
                stats->perturbations++;
            }
        }

        const double clamped = clampGene(value);
        if (stats && clamped != value) {
            stats->clamped++;
        }
        child.weights[gene] = clamped;
    }

    return child;
}

} // namespace DashSim
