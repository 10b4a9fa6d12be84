#include "Generation.h"
#include "Selection.h"

#include "core/Assert.h"

#include <algorithm>

namespace DashSim {

std::vector<Genome> breedNextGeneration(
    const std::vector<FitnessRecord>& ranked,
    int populationSize,
    double eliteFraction,
    const MutationConfig& mutationConfig,
    std::mt19937& rng,
    BreedingStats* stats)
{
    DASHSIM_ASSERT(!ranked.empty(), "Cannot breed from an empty generation");
    DASHSIM_ASSERT(populationSize > 0, "Population size must be positive");

    const int eliteCount = std::min(
        computeEliteCount(populationSize, eliteFraction), static_cast<int>(ranked.size()));
    const std::vector<Genome> elites = selectElites(ranked, eliteCount);
    const GeneSigmas sigmas = computeGeneSigmas(elites, mutationConfig);

    BreedingStats localStats;
    localStats.eliteCount = eliteCount;
    localStats.sigmas = sigmas;

    std::vector<Genome> next;
    next.reserve(populationSize);
    next.insert(next.end(), elites.begin(), elites.end());

    while (static_cast<int>(next.size()) < populationSize) {
        const Genome& parent = pickEliteParent(elites, rng);
        MutationStats mutationStats;
        next.push_back(mutate(parent, sigmas, mutationConfig.rate, rng, &mutationStats));

        localStats.offspringCount++;
        localStats.perturbations += mutationStats.perturbations;
        localStats.clamped += mutationStats.clamped;
        if (mutationStats.perturbations > 0) {
            localStats.offspringMutated++;
        }
    }

    if (stats) {
        *stats = localStats;
    }
    return next;
}

std::vector<Genome> trainGeneration(
    const std::vector<Genome>& population,
    const std::vector<double>& fitness,
    const EvolutionConfig& evolutionConfig,
    const MutationConfig& mutationConfig,
    std::mt19937& rng,
    BreedingStats* stats)
{
    std::vector<FitnessRecord> records = makeRecords(population, fitness);
    rankRecords(records);
    return breedNextGeneration(
        records,
        evolutionConfig.populationSize,
        evolutionConfig.eliteFraction,
        mutationConfig,
        rng,
        stats);
}

} // namespace DashSim
