#pragma once

#include "EvolutionConfig.h"
#include "FitnessRecord.h"
#include "Mutation.h"

#include <random>
#include <vector>

namespace DashSim {

struct BreedingStats {
    int eliteCount = 0;
    int offspringCount = 0;
    int offspringMutated = 0; // Offspring with at least one perturbed gene.
    int perturbations = 0;
    int clamped = 0;
    GeneSigmas sigmas{};
};

/**
 * Build the next population from a ranked generation.
 *
 * The top computeEliteCount(populationSize, eliteFraction) genomes are copied verbatim and
 * come first. Every remaining slot is a mutated copy of an elite picked uniformly at random.
 */
std::vector<Genome> breedNextGeneration(
    const std::vector<FitnessRecord>& ranked,
    int populationSize,
    double eliteFraction,
    const MutationConfig& mutationConfig,
    std::mt19937& rng,
    BreedingStats* stats = nullptr);

/**
 * One generational step from an evaluated population: rank, keep elites, breed.
 */
std::vector<Genome> trainGeneration(
    const std::vector<Genome>& population,
    const std::vector<double>& fitness,
    const EvolutionConfig& evolutionConfig,
    const MutationConfig& mutationConfig,
    std::mt19937& rng,
    BreedingStats* stats = nullptr);

} // namespace DashSim
