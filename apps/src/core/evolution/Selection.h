#pragma once

#include "FitnessRecord.h"

#include <random>
#include <vector>

namespace DashSim {

/**
 * Pair each genome with its fitness. Non-finite fitness becomes -infinity so a broken
 * evaluation ranks last instead of poisoning the sort.
 */
std::vector<FitnessRecord> makeRecords(
    const std::vector<Genome>& population, const std::vector<double>& fitness);

/**
 * Stable sort by fitness, descending. Equal fitness keeps input order.
 */
void rankRecords(std::vector<FitnessRecord>& records);

/**
 * ceil(populationSize * eliteFraction), kept within [1, populationSize].
 */
int computeEliteCount(int populationSize, double eliteFraction);

/**
 * The first eliteCount genomes of an already ranked list.
 */
std::vector<Genome> selectElites(const std::vector<FitnessRecord>& ranked, int eliteCount);

/**
 * Uniform pick from the elites. Parents never come from outside the elite set.
 */
const Genome& pickEliteParent(const std::vector<Genome>& elites, std::mt19937& rng);

/**
 * Fittest genome of an unranked list; first one wins ties.
 */
Genome bestOf(const std::vector<FitnessRecord>& records);

} // namespace DashSim
