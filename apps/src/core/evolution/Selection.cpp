#include "Selection.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace DashSim {

namespace {
// Absorbs rounding in populationSize * eliteFraction (e.g. 30 * 0.1 = 3.0000000000000004).
constexpr double kEliteCountEpsilon = 1e-9;

double sanitizeFitness(double fitness)
{
    if (std::isfinite(fitness)) {
        return fitness;
    }
    return -std::numeric_limits<double>::infinity();
}
} // namespace

std::vector<FitnessRecord> makeRecords(
    const std::vector<Genome>& population, const std::vector<double>& fitness)
{
    DASHSIM_ASSERT(population.size() == fitness.size(), "Every genome needs a fitness value");

    std::vector<FitnessRecord> records;
    records.reserve(population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        const double value = sanitizeFitness(fitness[i]);
        if (value != fitness[i]) {
            LOG_WARN(
                Evolution,
                "Individual {} {} produced non-finite fitness; ranking it last",
                i,
                population[i].toString());
        }
        records.push_back(
            FitnessRecord{
                .genome = population[i],
                .fitness = value,
                .index = static_cast<int>(i),
            });
    }
    return records;
}

void rankRecords(std::vector<FitnessRecord>& records)
{
    for (auto& record : records) {
        record.fitness = sanitizeFitness(record.fitness);
    }
    std::stable_sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
        return a.fitness > b.fitness;
    });
}

int computeEliteCount(int populationSize, double eliteFraction)
{
    if (populationSize <= 0) {
        return 0;
    }
    const double raw = static_cast<double>(populationSize) * eliteFraction;
    const int count = static_cast<int>(std::ceil(raw - kEliteCountEpsilon));
    return std::clamp(count, 1, populationSize);
}

std::vector<Genome> selectElites(const std::vector<FitnessRecord>& ranked, int eliteCount)
{
    const int count = std::clamp(eliteCount, 0, static_cast<int>(ranked.size()));

    std::vector<Genome> elites;
    elites.reserve(count);
    for (int i = 0; i < count; ++i) {
        elites.push_back(ranked[i].genome);
    }
    return elites;
}

const Genome& pickEliteParent(const std::vector<Genome>& elites, std::mt19937& rng)
{
    DASHSIM_ASSERT(!elites.empty(), "Cannot pick a parent from an empty elite set");

    std::uniform_int_distribution<size_t> dist(0, elites.size() - 1);
    return elites[dist(rng)];
}

Genome bestOf(const std::vector<FitnessRecord>& records)
{
    DASHSIM_ASSERT(!records.empty(), "bestOf requires at least one record");

    size_t bestIdx = 0;
    double bestFitness = sanitizeFitness(records[0].fitness);
    for (size_t i = 1; i < records.size(); ++i) {
        const double fitness = sanitizeFitness(records[i].fitness);
        if (fitness > bestFitness) {
            bestIdx = i;
            bestFitness = fitness;
        }
    }
    return records[bestIdx].genome;
}

} // namespace DashSim
