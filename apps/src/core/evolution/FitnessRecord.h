#pragma once

#include "core/brains/Genome.h"

namespace DashSim {

/**
 * A genome paired with the survival time its episode achieved. Higher is better.
 */
struct FitnessRecord {
    Genome genome;
    double fitness = 0.0;
    int index = -1; // Position in the evaluated population.
};

} // namespace DashSim
