#pragma once

#include "Genome.h"

namespace DashSim {

struct SensoryData;

/**
 * Single linear unit over the two sensory inputs. Positive output means "jump".
 */
class LinearBrain {
public:
    explicit LinearBrain(const Genome& genome) : genome_(genome) {}

    double evaluate(const SensoryData& sensory) const;

    // NaN outputs never compare greater than zero, so a malformed genome simply never jumps.
    bool wantsJump(const SensoryData& sensory) const { return evaluate(sensory) > 0.0; }

    const Genome& getGenome() const { return genome_; }

private:
    Genome genome_;
};

} // namespace DashSim
