#include "LinearBrain.h"
#include "core/sim/SensoryData.h"

namespace DashSim {

double LinearBrain::evaluate(const SensoryData& sensory) const
{
    const auto& w = genome_.weights;
    return w[Genome::DistanceWeight] * sensory.normalizedDistance
        + w[Genome::HeightWeight] * sensory.normalizedHeight + w[Genome::Bias];
}

} // namespace DashSim
