#include "EvolutionConfig.h"
#include "core/ReflectSerializer.h"

namespace DashSim {

const char* toString(MutationScale scale)
{
    switch (scale) {
        case MutationScale::Fixed:
            return "Fixed";
        case MutationScale::Adaptive:
            return "Adaptive";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    ReflectSerializer::update_from_json(j, config);
}

void to_json(nlohmann::json& j, const MutationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, MutationConfig& config)
{
    ReflectSerializer::update_from_json(j, config);
}

} // namespace DashSim
