#include "Genome.h"

#include <cmath>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace DashSim {

Genome Genome::random(std::mt19937& rng)
{
    std::uniform_real_distribution<double> dist(INITIAL_MIN, INITIAL_MAX);

    Genome g;
    for (double& w : g.weights) {
        w = dist(rng);
    }
    return g;
}

Genome Genome::constant(double value)
{
    Genome g;
    g.weights.fill(value);
    return g;
}

Genome Genome::of(double distanceWeight, double heightWeight, double bias)
{
    Genome g;
    g.weights[DistanceWeight] = distanceWeight;
    g.weights[HeightWeight] = heightWeight;
    g.weights[Bias] = bias;
    return g;
}

bool Genome::isFinite() const
{
    for (const double w : weights) {
        if (!std::isfinite(w)) {
            return false;
        }
    }
    return true;
}

bool Genome::isWithinBounds() const
{
    for (const double w : weights) {
        if (!(w >= GENE_MIN && w <= GENE_MAX)) {
            return false;
        }
    }
    return true;
}

std::string Genome::toString() const
{
    return fmt::format(
        "[{:.4f}, {:.4f}, {:.4f}]", weights[DistanceWeight], weights[HeightWeight], weights[Bias]);
}

bool Genome::operator==(const Genome& other) const
{
    return weights == other.weights;
}

void to_json(nlohmann::json& j, const Genome& genome)
{
    j = nlohmann::json::array();
    for (const double w : genome.weights) {
        j.push_back(w);
    }
}

void from_json(const nlohmann::json& j, Genome& genome)
{
    if (!j.is_array() || j.size() != Genome::GENE_COUNT) {
        throw std::runtime_error(
            "Genome must be an array of " + std::to_string(Genome::GENE_COUNT) + " numbers");
    }
    for (size_t i = 0; i < Genome::GENE_COUNT; ++i) {
        genome.weights[i] = j[i].get<double>();
    }
}

} // namespace DashSim
