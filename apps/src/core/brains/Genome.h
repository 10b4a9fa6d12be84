#pragma once

#include <array>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <random>
#include <string>

namespace DashSim {

/**
 * Linear jump policy genome: [w1, w2, b].
 *
 * The brain computes w1 * normalizedDistance + w2 * normalizedHeight + b and jumps when the
 * result is positive.
 */
struct Genome {
    static constexpr size_t DistanceWeight = 0;
    static constexpr size_t HeightWeight = 1;
    static constexpr size_t Bias = 2;
    static constexpr size_t GENE_COUNT = 3;

    // Every gene stays inside this range after mutation so no weight can run away.
    static constexpr double GENE_MIN = -2.0;
    static constexpr double GENE_MAX = 2.0;

    // Range of the uniform initial draw.
    static constexpr double INITIAL_MIN = -1.0;
    static constexpr double INITIAL_MAX = 1.0;

    std::array<double, GENE_COUNT> weights{};

    static Genome random(std::mt19937& rng);
    static Genome constant(double value);
    static Genome of(double distanceWeight, double heightWeight, double bias);

    bool isFinite() const;
    bool isWithinBounds() const;
    std::string toString() const;

    bool operator==(const Genome& other) const;
};

void to_json(nlohmann::json& j, const Genome& genome);
void from_json(const nlohmann::json& j, Genome& genome);

} // namespace DashSim
