// Ticket: 0001_two_body_collision_core

#ifndef CPG_SIM_PHYSICS_PARAMETER_SAMPLER_HPP
#define CPG_SIM_PHYSICS_PARAMETER_SAMPLER_HPP

#include <random>

#include "cpg-sim/src/Config/GeneratorConfig.hpp"
#include "cpg-sim/src/DataTypes/InitialConditions.hpp"

namespace cpg_sim
{

/**
 * @brief Draws collision-guaranteed initial conditions
 *
 * Masses are uniform in the mass range; speeds are uniform in the speed
 * range. A always moves right and B always moves left, so the closing speed
 * is at least 2 * speed.min > 0 by construction.
 *
 * The generator is passed in on every call rather than owned, so each run
 * can draw from its own stream and parallel batches stay reproducible.
 *
 * @ticket 0001_two_body_collision_core
 */
class ParameterSampler
{
public:
  /**
   * @param config Mass/speed ranges and start positions
   * @throws InvalidConfiguration if mass.min <= 0, speed.min <= 0, a range
   *         max is below its min, or positionA is not left of positionB
   */
  explicit ParameterSampler(const SamplerConfig& config);

  /**
   * @brief Draw one set of initial conditions
   *
   * Draw order is fixed (mass A, mass B, speed A, speed B) so a given
   * generator state always yields the same sample.
   *
   * @param rng Per-run random stream
   */
  InitialConditions sample(std::mt19937_64& rng) const;

  [[nodiscard]] const SamplerConfig& getConfig() const
  {
    return config_;
  }

private:
  SamplerConfig config_;
};

}  // namespace cpg_sim

#endif  // CPG_SIM_PHYSICS_PARAMETER_SAMPLER_HPP
