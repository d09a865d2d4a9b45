// Ticket: 0001_two_body_collision_core

#ifndef CPG_SIM_PHYSICS_COLLISION_SIMULATOR_HPP
#define CPG_SIM_PHYSICS_COLLISION_SIMULATOR_HPP

#include "cpg-sim/src/Config/GeneratorConfig.hpp"
#include "cpg-sim/src/DataTypes/CollisionEvent.hpp"
#include "cpg-sim/src/DataTypes/InitialConditions.hpp"
#include "cpg-sim/src/DataTypes/Trajectory.hpp"
#include "cpg-sim/src/Diagnostics/ConservationCheck.hpp"

namespace cpg_sim
{

/**
 * @brief Fixed-step integrator for two point masses on a line with a single
 * elastic contact
 *
 * Integration per step (dt = 1 / (videoFps * substepsPerFrame)):
 * 1. Free flight: x += v * dt for both bodies
 * 2. Contact test: centre distance <= 2 * contactRadius
 * 3. On the first contact, split the step at the time of impact tau:
 *    advance by tau with the old velocities, replace the velocities with the
 *    ElasticCollision solution, advance by dt - tau with the new ones
 *
 * The impulse is applied exactly once. After it the bodies separate and
 * never meet again (e = 1, 1-D, no external forces).
 *
 * No adaptive stepping and no solver tolerances: identical InitialConditions
 * and SimulatorConfig give a bit-identical Trajectory.
 *
 * Thread safety: run() is const and keeps all state on the stack.
 *
 * @ticket 0001_two_body_collision_core
 */
class CollisionSimulator
{
public:
  /**
   * @brief Everything a single run produces
   */
  struct Result
  {
    Trajectory trajectory;
    CollisionEvent collision;
    ConservationCheck::Report conservation;
  };

  /**
   * @param config Step size, horizon and physical contact radius
   * @throws InvalidConfiguration if the step configuration is not positive
   */
  explicit CollisionSimulator(const SimulatorConfig& config);

  /**
   * @brief Integrate the system over the configured horizon
   *
   * @param conditions Starting state (A left of B)
   * @return Trajectory, analytic collision event and conservation report
   * @throws InvalidConfiguration if masses are not positive or the bodies
   *         already overlap at t = 0
   * @throws NoCollisionDetected if no contact occurs within the horizon
   */
  [[nodiscard]] Result run(const InitialConditions& conditions) const;

  /**
   * @brief Centre distance at which contact occurs
   * @return 2 * contactRadius [m]
   */
  [[nodiscard]] double contactDistance() const
  {
    return 2.0 * config_.contactRadius;
  }

  [[nodiscard]] const SimulatorConfig& getConfig() const
  {
    return config_;
  }

private:
  SimulatorConfig config_;
};

}  // namespace cpg_sim

#endif  // CPG_SIM_PHYSICS_COLLISION_SIMULATOR_HPP
