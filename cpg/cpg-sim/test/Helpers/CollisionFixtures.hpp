// Ticket: 0001_two_body_collision_core

#ifndef CPG_SIM_TEST_HELPERS_COLLISION_FIXTURES_HPP
#define CPG_SIM_TEST_HELPERS_COLLISION_FIXTURES_HPP

#include <cstddef>

#include "cpg-sim/src/DataTypes/CollisionEvent.hpp"
#include "cpg-sim/src/DataTypes/InitialConditions.hpp"
#include "cpg-sim/src/DataTypes/Trajectory.hpp"

namespace cpg_sim::test
{

/**
 * @brief Reference case with hand-checked outcome
 *
 * m_A = 4.8 kg at +4.8 m/s, m_B = 2.3 kg at -3.5 m/s:
 *   v_A' = -4.1 / 7.1
 *   v_B' = 54.83 / 7.1
 */
inline InitialConditions referenceConditions()
{
  InitialConditions conditions{};
  conditions.massA = 4.8;
  conditions.massB = 2.3;
  conditions.positionA = 2.0;
  conditions.positionB = 12.0;
  conditions.velocityA = 4.8;
  conditions.velocityB = -3.5;
  return conditions;
}

constexpr double kReferenceVelocityAAfter = -4.1 / 7.1;
constexpr double kReferenceVelocityBAfter = 54.83 / 7.1;

/**
 * @brief Symmetric head-on case with equal masses
 */
inline InitialConditions equalMassConditions()
{
  InitialConditions conditions{};
  conditions.massA = 2.5;
  conditions.massB = 2.5;
  conditions.positionA = 2.0;
  conditions.positionB = 12.0;
  conditions.velocityA = 6.3;
  conditions.velocityB = -2.7;
  return conditions;
}

/**
 * @brief Hand-built trajectory for frame selection tests
 *
 * `count` samples spaced dt apart. Before `collisionIndex` both bodies
 * approach the centre at 1 m per sample; from it on they recede at the
 * same rate.
 */
inline Trajectory symmetricTrajectory(std::size_t count,
                                      std::size_t collisionIndex,
                                      double dt,
                                      double startGap)
{
  Trajectory trajectory{};
  trajectory.dt = dt;
  double const centre = 7.0;
  for (std::size_t i = 0; i < count; ++i)
  {
    double const steps = (i < collisionIndex)
                           ? static_cast<double>(i)
                           : 2.0 * static_cast<double>(collisionIndex) -
                               static_cast<double>(i);
    double const halfGap = 0.5 * startGap - 0.5 * steps;
    double const velocity = (i < collisionIndex) ? 5.0 : -5.0;
    trajectory.states.push_back(TrajectoryState{static_cast<double>(i) * dt,
                                                centre - halfGap,
                                                centre + halfGap,
                                                velocity,
                                                -velocity});
  }
  return trajectory;
}

}  // namespace cpg_sim::test

#endif  // CPG_SIM_TEST_HELPERS_COLLISION_FIXTURES_HPP
