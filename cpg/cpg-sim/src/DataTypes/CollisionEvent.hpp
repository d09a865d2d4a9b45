// Ticket: 0001_two_body_collision_core

#ifndef CPG_SIM_COLLISION_EVENT_HPP
#define CPG_SIM_COLLISION_EVENT_HPP

#include <cstddef>

namespace cpg_sim
{

/**
 * @brief The single contact of a run
 *
 * time and the post-collision velocities come from the closed-form solution
 * (ElasticCollision), not from the integrator, so they do not depend on the
 * step size. trajectoryIndex is the first trajectory sample recorded after
 * the impulse was applied.
 *
 * @ticket 0001_two_body_collision_core
 */
struct CollisionEvent
{
  double time{0.0};                // Analytic contact time [s]
  double velocityABefore{0.0};     // [m/s]
  double velocityBBefore{0.0};     // [m/s]
  double velocityAAfter{0.0};      // v_A' [m/s]
  double velocityBAfter{0.0};      // v_B' [m/s]
  std::size_t trajectoryIndex{0};  // First post-impulse sample
};

/**
 * @brief Trajectory indices used for the first and final images
 */
struct CanonicalFrame
{
  std::size_t firstIndex{0};
  std::size_t finalIndex{0};
};

}  // namespace cpg_sim

#endif  // CPG_SIM_COLLISION_EVENT_HPP
