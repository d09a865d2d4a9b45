// Ticket: 0001_two_body_collision_core

#ifndef CPG_SIM_PHYSICS_ELASTIC_COLLISION_HPP
#define CPG_SIM_PHYSICS_ELASTIC_COLLISION_HPP

#include <optional>

#include "cpg-sim/src/DataTypes/CollisionEvent.hpp"
#include "cpg-sim/src/DataTypes/InitialConditions.hpp"

namespace cpg_sim
{

/**
 * @brief Closed-form solution of the 1-D, two-body, perfectly elastic
 * collision.
 *
 * Serves as the physics oracle for CollisionSimulator: the time-stepped
 * trajectory and this algebraic solution are computed independently and can
 * be cross-checked.
 *
 * ## Velocity update
 *
 * Conservation of momentum and kinetic energy with restitution e = 1 gives
 *
 *   v_A' = ((m_A - m_B) * v_A + 2 * m_B * v_B) / (m_A + m_B)
 *   v_B' = ((m_B - m_A) * v_B + 2 * m_A * v_A) / (m_A + m_B)
 *
 * For m_A == m_B this reduces to a velocity exchange, which is returned
 * exactly rather than through the (rounding) general formula.
 *
 * ## Contact time
 *
 * With A left of B and both in free flight, contact happens when the gap has
 * shrunk to the contact distance:
 *
 *   t_c = (x_B - x_A - d_contact) / (v_A - v_B)
 *
 * @ticket 0001_two_body_collision_core
 */
namespace ElasticCollision
{

/**
 * @brief Post-collision velocities of A and B
 */
struct VelocityPair
{
  double velocityA{0.0};  // [m/s]
  double velocityB{0.0};  // [m/s]
};

/**
 * @brief Apply the elastic collision velocity update
 *
 * @param massA Mass of A [kg]
 * @param velocityA Velocity of A before contact [m/s]
 * @param massB Mass of B [kg]
 * @param velocityB Velocity of B before contact [m/s]
 * @return Velocities after contact
 * @throws InvalidConfiguration if either mass is not positive
 */
VelocityPair postCollisionVelocities(double massA,
                                     double velocityA,
                                     double massB,
                                     double velocityB);

/**
 * @brief Time at which the centre distance first equals contactDistance
 *
 * @param conditions Initial state (A left of B)
 * @param contactDistance Sum of the physical contact radii [m]
 * @return Contact time [s]; 0 if already touching; std::nullopt if the
 *         bodies are not closing and never meet
 */
std::optional<double> contactTime(const InitialConditions& conditions,
                                  double contactDistance);

/**
 * @brief Full analytic collision event for a run
 *
 * trajectoryIndex is left at 0; the simulator fills it in once it knows
 * which sample follows the impulse.
 *
 * @param conditions Initial state
 * @param contactDistance Sum of the physical contact radii [m]
 * @return Analytic event, or std::nullopt if the bodies never meet
 * @throws InvalidConfiguration if either mass is not positive
 */
std::optional<CollisionEvent> solve(const InitialConditions& conditions,
                                    double contactDistance);

}  // namespace ElasticCollision

}  // namespace cpg_sim

#endif  // CPG_SIM_PHYSICS_ELASTIC_COLLISION_HPP
