// Ticket: 0001_two_body_collision_core

#ifndef CPG_SIM_INITIAL_CONDITIONS_HPP
#define CPG_SIM_INITIAL_CONDITIONS_HPP

namespace cpg_sim
{

/**
 * @brief Starting kinematic state of the two bodies
 *
 * Body A starts on the left and moves right (velocityA >= 0). Body B starts on
 * the right and moves left (velocityB <= 0). These are the values quoted in
 * the prompt text and the values the ground-truth animation is integrated
 * from.
 *
 * @ticket 0001_two_body_collision_core
 */
struct InitialConditions
{
  double massA{1.0};       // [kg]
  double massB{1.0};       // [kg]
  double positionA{2.0};   // [m]
  double positionB{12.0};  // [m]
  double velocityA{0.0};   // [m/s], positive = rightward
  double velocityB{0.0};   // [m/s], positive = rightward

  /**
   * @brief Rate at which the gap between A and B shrinks before contact
   * @return velocityA - velocityB [m/s]
   */
  [[nodiscard]] double closingSpeed() const
  {
    return velocityA - velocityB;
  }

  /**
   * @brief Centre-to-centre distance at t = 0
   * @return positionB - positionA [m]
   */
  [[nodiscard]] double initialGap() const
  {
    return positionB - positionA;
  }
};

}  // namespace cpg_sim

#endif  // CPG_SIM_INITIAL_CONDITIONS_HPP
