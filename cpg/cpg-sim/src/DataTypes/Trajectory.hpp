// Ticket: 0001_two_body_collision_core

#ifndef CPG_SIM_TRAJECTORY_HPP
#define CPG_SIM_TRAJECTORY_HPP

#include <cmath>
#include <cstddef>
#include <vector>

namespace cpg_sim
{

/**
 * @brief Kinematic state of both bodies at one fixed time step
 */
struct TrajectoryState
{
  double time{0.0};       // [s]
  double positionA{0.0};  // [m]
  double positionB{0.0};  // [m]
  double velocityA{0.0};  // [m/s]
  double velocityB{0.0};  // [m/s]

  [[nodiscard]] double separation() const
  {
    return std::abs(positionB - positionA);
  }

  bool operator==(const TrajectoryState&) const = default;
};

/**
 * @brief Time-stepped trajectory of the two-body system
 *
 * Index 0 is the initial state at t = 0; index i is the state at i * dt.
 * Produced once by CollisionSimulator and read-only afterwards.
 *
 * @ticket 0001_two_body_collision_core
 */
struct Trajectory
{
  double dt{0.0};  // Fixed step size [s]
  std::vector<TrajectoryState> states;

  [[nodiscard]] std::size_t size() const
  {
    return states.size();
  }

  [[nodiscard]] bool empty() const
  {
    return states.empty();
  }

  [[nodiscard]] const TrajectoryState& operator[](std::size_t index) const
  {
    return states[index];
  }

  bool operator==(const Trajectory&) const = default;
};

}  // namespace cpg_sim

#endif  // CPG_SIM_TRAJECTORY_HPP
