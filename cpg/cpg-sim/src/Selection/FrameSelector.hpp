// Ticket: 0005_canonical_frame_selection

#ifndef CPG_SIM_SELECTION_FRAME_SELECTOR_HPP
#define CPG_SIM_SELECTION_FRAME_SELECTOR_HPP

#include <cstddef>

#include "cpg-sim/src/DataTypes/CollisionEvent.hpp"
#include "cpg-sim/src/DataTypes/Trajectory.hpp"

namespace cpg_sim
{

/**
 * @brief Picks the trajectory samples used for the first and final images
 *
 * The final frame is the earliest sample that is
 * 1. strictly after the collision time,
 * 2. separated by at least minSeparation (centre to centre), and
 * 3. fully on screen for both bodies: radius <= x <= worldWidth - radius
 *    horizontally, and 2 * radius <= worldHeight vertically (balls sit on
 *    the horizontal centre line).
 *
 * The scan is linear and forward from the collision index. The last frame of
 * the horizon is never used as a fallback; if nothing qualifies the caller
 * gets NoValidFinalFrame and decides whether to resample.
 *
 * Every integrator sample is a candidate, so the final frame is generally
 * not one of the animation frames.
 *
 * @ticket 0005_canonical_frame_selection
 */
class FrameSelector
{
public:
  struct Config
  {
    double minSeparation{2.0};  // [m]
    double worldWidth{14.0};    // [m]
    double worldHeight{5.25};   // [m]
  };

  /**
   * @brief Rendered radii of the two bodies in world units
   */
  struct BodyExtents
  {
    double radiusA{0.0};  // [m]
    double radiusB{0.0};  // [m]
  };

  /**
   * @throws InvalidConfiguration if minSeparation is negative or the world
   *         size is not positive
   */
  explicit FrameSelector(const Config& config);

  /**
   * @brief Select first and final indices for a simulated run
   *
   * @param trajectory Full time-stepped trajectory
   * @param collision Event returned by CollisionSimulator
   * @param extents Rendered radii [m]
   * @return firstIndex = 0 and the earliest valid finalIndex
   * @throws NoValidFinalFrame if no post-collision sample qualifies
   */
  [[nodiscard]] CanonicalFrame select(const Trajectory& trajectory,
                                      const CollisionEvent& collision,
                                      const BodyExtents& extents) const;

  /**
   * @brief Separation and visibility test for a single sample
   *
   * Does not look at time; select() adds the post-collision requirement.
   */
  [[nodiscard]] bool isWellFormed(const TrajectoryState& state,
                                  const BodyExtents& extents) const;

  /**
   * @brief Whether a body of the given radius is fully inside the frame
   */
  [[nodiscard]] bool isVisible(double position, double radius) const;

  /**
   * @brief Index used for the approach-phase image
   */
  static constexpr std::size_t firstFrameIndex()
  {
    return 0;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_;
};

}  // namespace cpg_sim

#endif  // CPG_SIM_SELECTION_FRAME_SELECTOR_HPP
