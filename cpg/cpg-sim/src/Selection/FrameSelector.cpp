// Ticket: 0005_canonical_frame_selection

#include "cpg-sim/src/Selection/FrameSelector.hpp"

#include <sstream>

#include "cpg-sim/src/Errors.hpp"

namespace cpg_sim
{

FrameSelector::FrameSelector(const Config& config)
  : config_{config}
{
  if (config_.minSeparation < 0.0)
  {
    throw InvalidConfiguration{
      "FrameSelector: minSeparation must not be negative"};
  }
  if (config_.worldWidth <= 0.0 || config_.worldHeight <= 0.0)
  {
    throw InvalidConfiguration{"FrameSelector: world size must be positive"};
  }
}

bool FrameSelector::isVisible(double position, double radius) const
{
  bool const horizontal =
    position >= radius && position <= config_.worldWidth - radius;
  bool const vertical = 2.0 * radius <= config_.worldHeight;
  return horizontal && vertical;
}

bool FrameSelector::isWellFormed(const TrajectoryState& state,
                                 const BodyExtents& extents) const
{
  return state.separation() >= config_.minSeparation &&
         isVisible(state.positionA, extents.radiusA) &&
         isVisible(state.positionB, extents.radiusB);
}

CanonicalFrame FrameSelector::select(const Trajectory& trajectory,
                                     const CollisionEvent& collision,
                                     const BodyExtents& extents) const
{
  for (std::size_t index = collision.trajectoryIndex; index < trajectory.size();
       ++index)
  {
    const TrajectoryState& state = trajectory[index];
    if (state.time > collision.time && isWellFormed(state, extents))
    {
      return CanonicalFrame{firstFrameIndex(), index};
    }
  }

  std::ostringstream oss;
  oss << "FrameSelector: no frame after the collision at t="
      << collision.time << " s is separated by >= " << config_.minSeparation
      << " m with both bodies visible (" << trajectory.size()
      << " samples)";
  throw NoValidFinalFrame{oss.str()};
}

}  // namespace cpg_sim
