// Ticket: 0006_sample_generation_pipeline

#ifndef CPG_SIM_GENERATOR_SCENE_DESCRIPTION_HPP
#define CPG_SIM_GENERATOR_SCENE_DESCRIPTION_HPP

#include "cpg-sim/src/DataTypes/CollisionEvent.hpp"
#include "cpg-sim/src/DataTypes/InitialConditions.hpp"
#include "cpg-sim/src/DataTypes/Trajectory.hpp"
#include "cpg-sim/src/Diagnostics/ConservationCheck.hpp"

namespace cpg_sim
{

/**
 * @brief Everything the core hands to the rendering, prompt and recording
 * collaborators for one sample
 *
 * Consumers read physical values from here and never modify them, so the
 * images, animation, prompt text and dataset record always agree.
 *
 * @ticket 0006_sample_generation_pipeline
 */
struct SceneDescription
{
  InitialConditions initial;
  double contactRadius{0.0};  // Physical radius used for contact [m]
  int radiusPixelsA{0};       // Rendered radius of A [px]
  int radiusPixelsB{0};       // Rendered radius of B [px]
  int substepsPerFrame{1};    // Trajectory samples per animation frame

  Trajectory trajectory;
  CollisionEvent collision;
  CanonicalFrame frames;
  ConservationCheck::Report conservation;

  [[nodiscard]] const TrajectoryState& firstState() const
  {
    return trajectory[frames.firstIndex];
  }

  [[nodiscard]] const TrajectoryState& finalState() const
  {
    return trajectory[frames.finalIndex];
  }
};

}  // namespace cpg_sim

#endif  // CPG_SIM_GENERATOR_SCENE_DESCRIPTION_HPP
