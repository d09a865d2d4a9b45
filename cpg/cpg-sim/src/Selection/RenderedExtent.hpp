// Ticket: 0005_canonical_frame_selection

#ifndef CPG_SIM_SELECTION_RENDERED_EXTENT_HPP
#define CPG_SIM_SELECTION_RENDERED_EXTENT_HPP

#include "cpg-sim/src/Config/GeneratorConfig.hpp"

namespace cpg_sim
{

/**
 * @brief Rendered (visual) radius of a ball from its mass
 *
 * Linear in mass over the sampler's mass range, from
 * ballRadiusBase * radiusScaleMin (lightest) to ballRadiusBase *
 * radiusScaleMax (heaviest), truncated to whole pixels. A degenerate mass
 * range maps to the midpoint scale. Only affects drawing and the visibility
 * test; contact uses SimulatorConfig::contactRadius.
 *
 * @param mass Ball mass [kg]
 * @param massRange Sampler mass range [kg]
 * @param view Image geometry and radius scale
 * @return Radius [px]
 */
int renderedRadiusPixels(double mass, const Range& massRange, const ViewConfig& view);

/**
 * @brief renderedRadiusPixels() converted to world units
 * @return Radius [m]
 */
double renderedRadiusMeters(double mass, const Range& massRange, const ViewConfig& view);

}  // namespace cpg_sim

#endif  // CPG_SIM_SELECTION_RENDERED_EXTENT_HPP
