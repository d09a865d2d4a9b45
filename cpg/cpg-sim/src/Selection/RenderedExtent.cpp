// Ticket: 0005_canonical_frame_selection

#include "cpg-sim/src/Selection/RenderedExtent.hpp"

#include <algorithm>

namespace cpg_sim
{

int renderedRadiusPixels(double mass, const Range& massRange, const ViewConfig& view)
{
  double const span = massRange.max - massRange.min;
  double ratio = 0.5;
  if (span > 0.0)
  {
    ratio = std::clamp((mass - massRange.min) / span, 0.0, 1.0);
  }

  double const minRadius = view.ballRadiusBase * view.radiusScaleMin;
  double const maxRadius = view.ballRadiusBase * view.radiusScaleMax;
  return static_cast<int>(minRadius + (maxRadius - minRadius) * ratio);
}

double renderedRadiusMeters(double mass, const Range& massRange, const ViewConfig& view)
{
  return static_cast<double>(renderedRadiusPixels(mass, massRange, view)) /
         view.pixelsPerMeter();
}

}  // namespace cpg_sim
