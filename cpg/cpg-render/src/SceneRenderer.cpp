// Ticket: 0009_scene_rendering
// Modified: 0012_scene_labels

#include "cpg-render/src/SceneRenderer.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

namespace cpg_render
{

SceneRenderer::SceneRenderer(const cpg_sim::ViewConfig& view)
  : SceneRenderer{view, Config{}}
{
}

SceneRenderer::SceneRenderer(const cpg_sim::ViewConfig& view,
                             const Config& config)
  : view_{view}, config_{config}
{
}

double SceneRenderer::toPixelX(double worldX) const
{
  return worldX / view_.worldWidth * static_cast<double>(view_.imageWidth);
}

double SceneRenderer::centreRow() const
{
  return static_cast<double>(view_.imageHeight / 2);
}

Image SceneRenderer::renderState(const cpg_sim::SceneDescription& scene,
                                 std::size_t index,
                                 bool arrows) const
{
  if (index >= scene.trajectory.size())
  {
    std::ostringstream oss;
    oss << "Trajectory index " << index << " out of range (size "
        << scene.trajectory.size() << ")";
    throw std::out_of_range{oss.str()};
  }

  const cpg_sim::TrajectoryState& state = scene.trajectory[index];
  Image image{view_.imageWidth, view_.imageHeight, config_.background};

  double const xA = toPixelX(state.positionA);
  double const xB = toPixelX(state.positionB);
  double const y = centreRow();

  drawBall(image, xA, y, scene.radiusPixelsA, Colors::kBallA);
  drawBall(image, xB, y, scene.radiusPixelsB, Colors::kBallB);

  const LabelPainter* const labels = config_.labels.get();
  if (labels != nullptr && config_.showMassLabels)
  {
    drawMassLabel(*labels, image, xA, y, scene.radiusPixelsA, scene.initial.massA);
    drawMassLabel(*labels, image, xB, y, scene.radiusPixelsB, scene.initial.massB);
  }

  if (arrows && config_.showVelocityArrows)
  {
    if (drawVelocityArrow(
          image, xA, y, scene.radiusPixelsA, state.velocityA, config_.arrow) &&
        labels != nullptr)
    {
      drawSpeedLabel(*labels, image, xA, y, scene.radiusPixelsA, state.velocityA);
    }
    if (drawVelocityArrow(
          image, xB, y, scene.radiusPixelsB, state.velocityB, config_.arrow) &&
        labels != nullptr)
    {
      drawSpeedLabel(*labels, image, xB, y, scene.radiusPixelsB, state.velocityB);
    }
  }

  return image;
}

void SceneRenderer::drawMassLabel(const LabelPainter& labels,
                                  Image& image,
                                  double cx,
                                  double cy,
                                  int radius,
                                  double mass) const
{
  labels.drawLabel(image,
                   cx,
                   cy,
                   fmt::format("{:.1f}kg", mass),
                   std::floor(static_cast<double>(radius) * config_.massLabelScale),
                   Colors::kWhite);
}

void SceneRenderer::drawSpeedLabel(const LabelPainter& labels,
                                   Image& image,
                                   double cx,
                                   double cy,
                                   int radius,
                                   double velocity) const
{
  labels.drawLabel(image,
                   arrowMidpointX(cx, radius, velocity, config_.arrow),
                   cy - config_.velocityLabelLift,
                   fmt::format("{:.1f}m/s", std::abs(velocity)),
                   config_.velocityLabelSize,
                   config_.arrow.color);
}

Image SceneRenderer::renderFirstFrame(const cpg_sim::SceneDescription& scene) const
{
  return renderState(scene, scene.frames.firstIndex, true);
}

Image SceneRenderer::renderFinalFrame(const cpg_sim::SceneDescription& scene) const
{
  return renderState(scene, scene.frames.finalIndex, true);
}

std::vector<std::size_t> SceneRenderer::animationIndices(
  const cpg_sim::SceneDescription& scene)
{
  std::size_t const stride =
    scene.substepsPerFrame > 0 ? static_cast<std::size_t>(scene.substepsPerFrame)
                               : 1;
  std::vector<std::size_t> indices;
  for (std::size_t i = 0; i < scene.trajectory.size(); i += stride)
  {
    indices.push_back(i);
  }
  return indices;
}

std::vector<Image> SceneRenderer::renderAnimationFrames(
  const cpg_sim::SceneDescription& scene) const
{
  std::vector<Image> frames;
  for (std::size_t const index : animationIndices(scene))
  {
    frames.push_back(renderState(scene, index, false));
  }
  return frames;
}

}  // namespace cpg_render
