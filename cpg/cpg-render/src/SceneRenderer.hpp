// Ticket: 0009_scene_rendering
// Modified: 0012_scene_labels

#ifndef CPG_RENDER_SCENE_RENDERER_HPP
#define CPG_RENDER_SCENE_RENDERER_HPP

#include <cstddef>
#include <memory>
#include <vector>

#include "cpg-render/src/Draw.hpp"
#include "cpg-render/src/Image.hpp"
#include "cpg-render/src/LabelPainter.hpp"
#include "cpg-sim/src/Config/GeneratorConfig.hpp"
#include "cpg-sim/src/Generator/SceneDescription.hpp"

namespace cpg_render
{

/**
 * @brief Draws SceneDescription states onto images
 *
 * World x maps to pixel x = x / worldWidth * imageWidth; both balls sit on
 * the vertical centre row. Ball A is red, ball B is blue, on white. The
 * renderer only reads the scene; all physical values come from it.
 *
 * With a LabelPainter configured, every frame carries each ball's mass
 * ("4.8kg", white, centred on the ball), and every drawn velocity arrow
 * carries its speed ("3.5m/s", arrow colour, above the arrow's midpoint).
 * Without one, frames are unlabelled.
 *
 * @ticket 0009_scene_rendering
 */
class SceneRenderer
{
public:
  struct Config
  {
    bool showVelocityArrows{true};
    bool showMassLabels{true};
    ArrowStyle arrow;
    Rgb background{Colors::kWhite};
    double massLabelScale{0.5};      // Font size per pixel of ball radius
    double velocityLabelSize{14.0};  // [px]
    double velocityLabelLift{18.0};  // Label centre above the arrow [px]
    std::shared_ptr<const LabelPainter> labels;
  };

  explicit SceneRenderer(const cpg_sim::ViewConfig& view);
  SceneRenderer(const cpg_sim::ViewConfig& view, const Config& config);

  /**
   * @brief Draw trajectory sample `index`
   * @param arrows Annotate with the sample's velocities (also requires
   *        Config::showVelocityArrows)
   * @throws std::out_of_range if index is past the trajectory
   */
  [[nodiscard]] Image renderState(const cpg_sim::SceneDescription& scene,
                                  std::size_t index,
                                  bool arrows) const;

  /**
   * @brief Approach-phase image with the initial velocities
   */
  [[nodiscard]] Image renderFirstFrame(const cpg_sim::SceneDescription& scene) const;

  /**
   * @brief Post-collision image at the canonical final index
   */
  [[nodiscard]] Image renderFinalFrame(const cpg_sim::SceneDescription& scene) const;

  /**
   * @brief Trajectory indices shown in the animation
   *
   * Every substepsPerFrame-th sample starting at 0, i.e. one per video frame.
   */
  [[nodiscard]] static std::vector<std::size_t> animationIndices(
    const cpg_sim::SceneDescription& scene);

  /**
   * @brief All animation frames, without arrows
   */
  [[nodiscard]] std::vector<Image> renderAnimationFrames(
    const cpg_sim::SceneDescription& scene) const;

  /**
   * @brief Pixel column of a world position
   */
  [[nodiscard]] double toPixelX(double worldX) const;

  [[nodiscard]] double centreRow() const;

private:
  void drawMassLabel(const LabelPainter& labels,
                     Image& image,
                     double cx,
                     double cy,
                     int radius,
                     double mass) const;

  void drawSpeedLabel(const LabelPainter& labels,
                      Image& image,
                      double cx,
                      double cy,
                      int radius,
                      double velocity) const;

  cpg_sim::ViewConfig view_;
  Config config_;
};

}  // namespace cpg_render

#endif  // CPG_RENDER_SCENE_RENDERER_HPP
