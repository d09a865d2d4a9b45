// Ticket: 0009_scene_rendering
// Modified: 0012_scene_labels

#ifndef CPG_RENDER_DRAW_HPP
#define CPG_RENDER_DRAW_HPP

#include "cpg-render/src/Image.hpp"

namespace cpg_render
{

/**
 * @brief Arrow geometry for velocity annotations
 */
struct ArrowStyle
{
  double pixelsPerUnitVelocity{10.0};  // [px / (m/s)]
  int shaftWidth{3};                   // [px]
  int headSize{8};                     // Head length; base is headSize / 2 [px]
  double minLength{5.0};               // Shorter arrows are not drawn [px]
  Rgb color{Colors::kArrow};
};

/**
 * @brief Filled disc of all pixels whose centre distance is <= radius
 */
void fillCircle(Image& image, double cx, double cy, double radius, Rgb color);

/**
 * @brief Axis-aligned filled rectangle [x0, x1] x [y0, y1] (inclusive)
 */
void fillRect(Image& image, int x0, int y0, int x1, int y1, Rgb color);

/**
 * @brief Filled triangle, edges inclusive
 */
void fillTriangle(Image& image,
                  double x0,
                  double y0,
                  double x1,
                  double y1,
                  double x2,
                  double y2,
                  Rgb color);

/**
 * @brief Ball with a 2 px black outline
 */
void drawBall(Image& image, double cx, double cy, int radius, Rgb fill);

/**
 * @brief Horizontal velocity arrow starting at the ball edge
 *
 * The arrow points in the direction of motion and is
 * |velocity| * pixelsPerUnitVelocity long, followed by a triangular head.
 *
 * @return false if the arrow was too short to draw
 */
bool drawVelocityArrow(Image& image,
                       double cx,
                       double cy,
                       int radius,
                       double velocity,
                       const ArrowStyle& style = ArrowStyle{});

/**
 * @brief Pixel column halfway along the arrow drawVelocityArrow would draw
 */
double arrowMidpointX(double cx,
                      int radius,
                      double velocity,
                      const ArrowStyle& style = ArrowStyle{});

}  // namespace cpg_render

#endif  // CPG_RENDER_DRAW_HPP
