// Ticket: 0009_scene_rendering
// Modified: 0012_scene_labels

#include "cpg-render/src/Draw.hpp"

#include <algorithm>
#include <cmath>

namespace cpg_render
{

namespace
{

constexpr int kOutlineWidth = 2;

double edge(double ax, double ay, double bx, double by, double px, double py)
{
  return (bx - ax) * (py - ay) - (by - ay) * (px - ax);
}

}  // anonymous namespace

void fillCircle(Image& image, double cx, double cy, double radius, Rgb color)
{
  if (radius < 0.0)
  {
    return;
  }

  int const yMin = static_cast<int>(std::floor(cy - radius));
  int const yMax = static_cast<int>(std::ceil(cy + radius));
  int const xMin = static_cast<int>(std::floor(cx - radius));
  int const xMax = static_cast<int>(std::ceil(cx + radius));
  double const r2 = radius * radius;

  for (int y = yMin; y <= yMax; ++y)
  {
    double const dy = static_cast<double>(y) - cy;
    for (int x = xMin; x <= xMax; ++x)
    {
      double const dx = static_cast<double>(x) - cx;
      if (dx * dx + dy * dy <= r2)
      {
        image.setPixel(x, y, color);
      }
    }
  }
}

void fillRect(Image& image, int x0, int y0, int x1, int y1, Rgb color)
{
  int const xLo = std::max(std::min(x0, x1), 0);
  int const xHi = std::min(std::max(x0, x1), image.width() - 1);
  int const yLo = std::max(std::min(y0, y1), 0);
  int const yHi = std::min(std::max(y0, y1), image.height() - 1);

  for (int y = yLo; y <= yHi; ++y)
  {
    for (int x = xLo; x <= xHi; ++x)
    {
      image.setPixel(x, y, color);
    }
  }
}

void fillTriangle(Image& image,
                  double x0,
                  double y0,
                  double x1,
                  double y1,
                  double x2,
                  double y2,
                  Rgb color)
{
  double const area = edge(x0, y0, x1, y1, x2, y2);
  if (area == 0.0)
  {
    return;
  }

  int const xMin = static_cast<int>(std::floor(std::min({x0, x1, x2})));
  int const xMax = static_cast<int>(std::ceil(std::max({x0, x1, x2})));
  int const yMin = static_cast<int>(std::floor(std::min({y0, y1, y2})));
  int const yMax = static_cast<int>(std::ceil(std::max({y0, y1, y2})));

  for (int y = yMin; y <= yMax; ++y)
  {
    for (int x = xMin; x <= xMax; ++x)
    {
      double const px = static_cast<double>(x);
      double const py = static_cast<double>(y);
      // Same sign as the triangle's orientation (or on an edge)
      double const w0 = edge(x1, y1, x2, y2, px, py) * area;
      double const w1 = edge(x2, y2, x0, y0, px, py) * area;
      double const w2 = edge(x0, y0, x1, y1, px, py) * area;
      if (w0 >= 0.0 && w1 >= 0.0 && w2 >= 0.0)
      {
        image.setPixel(x, y, color);
      }
    }
  }
}

void drawBall(Image& image, double cx, double cy, int radius, Rgb fill)
{
  fillCircle(image, cx, cy, static_cast<double>(radius), Colors::kBlack);
  if (radius > kOutlineWidth)
  {
    fillCircle(
      image, cx, cy, static_cast<double>(radius - kOutlineWidth), fill);
  }
}

bool drawVelocityArrow(Image& image,
                       double cx,
                       double cy,
                       int radius,
                       double velocity,
                       const ArrowStyle& style)
{
  double const length = std::abs(velocity) * style.pixelsPerUnitVelocity;
  if (length < style.minLength)
  {
    return false;
  }

  double const direction = velocity > 0.0 ? 1.0 : -1.0;
  double const startX = cx + direction * static_cast<double>(radius);
  double const endX = startX + direction * length;

  // ===== Shaft =====
  int const halfWidth = style.shaftWidth / 2;
  int const row = static_cast<int>(std::lround(cy));
  fillRect(image,
           static_cast<int>(std::lround(startX)),
           row - halfWidth,
           static_cast<int>(std::lround(endX)),
           row - halfWidth + style.shaftWidth - 1,
           style.color);

  // ===== Head =====
  double const baseX = endX - direction * static_cast<double>(style.headSize);
  double const halfBase = static_cast<double>(style.headSize / 2);
  fillTriangle(image,
               endX,
               cy,
               baseX,
               cy - halfBase,
               baseX,
               cy + halfBase,
               style.color);

  return true;
}

double arrowMidpointX(double cx,
                      int radius,
                      double velocity,
                      const ArrowStyle& style)
{
  double const direction = velocity > 0.0 ? 1.0 : -1.0;
  double const length = std::abs(velocity) * style.pixelsPerUnitVelocity;
  return cx + direction * (static_cast<double>(radius) + 0.5 * length);
}

}  // namespace cpg_render
