// Ticket: 0012_scene_labels

#include "cpg-render/src/CairoLabelPainter.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <cairo.h>

namespace cpg_render
{

namespace
{

struct SurfaceDestroyer
{
  void operator()(cairo_surface_t* surface) const
  {
    cairo_surface_destroy(surface);
  }
};

struct ContextDestroyer
{
  void operator()(cairo_t* cr) const
  {
    cairo_destroy(cr);
  }
};

using UniqueSurface = std::unique_ptr<cairo_surface_t, SurfaceDestroyer>;
using UniqueContext = std::unique_ptr<cairo_t, ContextDestroyer>;

void checkStatus(cairo_status_t status, const char* stage)
{
  if (status != CAIRO_STATUS_SUCCESS)
  {
    throw LabelException{std::string{"CairoLabelPainter: "} + stage + ": " +
                         cairo_status_to_string(status)};
  }
}

uint8_t blend(uint8_t under, uint8_t over, unsigned coverage)
{
  unsigned const mixed = (static_cast<unsigned>(under) * (255u - coverage) +
                          static_cast<unsigned>(over) * coverage + 127u) /
                         255u;
  return static_cast<uint8_t>(mixed);
}

}  // anonymous namespace

CairoLabelPainter::CairoLabelPainter()
  : CairoLabelPainter{Config{}}
{
}

CairoLabelPainter::CairoLabelPainter(const Config& config)
  : config_{config}
{
}

void CairoLabelPainter::drawLabel(Image& image,
                                  double cx,
                                  double cy,
                                  const std::string& text,
                                  double fontSize,
                                  Rgb color) const
{
  if (text.empty() || !(fontSize > 0.0))
  {
    return;
  }

  UniqueSurface const surface{
    cairo_image_surface_create(CAIRO_FORMAT_A8, image.width(), image.height())};
  checkStatus(cairo_surface_status(surface.get()), "surface");
  UniqueContext const cr{cairo_create(surface.get())};
  checkStatus(cairo_status(cr.get()), "context");

  cairo_select_font_face(cr.get(),
                         config_.fontFamily.c_str(),
                         CAIRO_FONT_SLANT_NORMAL,
                         config_.bold ? CAIRO_FONT_WEIGHT_BOLD
                                      : CAIRO_FONT_WEIGHT_NORMAL);
  cairo_set_font_size(cr.get(), fontSize);

  cairo_text_extents_t extents{};
  cairo_text_extents(cr.get(), text.c_str(), &extents);

  // Place the ink box, not the advance box, on the centre
  double const originX = cx - (extents.x_bearing + 0.5 * extents.width);
  double const originY = cy - (extents.y_bearing + 0.5 * extents.height);
  cairo_set_source_rgba(cr.get(), 0.0, 0.0, 0.0, 1.0);
  cairo_move_to(cr.get(), originX, originY);
  cairo_show_text(cr.get(), text.c_str());
  checkStatus(cairo_status(cr.get()), "show_text");

  cairo_surface_flush(surface.get());
  const unsigned char* data = cairo_image_surface_get_data(surface.get());
  int const stride = cairo_image_surface_get_stride(surface.get());

  int const xLo = std::max(static_cast<int>(std::floor(originX + extents.x_bearing)) - 1, 0);
  int const xHi = std::min(
    static_cast<int>(std::ceil(originX + extents.x_bearing + extents.width)) + 1,
    image.width() - 1);
  int const yLo = std::max(static_cast<int>(std::floor(originY + extents.y_bearing)) - 1, 0);
  int const yHi = std::min(
    static_cast<int>(std::ceil(originY + extents.y_bearing + extents.height)) + 1,
    image.height() - 1);

  for (int y = yLo; y <= yHi; ++y)
  {
    const unsigned char* row = data + static_cast<std::ptrdiff_t>(y) * stride;
    for (int x = xLo; x <= xHi; ++x)
    {
      unsigned const coverage = row[x];
      if (coverage == 0)
      {
        continue;
      }
      Rgb const under = image.at(x, y);
      image.setPixel(x,
                     y,
                     Rgb{blend(under.r, color.r, coverage),
                         blend(under.g, color.g, coverage),
                         blend(under.b, color.b, coverage)});
    }
  }
}

}  // namespace cpg_render
