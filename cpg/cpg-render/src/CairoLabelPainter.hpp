// Ticket: 0012_scene_labels

#ifndef CPG_RENDER_CAIRO_LABEL_PAINTER_HPP
#define CPG_RENDER_CAIRO_LABEL_PAINTER_HPP

#include <stdexcept>
#include <string>

#include "cpg-render/src/LabelPainter.hpp"

namespace cpg_render
{

class LabelException final : public std::runtime_error
{
public:
  explicit LabelException(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief LabelPainter backed by Cairo's toy text API
 *
 * Each label is rendered into an A8 coverage mask the size of the target
 * image, then alpha-blended onto it in the label colour. The font is
 * resolved through fontconfig; an unknown family falls back to Cairo's
 * default sans face.
 *
 * @ticket 0012_scene_labels
 */
class CairoLabelPainter final : public LabelPainter
{
public:
  struct Config
  {
    std::string fontFamily{"DejaVu Sans"};
    bool bold{false};
  };

  CairoLabelPainter();
  explicit CairoLabelPainter(const Config& config);

  /**
   * @throws LabelException if Cairo reports an error status
   */
  void drawLabel(Image& image,
                 double cx,
                 double cy,
                 const std::string& text,
                 double fontSize,
                 Rgb color) const override;

private:
  Config config_;
};

}  // namespace cpg_render

#endif  // CPG_RENDER_CAIRO_LABEL_PAINTER_HPP
