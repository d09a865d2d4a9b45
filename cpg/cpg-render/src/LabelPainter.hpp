// Ticket: 0012_scene_labels

#ifndef CPG_RENDER_LABEL_PAINTER_HPP
#define CPG_RENDER_LABEL_PAINTER_HPP

#include <string>

#include "cpg-render/src/Image.hpp"

namespace cpg_render
{

/**
 * @brief Draws short text labels onto an Image
 *
 * SceneRenderer only decides what a label says and where it goes; glyph
 * rasterisation is left to an implementation backed by a font library.
 *
 * @ticket 0012_scene_labels
 */
class LabelPainter
{
public:
  virtual ~LabelPainter() = default;

  /**
   * @brief Draw text with its ink box centred on (cx, cy)
   * @param fontSize Em size [px]
   * @throws std::runtime_error if the backend fails to render
   */
  virtual void drawLabel(Image& image,
                         double cx,
                         double cy,
                         const std::string& text,
                         double fontSize,
                         Rgb color) const = 0;
};

}  // namespace cpg_render

#endif  // CPG_RENDER_LABEL_PAINTER_HPP
