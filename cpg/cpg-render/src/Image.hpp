// Ticket: 0009_scene_rendering

#ifndef CPG_RENDER_IMAGE_HPP
#define CPG_RENDER_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cpg_render
{

/**
 * @brief 8-bit RGB colour
 */
struct Rgb
{
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};

  bool operator==(const Rgb&) const = default;
};

namespace Colors
{
constexpr Rgb kWhite{255, 255, 255};
constexpr Rgb kBlack{0, 0, 0};
constexpr Rgb kBallA{220, 60, 60};
constexpr Rgb kBallB{60, 60, 220};
constexpr Rgb kArrow{60, 180, 60};
}  // namespace Colors

/**
 * @brief Row-major, tightly packed RGB8 raster
 *
 * Pixel (0, 0) is the top-left corner. Writes outside the raster are
 * clipped silently so shapes may extend past the border.
 *
 * @ticket 0009_scene_rendering
 */
class Image
{
public:
  /**
   * @throws std::invalid_argument if width or height is not positive
   */
  Image(int width, int height, Rgb background = Colors::kWhite);

  [[nodiscard]] int width() const
  {
    return width_;
  }

  [[nodiscard]] int height() const
  {
    return height_;
  }

  [[nodiscard]] bool contains(int x, int y) const
  {
    return x >= 0 && y >= 0 && x < width_ && y < height_;
  }

  /**
   * @brief Colour at (x, y)
   * @throws std::out_of_range if (x, y) is outside the raster
   */
  [[nodiscard]] Rgb at(int x, int y) const;

  /**
   * @brief Set (x, y); no-op outside the raster
   */
  void setPixel(int x, int y, Rgb color);

  void fill(Rgb color);

  /**
   * @brief Packed RGB bytes, width * height * 3
   */
  [[nodiscard]] const uint8_t* data() const
  {
    return pixels_.data();
  }

  /**
   * @brief Number of pixels with exactly this colour
   */
  [[nodiscard]] std::size_t countPixels(Rgb color) const;

private:
  [[nodiscard]] std::size_t offset(int x, int y) const
  {
    return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
            static_cast<std::size_t>(x)) *
           3;
  }

  int width_;
  int height_;
  std::vector<uint8_t> pixels_;
};

}  // namespace cpg_render

#endif  // CPG_RENDER_IMAGE_HPP
