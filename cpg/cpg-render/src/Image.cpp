// Ticket: 0009_scene_rendering

#include "cpg-render/src/Image.hpp"

#include <sstream>
#include <stdexcept>

namespace cpg_render
{

Image::Image(int width, int height, Rgb background)
  : width_{width}, height_{height}
{
  if (width <= 0 || height <= 0)
  {
    std::ostringstream oss;
    oss << "Image size must be positive, got " << width << "x" << height;
    throw std::invalid_argument{oss.str()};
  }
  pixels_.resize(static_cast<std::size_t>(width) *
                 static_cast<std::size_t>(height) * 3);
  fill(background);
}

Rgb Image::at(int x, int y) const
{
  if (!contains(x, y))
  {
    std::ostringstream oss;
    oss << "Pixel (" << x << ", " << y << ") outside " << width_ << "x"
        << height_ << " image";
    throw std::out_of_range{oss.str()};
  }
  std::size_t const i = offset(x, y);
  return Rgb{pixels_[i], pixels_[i + 1], pixels_[i + 2]};
}

void Image::setPixel(int x, int y, Rgb color)
{
  if (!contains(x, y))
  {
    return;
  }
  std::size_t const i = offset(x, y);
  pixels_[i] = color.r;
  pixels_[i + 1] = color.g;
  pixels_[i + 2] = color.b;
}

void Image::fill(Rgb color)
{
  for (std::size_t i = 0; i < pixels_.size(); i += 3)
  {
    pixels_[i] = color.r;
    pixels_[i + 1] = color.g;
    pixels_[i + 2] = color.b;
  }
}

std::size_t Image::countPixels(Rgb color) const
{
  std::size_t count = 0;
  for (std::size_t i = 0; i < pixels_.size(); i += 3)
  {
    if (pixels_[i] == color.r && pixels_[i + 1] == color.g &&
        pixels_[i + 2] == color.b)
    {
      ++count;
    }
  }
  return count;
}

}  // namespace cpg_render
