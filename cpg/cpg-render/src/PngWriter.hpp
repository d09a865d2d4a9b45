// Ticket: 0009_scene_rendering

#ifndef CPG_RENDER_PNG_WRITER_HPP
#define CPG_RENDER_PNG_WRITER_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

#include "cpg-render/src/Image.hpp"

namespace cpg_render
{

class PngException final : public std::runtime_error
{
public:
  explicit PngException(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief Encode an image as 8-bit RGB PNG
 * @throws PngException if the file cannot be opened or encoding fails
 */
void writePng(const std::filesystem::path& path, const Image& image);

}  // namespace cpg_render

#endif  // CPG_RENDER_PNG_WRITER_HPP
