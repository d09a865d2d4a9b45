// Ticket: 0009_scene_rendering

#include "cpg-render/src/PngWriter.hpp"

#include <csetjmp>
#include <cstdio>
#include <memory>
#include <vector>

#include <png.h>

namespace cpg_render
{

namespace
{

struct FileCloser
{
  void operator()(std::FILE* f) const
  {
    std::fclose(f);
  }
};

using UniqueFile = std::unique_ptr<std::FILE, FileCloser>;

/**
 * @brief libpng encode with its setjmp error model
 *
 * Only trivially destructible locals live between setjmp and the libpng
 * calls, so the longjmp back here is well defined.
 *
 * @return true on success
 */
bool encode(std::FILE* fp, const Image& image, png_bytep* rows)
{
  png_structp png =
    png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (png == nullptr)
  {
    return false;
  }
  png_infop info = png_create_info_struct(png);
  if (info == nullptr)
  {
    png_destroy_write_struct(&png, nullptr);
    return false;
  }

  if (setjmp(png_jmpbuf(png)))
  {
    png_destroy_write_struct(&png, &info);
    return false;
  }

  png_init_io(png, fp);
  png_set_IHDR(png,
               info,
               static_cast<png_uint_32>(image.width()),
               static_cast<png_uint_32>(image.height()),
               8,
               PNG_COLOR_TYPE_RGB,
               PNG_INTERLACE_NONE,
               PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);
  png_write_image(png, rows);
  png_write_end(png, nullptr);

  png_destroy_write_struct(&png, &info);
  return true;
}

}  // anonymous namespace

void writePng(const std::filesystem::path& path, const Image& image)
{
  UniqueFile file{std::fopen(path.string().c_str(), "wb")};
  if (!file)
  {
    throw PngException{"Failed to open " + path.string() + " for writing"};
  }

  std::vector<png_bytep> rows(static_cast<std::size_t>(image.height()));
  std::size_t const stride = static_cast<std::size_t>(image.width()) * 3;
  for (std::size_t y = 0; y < rows.size(); ++y)
  {
    // libpng takes non-const row pointers but does not write through them
    rows[y] = const_cast<png_bytep>(image.data() + y * stride);
  }

  if (!encode(file.get(), image, rows.data()))
  {
    throw PngException{"Failed to encode PNG " + path.string()};
  }

  if (std::fflush(file.get()) != 0)
  {
    throw PngException{"Failed to flush PNG " + path.string()};
  }
}

}  // namespace cpg_render
