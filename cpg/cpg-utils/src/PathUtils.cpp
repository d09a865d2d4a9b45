#include "cpg-utils/src/PathUtils.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace cpg_utils
{

std::filesystem::path taskDirectory(const std::filesystem::path& outputDir,
                                    const std::string& domain)
{
  return outputDir / (domain + "_task");
}

std::filesystem::path sampleDirectory(const std::filesystem::path& outputDir,
                                      const std::string& domain,
                                      const std::string& taskId)
{
  return taskDirectory(outputDir, domain) / taskId;
}

std::string frameFileName(std::size_t frameNumber)
{
  std::ostringstream oss;
  oss << "frame_" << std::setw(4) << std::setfill('0') << frameNumber << ".png";
  return oss.str();
}

void ensureDirectory(const std::filesystem::path& directory)
{
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec || !std::filesystem::is_directory(directory))
  {
    throw std::runtime_error("Failed to create directory " +
                             directory.string() + ": " + ec.message());
  }
}

void writeTextFile(const std::filesystem::path& path, const std::string& text)
{
  std::ofstream out{path, std::ios::out | std::ios::trunc};
  if (!out)
  {
    throw std::runtime_error("Failed to open " + path.string() +
                             " for writing");
  }
  out << text;
  out.flush();
  if (!out)
  {
    throw std::runtime_error("Failed to write " + path.string());
  }
}

}  // namespace cpg_utils
