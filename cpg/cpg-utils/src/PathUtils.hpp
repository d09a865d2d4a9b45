#ifndef CPG_UTILS_PATH_UTILS_HPP
#define CPG_UTILS_PATH_UTILS_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace cpg_utils
{

/**
 * Directory holding every sample of a domain.
 *
 * Example:
 *   taskDirectory("out", "collision_physics")
 *   Returns: out/collision_physics_task
 */
std::filesystem::path taskDirectory(const std::filesystem::path& outputDir,
                                    const std::string& domain);

/**
 * Directory of a single sample.
 *
 * Example:
 *   sampleDirectory("out", "collision_physics", "collision_physics_0003")
 *   Returns: out/collision_physics_task/collision_physics_0003
 */
std::filesystem::path sampleDirectory(const std::filesystem::path& outputDir,
                                      const std::string& domain,
                                      const std::string& taskId);

/**
 * File name of an animation frame, zero-padded to 4 digits
 * (frame_0000.png, frame_0001.png, ...).
 */
std::string frameFileName(std::size_t frameNumber);

/**
 * Create a directory and its parents if missing.
 *
 * @throws std::runtime_error if the directory cannot be created
 */
void ensureDirectory(const std::filesystem::path& directory);

/**
 * Write text to a file, replacing any previous content.
 *
 * @throws std::runtime_error if the file cannot be written
 */
void writeTextFile(const std::filesystem::path& path, const std::string& text);

}  // namespace cpg_utils

#endif  // CPG_UTILS_PATH_UTILS_HPP
