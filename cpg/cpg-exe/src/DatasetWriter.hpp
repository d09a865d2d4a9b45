// Ticket: 0011_generator_cli
// Modified: 0012_scene_labels

#ifndef CPG_EXE_DATASET_WRITER_HPP
#define CPG_EXE_DATASET_WRITER_HPP

#include <filesystem>
#include <memory>
#include <string>

#include "cpg-render/src/SceneRenderer.hpp"
#include "cpg-sim/src/Generator/BatchGenerator.hpp"

namespace cpg_exe
{

/**
 * @brief Writes one sample's files under the output directory
 *
 * Layout:
 *   <outputDir>/<domain>_task/<taskId>/first_frame.png
 *                                      final_frame.png
 *                                      prompt.txt
 *                                      ground_truth/frame_NNNN.png
 *
 * @ticket 0011_generator_cli
 */
class DatasetWriter
{
public:
  struct Config
  {
    std::filesystem::path outputDir;
    std::string domain;
    bool writeVideos{true};
    bool showArrows{true};
    bool showMassLabels{true};
    std::shared_ptr<const cpg_render::LabelPainter> labels;  // None: no text
  };

  DatasetWriter(const Config& config, const cpg_sim::ViewConfig& view);

  /**
   * @brief Render and write all files of a sample
   * @return The sample directory
   * @throws std::runtime_error on any file system or encoding failure
   */
  std::filesystem::path write(const cpg_sim::TaskSample& sample) const;

private:
  Config config_;
  cpg_render::SceneRenderer renderer_;
};

}  // namespace cpg_exe

#endif  // CPG_EXE_DATASET_WRITER_HPP
