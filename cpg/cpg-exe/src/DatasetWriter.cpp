// Ticket: 0011_generator_cli

#include "cpg-exe/src/DatasetWriter.hpp"

#include <spdlog/spdlog.h>

#include "cpg-render/src/PngWriter.hpp"
#include "cpg-utils/src/PathUtils.hpp"

namespace cpg_exe
{

namespace
{

cpg_render::SceneRenderer::Config rendererConfig(const DatasetWriter::Config& config)
{
  cpg_render::SceneRenderer::Config rendererConfig{};
  rendererConfig.showVelocityArrows = config.showArrows;
  rendererConfig.showMassLabels = config.showMassLabels;
  rendererConfig.labels = config.labels;
  return rendererConfig;
}

}  // anonymous namespace

DatasetWriter::DatasetWriter(const Config& config, const cpg_sim::ViewConfig& view)
  : config_{config}, renderer_{view, rendererConfig(config)}
{
}

std::filesystem::path DatasetWriter::write(const cpg_sim::TaskSample& sample) const
{
  std::filesystem::path const directory =
    cpg_utils::sampleDirectory(config_.outputDir, config_.domain, sample.taskId);
  cpg_utils::ensureDirectory(directory);

  cpg_render::writePng(directory / "first_frame.png",
                       renderer_.renderFirstFrame(sample.scene));
  cpg_render::writePng(directory / "final_frame.png",
                       renderer_.renderFinalFrame(sample.scene));
  cpg_utils::writeTextFile(directory / "prompt.txt", sample.prompt);

  if (config_.writeVideos)
  {
    std::filesystem::path const frameDir = directory / "ground_truth";
    cpg_utils::ensureDirectory(frameDir);

    // Rendered one at a time to keep memory flat
    auto const indices = cpg_render::SceneRenderer::animationIndices(sample.scene);
    for (std::size_t frame = 0; frame < indices.size(); ++frame)
    {
      cpg_render::writePng(
        frameDir / cpg_utils::frameFileName(frame),
        renderer_.renderState(sample.scene, indices[frame], false));
    }
    spdlog::debug("DatasetWriter: {} animation frames for {}",
                  indices.size(),
                  sample.taskId);
  }

  return directory;
}

}  // namespace cpg_exe
