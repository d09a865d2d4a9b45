// Ticket: 0011_generator_cli

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "cpg-exe/src/CommandLine.hpp"
#include "cpg-exe/src/DatasetWriter.hpp"
#include "cpg-render/src/CairoLabelPainter.hpp"
#include "cpg-sim/src/DataRecorder/DatasetRecorder.hpp"
#include "cpg-sim/src/Errors.hpp"
#include "cpg-sim/src/Generator/BatchGenerator.hpp"
#include "cpg-utils/src/PathUtils.hpp"

namespace
{

constexpr int kExitSuccess = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitIoError = 2;

// Samples generated (and held in memory) per round
constexpr std::size_t kChunkSize = 64;

int runGenerator(const cpg_exe::Options& options)
{
  const cpg_sim::GeneratorConfig& config = options.generator;
  cpg_sim::BatchGenerator batch{config};

  spdlog::info("Generating {} samples into {} (seed {}, {} threads)",
               config.numSamples,
               options.outputDir.string(),
               batch.getBatchSeed(),
               config.workerThreads);

  cpg_utils::ensureDirectory(
    cpg_utils::taskDirectory(options.outputDir, config.domain));

  cpg_exe::DatasetWriter const writer{
    cpg_exe::DatasetWriter::Config{options.outputDir,
                                   config.domain,
                                   options.writeVideos,
                                   options.showArrows,
                                   options.showMassLabels,
                                   std::make_shared<cpg_render::CairoLabelPainter>()},
    config.view};

  std::optional<cpg_sim::DatasetRecorder> recorder;
  if (options.writeDatabase)
  {
    recorder.emplace(cpg_sim::DatasetRecorder::Config{
      (options.outputDir / "dataset.db").string(), true});
  }

  for (std::size_t begin = 0; begin < config.numSamples; begin += kChunkSize)
  {
    std::size_t const end = std::min(begin + kChunkSize, config.numSamples);
    auto const samples = batch.generateRange(begin, end);

    for (const auto& sample : samples)
    {
      auto const directory = writer.write(sample);
      if (recorder)
      {
        recorder->recordSample(sample);
      }
      spdlog::info("{}: m=({:.2f}, {:.2f}) v=({:.2f}, {:.2f}) -> ({:.3f}, {:.3f}), "
                   "final frame {} [{}]",
                   sample.taskId,
                   sample.scene.initial.massA,
                   sample.scene.initial.massB,
                   sample.scene.initial.velocityA,
                   sample.scene.initial.velocityB,
                   sample.scene.collision.velocityAAfter,
                   sample.scene.collision.velocityBAfter,
                   sample.scene.frames.finalIndex,
                   directory.string());
    }

    if (recorder)
    {
      recorder->flush();
    }
  }

  auto const stats = batch.getStats();
  spdlog::info("Done: {} samples, {} rejected (no collision), {} rejected "
               "(no valid final frame)",
               config.numSamples,
               stats.noCollision,
               stats.noFinalFrame);
  return kExitSuccess;
}

}  // anonymous namespace

int main(int argc, char* argv[])
{
  auto logger = spdlog::stdout_color_mt("cpg");
  spdlog::set_default_logger(logger);

  cpg_exe::Options options{};
  try
  {
    options = cpg_exe::parseCommandLine(argc, argv);
  }
  catch (const cpg_sim::InvalidConfiguration& e)
  {
    spdlog::error("{}", e.what());
    std::cerr << cpg_exe::usage(argv[0]);
    return kExitConfigError;
  }

  if (options.help)
  {
    std::cout << cpg_exe::usage(argv[0]);
    return kExitSuccess;
  }

  if (options.verbose)
  {
    spdlog::set_level(spdlog::level::debug);
  }

  try
  {
    return runGenerator(options);
  }
  catch (const cpg_sim::InvalidConfiguration& e)
  {
    spdlog::error("Configuration error: {}", e.what());
    return kExitConfigError;
  }
  catch (const cpg_sim::NoCollisionDetected& e)
  {
    spdlog::error("Generation failed: {}", e.what());
    return kExitConfigError;
  }
  catch (const cpg_sim::NoValidFinalFrame& e)
  {
    spdlog::error("Generation failed: {}", e.what());
    return kExitConfigError;
  }
  catch (const std::exception& e)
  {
    spdlog::error("I/O failure: {}", e.what());
    return kExitIoError;
  }
}
