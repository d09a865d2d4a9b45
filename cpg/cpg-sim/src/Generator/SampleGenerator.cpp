// Ticket: 0006_sample_generation_pipeline

#include "cpg-sim/src/Generator/SampleGenerator.hpp"

#include <utility>

#include "cpg-sim/src/Selection/RenderedExtent.hpp"

namespace cpg_sim
{

namespace
{

const GeneratorConfig& validated(const GeneratorConfig& config)
{
  config.validate();
  return config;
}

}  // anonymous namespace

SampleGenerator::SampleGenerator(const GeneratorConfig& config)
  : config_{validated(config)},
    sampler_{config_.sampler},
    simulator_{config_.simulator},
    selector_{frameSelectorConfig(config_)}
{
}

SceneDescription SampleGenerator::generate(std::mt19937_64& rng) const
{
  return describe(sampler_.sample(rng));
}

SceneDescription SampleGenerator::describe(
  const InitialConditions& conditions) const
{
  SceneDescription scene{};
  scene.initial = conditions;
  scene.contactRadius = config_.simulator.contactRadius;
  scene.substepsPerFrame = config_.simulator.substepsPerFrame;
  scene.radiusPixelsA =
    renderedRadiusPixels(conditions.massA, config_.sampler.mass, config_.view);
  scene.radiusPixelsB =
    renderedRadiusPixels(conditions.massB, config_.sampler.mass, config_.view);

  CollisionSimulator::Result run = simulator_.run(conditions);

  FrameSelector::BodyExtents const extents{
    renderedRadiusMeters(conditions.massA, config_.sampler.mass, config_.view),
    renderedRadiusMeters(conditions.massB, config_.sampler.mass, config_.view)};
  scene.frames = selector_.select(run.trajectory, run.collision, extents);

  scene.trajectory = std::move(run.trajectory);
  scene.collision = run.collision;
  scene.conservation = run.conservation;
  return scene;
}

FrameSelector::Config SampleGenerator::frameSelectorConfig(
  const GeneratorConfig& config)
{
  FrameSelector::Config selectorConfig{};
  selectorConfig.minSeparation = config.minFinalSeparation;
  selectorConfig.worldWidth = config.view.worldWidth;
  selectorConfig.worldHeight = config.view.worldHeight();
  return selectorConfig;
}

}  // namespace cpg_sim
