// Ticket: 0006_sample_generation_pipeline

#ifndef CPG_SIM_GENERATOR_SAMPLE_GENERATOR_HPP
#define CPG_SIM_GENERATOR_SAMPLE_GENERATOR_HPP

#include <random>

#include "cpg-sim/src/Config/GeneratorConfig.hpp"
#include "cpg-sim/src/Generator/SceneDescription.hpp"
#include "cpg-sim/src/Physics/CollisionSimulator.hpp"
#include "cpg-sim/src/Physics/ParameterSampler.hpp"
#include "cpg-sim/src/Selection/FrameSelector.hpp"

namespace cpg_sim
{

/**
 * @brief One sample: sample parameters -> integrate -> select frames
 *
 * Single sequential pass with no state shared between calls. Failures
 * (NoCollisionDetected, NoValidFinalFrame) propagate to the caller; retrying
 * with fresh parameters is BatchGenerator's decision, not this class's.
 *
 * @ticket 0006_sample_generation_pipeline
 */
class SampleGenerator
{
public:
  /**
   * @param config Batch configuration (validated here)
   * @throws InvalidConfiguration if config.validate() fails
   */
  explicit SampleGenerator(const GeneratorConfig& config);

  /**
   * @brief Draw initial conditions from rng and run the full pipeline
   * @param rng Per-run random stream
   */
  [[nodiscard]] SceneDescription generate(std::mt19937_64& rng) const;

  /**
   * @brief Run the deterministic part of the pipeline for given conditions
   * @throws NoCollisionDetected, NoValidFinalFrame
   */
  [[nodiscard]] SceneDescription describe(const InitialConditions& conditions) const;

  /**
   * @brief Frame selection settings derived from the generator configuration
   *
   * World height follows the image aspect ratio.
   */
  static FrameSelector::Config frameSelectorConfig(const GeneratorConfig& config);

  [[nodiscard]] const GeneratorConfig& getConfig() const
  {
    return config_;
  }

private:
  GeneratorConfig config_;
  ParameterSampler sampler_;
  CollisionSimulator simulator_;
  FrameSelector selector_;
};

}  // namespace cpg_sim

#endif  // CPG_SIM_GENERATOR_SAMPLE_GENERATOR_HPP
