// Ticket: 0007_batch_generation

#ifndef CPG_SIM_GENERATOR_BATCH_GENERATOR_HPP
#define CPG_SIM_GENERATOR_BATCH_GENERATOR_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cpg-sim/src/Config/GeneratorConfig.hpp"
#include "cpg-sim/src/Generator/SampleGenerator.hpp"
#include "cpg-sim/src/Generator/SceneDescription.hpp"

namespace cpg_sim
{

/**
 * @brief One finished dataset entry
 */
struct TaskSample
{
  std::string taskId;        // e.g. "collision_physics_0007"
  std::size_t index{0};      // Position in the batch
  std::uint64_t runSeed{0};  // Seed of the accepted attempt
  std::size_t attempts{1};   // Attempts needed (1 = first draw accepted)
  SceneDescription scene;
  std::string prompt;
};

/**
 * @brief Generates a batch of independent samples
 *
 * Each attempt of each sample gets its own std::mt19937_64 seeded through
 * deriveRunSeed(batchSeed, index, attempt), so a batch is identical for any
 * number of worker threads.
 *
 * Resample policy: NoCollisionDetected and NoValidFinalFrame are logged and
 * the sample is redrawn with the next attempt's stream, up to
 * maxAttemptsPerSample; after that the last failure is rethrown.
 * InvalidConfiguration is never retried.
 *
 * Workers (std::jthread) pull sample indices from an atomic counter and
 * write into pre-sized result slots; nothing else is shared.
 *
 * @ticket 0007_batch_generation
 */
class BatchGenerator
{
public:
  /**
   * @brief Rejection counters for the batch so far
   */
  struct Stats
  {
    std::size_t noCollision{0};
    std::size_t noFinalFrame{0};
  };

  /**
   * @param config Batch configuration; a missing seed is replaced by a
   *        random one (logged at info level)
   * @throws InvalidConfiguration if config.validate() fails
   */
  explicit BatchGenerator(const GeneratorConfig& config);

  BatchGenerator(const BatchGenerator&) = delete;
  BatchGenerator& operator=(const BatchGenerator&) = delete;
  BatchGenerator(BatchGenerator&&) = delete;
  BatchGenerator& operator=(BatchGenerator&&) = delete;
  ~BatchGenerator() = default;

  /**
   * @brief Generate sample `index`, resampling on per-sample failures
   * @throws NoCollisionDetected or NoValidFinalFrame after the last attempt
   */
  [[nodiscard]] TaskSample generateSample(std::size_t index) const;

  /**
   * @brief Generate samples [begin, end) in index order
   *
   * Uses up to workerThreads threads. If any sample fails for good, the
   * failure of the lowest such index is rethrown after all workers finish.
   */
  [[nodiscard]] std::vector<TaskSample> generateRange(std::size_t begin,
                                                      std::size_t end) const;

  /**
   * @brief Generate the whole batch (numSamples entries)
   */
  [[nodiscard]] std::vector<TaskSample> generateAll() const;

  [[nodiscard]] std::uint64_t getBatchSeed() const
  {
    return batchSeed_;
  }

  [[nodiscard]] Stats getStats() const;

  [[nodiscard]] const GeneratorConfig& getConfig() const
  {
    return generator_.getConfig();
  }

  /**
   * @brief Dataset identifier for a sample
   * @return "<domain>_<index zero-padded to 4 digits>"
   */
  static std::string taskId(const std::string& domain, std::size_t index);

private:
  SampleGenerator generator_;
  std::uint64_t batchSeed_;

  mutable std::atomic<std::size_t> noCollision_{0};
  mutable std::atomic<std::size_t> noFinalFrame_{0};
};

}  // namespace cpg_sim

#endif  // CPG_SIM_GENERATOR_BATCH_GENERATOR_HPP
