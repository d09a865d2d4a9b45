// Ticket: 0007_batch_generation

#include "cpg-sim/src/Generator/BatchGenerator.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cpg-sim/src/Errors.hpp"
#include "cpg-sim/src/Generator/RunSeed.hpp"
#include "cpg-sim/src/Prompts/PromptBuilder.hpp"

namespace cpg_sim
{

namespace
{

std::uint64_t resolveBatchSeed(const GeneratorConfig& config)
{
  if (config.randomSeed)
  {
    return *config.randomSeed;
  }
  std::uint64_t const seed = randomBatchSeed();
  spdlog::info("BatchGenerator: no seed given, using random seed {}", seed);
  return seed;
}

}  // anonymous namespace

BatchGenerator::BatchGenerator(const GeneratorConfig& config)
  : generator_{config}, batchSeed_{resolveBatchSeed(config)}
{
}

std::string BatchGenerator::taskId(const std::string& domain, std::size_t index)
{
  return fmt::format("{}_{:04d}", domain, index);
}

BatchGenerator::Stats BatchGenerator::getStats() const
{
  return Stats{noCollision_.load(), noFinalFrame_.load()};
}

TaskSample BatchGenerator::generateSample(std::size_t index) const
{
  const GeneratorConfig& config = generator_.getConfig();
  std::exception_ptr lastFailure;

  for (std::size_t attempt = 0; attempt < config.maxAttemptsPerSample; ++attempt)
  {
    std::uint64_t const runSeed = deriveRunSeed(batchSeed_, index, attempt);
    std::mt19937_64 rng = makeRunEngine(runSeed);

    try
    {
      TaskSample sample{};
      sample.scene = generator_.generate(rng);
      sample.prompt = PromptBuilder::build(sample.scene.initial, rng);
      sample.taskId = taskId(config.domain, index);
      sample.index = index;
      sample.runSeed = runSeed;
      sample.attempts = attempt + 1;
      return sample;
    }
    catch (const NoCollisionDetected& e)
    {
      noCollision_.fetch_add(1);
      spdlog::warn("BatchGenerator: sample {} attempt {} rejected: {}",
                   index,
                   attempt + 1,
                   e.what());
      lastFailure = std::current_exception();
    }
    catch (const NoValidFinalFrame& e)
    {
      noFinalFrame_.fetch_add(1);
      spdlog::warn("BatchGenerator: sample {} attempt {} rejected: {}",
                   index,
                   attempt + 1,
                   e.what());
      lastFailure = std::current_exception();
    }
  }

  spdlog::error("BatchGenerator: sample {} failed after {} attempts",
                index,
                config.maxAttemptsPerSample);
  std::rethrow_exception(lastFailure);
}

std::vector<TaskSample> BatchGenerator::generateRange(std::size_t begin,
                                                      std::size_t end) const
{
  if (end <= begin)
  {
    return {};
  }

  std::size_t const count = end - begin;
  std::vector<std::optional<TaskSample>> slots(count);
  std::vector<std::exception_ptr> failures(count);
  std::atomic<std::size_t> next{0};

  auto worker = [&]()
  {
    for (std::size_t k = next.fetch_add(1); k < count; k = next.fetch_add(1))
    {
      try
      {
        slots[k] = generateSample(begin + k);
      }
      catch (const std::exception&)
      {
        // Rethrown in index order once every worker has joined
        failures[k] = std::current_exception();
      }
    }
  };

  std::size_t const threadCount =
    std::min(generator_.getConfig().workerThreads, count);
  if (threadCount <= 1)
  {
    worker();
  }
  else
  {
    std::vector<std::jthread> workers;
    workers.reserve(threadCount);
    for (std::size_t t = 0; t < threadCount; ++t)
    {
      workers.emplace_back(worker);
    }
    // jthread joins on destruction
  }

  std::vector<TaskSample> results;
  results.reserve(count);
  for (std::size_t k = 0; k < count; ++k)
  {
    if (failures[k])
    {
      std::rethrow_exception(failures[k]);
    }
    results.push_back(std::move(*slots[k]));
  }
  return results;
}

std::vector<TaskSample> BatchGenerator::generateAll() const
{
  return generateRange(0, generator_.getConfig().numSamples);
}

}  // namespace cpg_sim
