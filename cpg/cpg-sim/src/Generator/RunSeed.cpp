// Ticket: 0007_batch_generation

#include "cpg-sim/src/Generator/RunSeed.hpp"

#include <array>

namespace cpg_sim
{

std::uint64_t deriveRunSeed(std::uint64_t batchSeed,
                            std::size_t sampleIndex,
                            std::size_t attempt)
{
  auto const index = static_cast<std::uint64_t>(sampleIndex);
  auto const retry = static_cast<std::uint64_t>(attempt);

  std::seed_seq sequence{static_cast<std::uint32_t>(batchSeed),
                         static_cast<std::uint32_t>(batchSeed >> 32U),
                         static_cast<std::uint32_t>(index),
                         static_cast<std::uint32_t>(index >> 32U),
                         static_cast<std::uint32_t>(retry)};

  std::array<std::uint32_t, 2> words{};
  sequence.generate(words.begin(), words.end());
  return (static_cast<std::uint64_t>(words[0]) << 32U) | words[1];
}

std::mt19937_64 makeRunEngine(std::uint64_t runSeed)
{
  return std::mt19937_64{runSeed};
}

std::uint64_t randomBatchSeed()
{
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32U) | device();
}

}  // namespace cpg_sim
