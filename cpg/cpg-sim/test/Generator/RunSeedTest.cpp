// Ticket: 0007_batch_generation

#include <gtest/gtest.h>

#include <set>

#include "cpg-sim/src/Generator/RunSeed.hpp"

namespace cpg_sim
{
namespace test
{

TEST(RunSeedTest, DeriveRunSeed_IsDeterministic)
{
  EXPECT_EQ(deriveRunSeed(42, 3, 0), deriveRunSeed(42, 3, 0));
}

TEST(RunSeedTest, DeriveRunSeed_DistinctPerIndexAndAttempt)
{
  std::set<std::uint64_t> seeds;
  for (std::size_t index = 0; index < 50; ++index)
  {
    for (std::size_t attempt = 0; attempt < 4; ++attempt)
    {
      seeds.insert(deriveRunSeed(42, index, attempt));
    }
  }
  EXPECT_EQ(200u, seeds.size());
}

TEST(RunSeedTest, DeriveRunSeed_UsesHighBatchSeedBits)
{
  std::uint64_t const low = 7;
  std::uint64_t const high = low | (std::uint64_t{1} << 40U);
  EXPECT_NE(deriveRunSeed(low, 0, 0), deriveRunSeed(high, 0, 0));
}

TEST(RunSeedTest, MakeRunEngine_SameSeedSameStream)
{
  auto first = makeRunEngine(99);
  auto second = makeRunEngine(99);
  for (int i = 0; i < 5; ++i)
  {
    EXPECT_EQ(first(), second());
  }
}

}  // namespace test
}  // namespace cpg_sim
