// Ticket: 0001_two_body_collision_core

#include <gtest/gtest.h>

#include <random>

#include "cpg-sim/src/Errors.hpp"
#include "cpg-sim/src/Physics/ParameterSampler.hpp"

namespace cpg_sim
{
namespace test
{

// ========== Construction Tests ==========

TEST(ParameterSamplerTest, Constructor_DefaultConfigIsValid)
{
  EXPECT_NO_THROW(ParameterSampler{SamplerConfig{}});
}

TEST(ParameterSamplerTest, Constructor_InvalidRanges_Throw)
{
  SamplerConfig config{};
  config.mass.min = 0.0;
  EXPECT_THROW(ParameterSampler{config}, InvalidConfiguration);

  config = SamplerConfig{};
  config.speed.min = -1.0;
  EXPECT_THROW(ParameterSampler{config}, InvalidConfiguration);

  config = SamplerConfig{};
  config.mass = Range{5.0, 1.0};
  EXPECT_THROW(ParameterSampler{config}, InvalidConfiguration);

  config = SamplerConfig{};
  config.speed = Range{8.0, 2.0};
  EXPECT_THROW(ParameterSampler{config}, InvalidConfiguration);

  config = SamplerConfig{};
  config.positionA = 12.0;
  config.positionB = 2.0;
  EXPECT_THROW(ParameterSampler{config}, InvalidConfiguration);
}

// ========== Sampling Tests ==========

TEST(ParameterSamplerTest, Sample_StaysInRangesWithApproachingSigns)
{
  SamplerConfig const config{};
  ParameterSampler const sampler{config};
  std::mt19937_64 rng{42};

  for (int i = 0; i < 1000; ++i)
  {
    auto const conditions = sampler.sample(rng);

    EXPECT_TRUE(config.mass.contains(conditions.massA));
    EXPECT_TRUE(config.mass.contains(conditions.massB));
    EXPECT_TRUE(config.speed.contains(conditions.velocityA));
    EXPECT_TRUE(config.speed.contains(-conditions.velocityB));
    EXPECT_GT(conditions.velocityA, 0.0);
    EXPECT_LT(conditions.velocityB, 0.0);
    EXPECT_GE(conditions.closingSpeed(), 2.0 * config.speed.min);
    EXPECT_EQ(config.positionA, conditions.positionA);
    EXPECT_EQ(config.positionB, conditions.positionB);
  }
}

TEST(ParameterSamplerTest, Sample_SameSeedSameConditions)
{
  ParameterSampler const sampler{SamplerConfig{}};
  std::mt19937_64 first{1234};
  std::mt19937_64 second{1234};

  for (int i = 0; i < 10; ++i)
  {
    auto const a = sampler.sample(first);
    auto const b = sampler.sample(second);
    EXPECT_EQ(a.massA, b.massA);
    EXPECT_EQ(a.massB, b.massB);
    EXPECT_EQ(a.velocityA, b.velocityA);
    EXPECT_EQ(a.velocityB, b.velocityB);
  }
}

TEST(ParameterSamplerTest, Sample_DifferentSeedsDiffer)
{
  ParameterSampler const sampler{SamplerConfig{}};
  std::mt19937_64 first{1};
  std::mt19937_64 second{2};

  auto const a = sampler.sample(first);
  auto const b = sampler.sample(second);
  EXPECT_NE(a.massA, b.massA);
}

TEST(ParameterSamplerTest, Sample_DegenerateRangesAreExact)
{
  SamplerConfig config{};
  config.mass = Range{3.0, 3.0};
  config.speed = Range{4.0, 4.0};
  ParameterSampler const sampler{config};
  std::mt19937_64 rng{7};

  auto const conditions = sampler.sample(rng);
  EXPECT_EQ(3.0, conditions.massA);
  EXPECT_EQ(3.0, conditions.massB);
  EXPECT_EQ(4.0, conditions.velocityA);
  EXPECT_EQ(-4.0, conditions.velocityB);
}

}  // namespace test
}  // namespace cpg_sim
