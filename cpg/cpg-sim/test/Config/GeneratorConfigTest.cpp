// Ticket: 0003_generator_configuration

#include <gtest/gtest.h>

#include <functional>
#include <limits>
#include <string>

#include "cpg-sim/src/Config/GeneratorConfig.hpp"
#include "cpg-sim/src/Errors.hpp"

namespace cpg_sim
{
namespace test
{

namespace
{

void expectInvalid(const std::function<void(GeneratorConfig&)>& mutate)
{
  GeneratorConfig config{};
  mutate(config);
  EXPECT_THROW(config.validate(), InvalidConfiguration);
}

}  // anonymous namespace

// ========== Derived Values ==========

TEST(GeneratorConfigTest, SimulatorConfig_StepSizeAndCount)
{
  SimulatorConfig const config{};

  EXPECT_DOUBLE_EQ(0.005, config.stepSize());
  EXPECT_EQ(600u, config.stepCount());
}

TEST(GeneratorConfigTest, ViewConfig_WorldGeometry)
{
  ViewConfig const view{};

  EXPECT_DOUBLE_EQ(800.0 / 14.0, view.pixelsPerMeter());
  EXPECT_DOUBLE_EQ(5.25, view.worldHeight());
}

// ========== Validation ==========

TEST(GeneratorConfigTest, Validate_DefaultsAreValid)
{
  EXPECT_NO_THROW(GeneratorConfig{}.validate());
}

TEST(GeneratorConfigTest, Validate_BatchFields)
{
  expectInvalid([](GeneratorConfig& c) { c.domain.clear(); });
  expectInvalid([](GeneratorConfig& c) { c.numSamples = 0; });
  expectInvalid([](GeneratorConfig& c) { c.maxAttemptsPerSample = 0; });
  expectInvalid([](GeneratorConfig& c) { c.workerThreads = 0; });
  expectInvalid([](GeneratorConfig& c) { c.minFinalSeparation = -0.1; });
}

TEST(GeneratorConfigTest, Validate_SamplerRanges)
{
  expectInvalid([](GeneratorConfig& c) { c.sampler.mass.min = 0.0; });
  expectInvalid([](GeneratorConfig& c) { c.sampler.mass.max = 0.5; });
  expectInvalid([](GeneratorConfig& c) { c.sampler.speed.min = 0.0; });
  expectInvalid([](GeneratorConfig& c) { c.sampler.speed.max = 1.0; });
  expectInvalid([](GeneratorConfig& c) { c.sampler.positionA = 13.0; });
}

TEST(GeneratorConfigTest, Validate_TimeStepping)
{
  expectInvalid([](GeneratorConfig& c) { c.simulator.duration = 0.0; });
  expectInvalid([](GeneratorConfig& c) { c.simulator.videoFps = 0; });
  expectInvalid([](GeneratorConfig& c) { c.simulator.substepsPerFrame = 0; });
  expectInvalid([](GeneratorConfig& c) { c.simulator.contactRadius = 0.0; });
  expectInvalid([](GeneratorConfig& c) { c.simulator.contactRadius = 5.0; });
}

TEST(GeneratorConfigTest, Validate_NonFiniteValues)
{
  double const inf = std::numeric_limits<double>::infinity();
  double const nan = std::numeric_limits<double>::quiet_NaN();

  expectInvalid([inf](GeneratorConfig& c) { c.simulator.duration = inf; });
  expectInvalid([inf](GeneratorConfig& c) { c.sampler.speed.max = inf; });
  expectInvalid([inf](GeneratorConfig& c) { c.sampler.mass.max = inf; });
  expectInvalid([inf](GeneratorConfig& c) { c.view.radiusScaleMax = inf; });
  expectInvalid([nan](GeneratorConfig& c) { c.minFinalSeparation = nan; });
  expectInvalid([nan](GeneratorConfig& c) { c.simulator.contactRadius = nan; });
}

TEST(GeneratorConfigTest, Validate_TooManySteps)
{
  // 1e6 s at 200 steps/s
  expectInvalid([](GeneratorConfig& c) { c.simulator.duration = 1.0e6; });
}

TEST(GeneratorConfigTest, Validate_HorizonTooShortForSlowestSample)
{
  // Slowest pair closes 8.8 m at 2 * 0.5 m/s: contact at 8.8 s
  expectInvalid([](GeneratorConfig& c) { c.sampler.speed = Range{0.5, 1.0}; });

  GeneratorConfig config{};
  config.sampler.speed = Range{0.5, 1.0};
  config.simulator.duration = 9.0;
  EXPECT_NO_THROW(config.validate());

  // Default horizon: slowest contact at 8.8 / 4 = 2.2 s < 3 s
  config = GeneratorConfig{};
  config.simulator.duration = 2.2;
  EXPECT_THROW(config.validate(), InvalidConfiguration);
  config.simulator.duration = 2.25;
  EXPECT_NO_THROW(config.validate());
}

TEST(GeneratorConfigTest, Validate_View)
{
  expectInvalid([](GeneratorConfig& c) { c.view.imageWidth = 0; });
  expectInvalid([](GeneratorConfig& c) { c.view.imageHeight = -1; });
  expectInvalid([](GeneratorConfig& c) { c.view.worldWidth = 0.0; });
  expectInvalid([](GeneratorConfig& c) { c.view.ballRadiusBase = 0; });
  expectInvalid([](GeneratorConfig& c) { c.view.radiusScaleMin = 0.0; });
  expectInvalid([](GeneratorConfig& c) { c.view.radiusScaleMax = 0.5; });
  expectInvalid([](GeneratorConfig& c) { c.sampler.positionB = 15.0; });
}

TEST(GeneratorConfigTest, Validate_MessageNamesField)
{
  GeneratorConfig config{};
  config.simulator.videoFps = 0;

  try
  {
    config.validate();
    FAIL() << "Expected InvalidConfiguration";
  }
  catch (const InvalidConfiguration& e)
  {
    EXPECT_NE(std::string{e.what()}.find("simulator.videoFps"), std::string::npos);
  }
}

}  // namespace test
}  // namespace cpg_sim
