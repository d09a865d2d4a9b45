// Ticket: 0007_batch_generation
//
// Benchmarks for a single simulator run, the full sample pipeline and a
// multi-threaded batch.

#include <benchmark/benchmark.h>

#include <random>

#include "cpg-sim/src/Config/GeneratorConfig.hpp"
#include "cpg-sim/src/Generator/BatchGenerator.hpp"
#include "cpg-sim/src/Generator/SampleGenerator.hpp"
#include "cpg-sim/src/Physics/CollisionSimulator.hpp"

using namespace cpg_sim;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

InitialConditions benchConditions()
{
  InitialConditions conditions{};
  conditions.massA = 4.8;
  conditions.massB = 2.3;
  conditions.velocityA = 4.8;
  conditions.velocityB = -3.5;
  return conditions;
}

}  // anonymous namespace

// ============================================================================
// Benchmarks
// ============================================================================

static void BM_CollisionSimulator_Run(benchmark::State& state)
{
  SimulatorConfig config{};
  config.substepsPerFrame = static_cast<int>(state.range(0));
  CollisionSimulator const simulator{config};
  auto const conditions = benchConditions();

  for (auto _ : state)
  {
    auto result = simulator.run(conditions);
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(config.stepCount()));
}
BENCHMARK(BM_CollisionSimulator_Run)->Arg(1)->Arg(20)->Arg(100);

static void BM_SampleGenerator_Generate(benchmark::State& state)
{
  SampleGenerator const generator{GeneratorConfig{}};
  std::mt19937_64 rng{1};

  for (auto _ : state)
  {
    auto scene = generator.generate(rng);
    benchmark::DoNotOptimize(scene);
  }
}
BENCHMARK(BM_SampleGenerator_Generate);

static void BM_BatchGenerator_GenerateAll(benchmark::State& state)
{
  GeneratorConfig config{};
  config.randomSeed = 42;
  config.numSamples = 256;
  config.workerThreads = static_cast<std::size_t>(state.range(0));
  BatchGenerator const batch{config};

  for (auto _ : state)
  {
    auto samples = batch.generateAll();
    benchmark::DoNotOptimize(samples);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(config.numSamples));
}
BENCHMARK(BM_BatchGenerator_GenerateAll)->Arg(1)->Arg(4)->UseRealTime();
