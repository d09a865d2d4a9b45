// Ticket: 0003_generator_configuration

#include "cpg-sim/src/Config/GeneratorConfig.hpp"

#include <cmath>
#include <sstream>

#include "cpg-sim/src/Errors.hpp"

namespace cpg_sim
{

namespace
{

void require(bool condition, const std::string& field, const std::string& rule)
{
  if (!condition)
  {
    std::ostringstream oss;
    oss << "Invalid configuration: " << field << " " << rule;
    throw InvalidConfiguration{oss.str()};
  }
}

void requireFinite(double value, const std::string& field)
{
  require(std::isfinite(value), field, "must be finite");
}

// Upper bound on integrator steps per run
constexpr double kMaxStepCount = 1.0e7;

}  // anonymous namespace

double SimulatorConfig::stepSize() const
{
  return 1.0 / (static_cast<double>(videoFps) *
                static_cast<double>(substepsPerFrame));
}

std::size_t SimulatorConfig::stepCount() const
{
  // Round so that e.g. 3.0 s at 200 steps/s gives exactly 600 steps
  return static_cast<std::size_t>(std::llround(duration / stepSize()));
}

void GeneratorConfig::validate() const
{
  require(!domain.empty(), "domain", "must not be empty");
  require(numSamples >= 1, "numSamples", "must be at least 1");
  require(maxAttemptsPerSample >= 1, "maxAttemptsPerSample", "must be at least 1");
  require(workerThreads >= 1, "workerThreads", "must be at least 1");

  requireFinite(sampler.mass.min, "sampler.mass.min");
  requireFinite(sampler.mass.max, "sampler.mass.max");
  requireFinite(sampler.speed.min, "sampler.speed.min");
  requireFinite(sampler.speed.max, "sampler.speed.max");
  requireFinite(sampler.positionA, "sampler.positionA");
  requireFinite(sampler.positionB, "sampler.positionB");
  requireFinite(simulator.duration, "simulator.duration");
  requireFinite(simulator.contactRadius, "simulator.contactRadius");
  requireFinite(view.worldWidth, "view.worldWidth");
  requireFinite(view.radiusScaleMin, "view.radiusScaleMin");
  requireFinite(view.radiusScaleMax, "view.radiusScaleMax");
  requireFinite(minFinalSeparation, "minFinalSeparation");

  // ===== Sampling ranges =====

  require(sampler.mass.min > 0.0, "sampler.mass.min", "must be positive");
  require(sampler.mass.max >= sampler.mass.min,
          "sampler.mass.max",
          "must not be smaller than sampler.mass.min");
  require(sampler.speed.min > 0.0, "sampler.speed.min", "must be positive");
  require(sampler.speed.max >= sampler.speed.min,
          "sampler.speed.max",
          "must not be smaller than sampler.speed.min");
  require(sampler.positionA < sampler.positionB,
          "sampler.positionA",
          "must be left of sampler.positionB");

  // ===== Time stepping =====

  require(simulator.duration > 0.0, "simulator.duration", "must be positive");
  require(simulator.videoFps >= 1, "simulator.videoFps", "must be at least 1");
  require(simulator.substepsPerFrame >= 1,
          "simulator.substepsPerFrame",
          "must be at least 1");
  require(simulator.contactRadius > 0.0,
          "simulator.contactRadius",
          "must be positive");
  require(sampler.positionB - sampler.positionA > 2.0 * simulator.contactRadius,
          "sampler.positionB",
          "must leave the balls apart at t = 0");
  require(simulator.duration * simulator.videoFps * simulator.substepsPerFrame <=
            kMaxStepCount,
          "simulator.duration",
          "gives more than 1e7 integrator steps");

  // ===== Collision guarantee =====

  // The slowest possible draw has both bodies at speed.min
  double const slowestContact =
    (sampler.positionB - sampler.positionA - 2.0 * simulator.contactRadius) /
    (2.0 * sampler.speed.min);
  double const horizon =
    static_cast<double>(simulator.stepCount()) * simulator.stepSize();
  if (slowestContact >= horizon)
  {
    std::ostringstream oss;
    oss << "Invalid configuration: simulator.duration gives a " << horizon
        << " s horizon, but the slowest sampled pair only reaches contact at "
        << slowestContact << " s";
    throw InvalidConfiguration{oss.str()};
  }

  // ===== View =====

  require(view.imageWidth > 0, "view.imageWidth", "must be positive");
  require(view.imageHeight > 0, "view.imageHeight", "must be positive");
  require(view.worldWidth > 0.0, "view.worldWidth", "must be positive");
  require(view.ballRadiusBase > 0, "view.ballRadiusBase", "must be positive");
  require(view.radiusScaleMin > 0.0, "view.radiusScaleMin", "must be positive");
  require(view.radiusScaleMax >= view.radiusScaleMin,
          "view.radiusScaleMax",
          "must not be smaller than view.radiusScaleMin");
  require(sampler.positionA >= 0.0 && sampler.positionB <= view.worldWidth,
          "sampler.positionA/positionB",
          "must lie inside [0, view.worldWidth]");

  require(minFinalSeparation >= 0.0, "minFinalSeparation", "must not be negative");
}

}  // namespace cpg_sim
