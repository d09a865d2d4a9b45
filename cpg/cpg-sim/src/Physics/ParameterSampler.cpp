// Ticket: 0001_two_body_collision_core

#include "cpg-sim/src/Physics/ParameterSampler.hpp"

#include <sstream>

#include "cpg-sim/src/Errors.hpp"

namespace cpg_sim
{

ParameterSampler::ParameterSampler(const SamplerConfig& config)
  : config_{config}
{
  std::ostringstream oss;
  if (config_.mass.min <= 0.0)
  {
    oss << "ParameterSampler: mass.min must be positive (got "
        << config_.mass.min << ")";
  }
  else if (config_.speed.min <= 0.0)
  {
    oss << "ParameterSampler: speed.min must be positive (got "
        << config_.speed.min << ")";
  }
  else if (config_.mass.max < config_.mass.min)
  {
    oss << "ParameterSampler: mass range is empty [" << config_.mass.min
        << ", " << config_.mass.max << "]";
  }
  else if (config_.speed.max < config_.speed.min)
  {
    oss << "ParameterSampler: speed range is empty [" << config_.speed.min
        << ", " << config_.speed.max << "]";
  }
  else if (config_.positionA >= config_.positionB)
  {
    oss << "ParameterSampler: positionA (" << config_.positionA
        << ") must be left of positionB (" << config_.positionB << ")";
  }

  if (!oss.str().empty())
  {
    throw InvalidConfiguration{oss.str()};
  }
}

InitialConditions ParameterSampler::sample(std::mt19937_64& rng) const
{
  std::uniform_real_distribution<double> massDist{config_.mass.min,
                                                  config_.mass.max};
  std::uniform_real_distribution<double> speedDist{config_.speed.min,
                                                   config_.speed.max};

  InitialConditions conditions{};
  conditions.massA = massDist(rng);
  conditions.massB = massDist(rng);
  conditions.velocityA = speedDist(rng);
  conditions.velocityB = -speedDist(rng);
  conditions.positionA = config_.positionA;
  conditions.positionB = config_.positionB;
  return conditions;
}

}  // namespace cpg_sim
