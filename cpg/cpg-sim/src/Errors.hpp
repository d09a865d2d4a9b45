// Ticket: 0002_collision_core_error_taxonomy

#ifndef CPG_SIM_ERRORS_HPP
#define CPG_SIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cpg_sim
{

/**
 * @brief Malformed or contradictory generator configuration
 *
 * Fatal to a batch. Raised by config validation, the parameter sampler and
 * the simulator when the inputs cannot produce a meaningful run. Never
 * retried by BatchGenerator.
 *
 * @ticket 0002_collision_core_error_taxonomy
 */
class InvalidConfiguration : public std::invalid_argument
{
public:
  explicit InvalidConfiguration(const std::string& what)
    : std::invalid_argument{what}
  {
  }
};

/**
 * @brief The two bodies never reached contact within the simulated horizon
 *
 * Should not happen for parameters drawn by ParameterSampler with the default
 * configuration; treated as an internal-invariant violation. The batch driver
 * logs it and resamples.
 *
 * @ticket 0002_collision_core_error_taxonomy
 */
class NoCollisionDetected : public std::runtime_error
{
public:
  explicit NoCollisionDetected(const std::string& what)
    : std::runtime_error{what}
  {
  }
};

/**
 * @brief No post-collision trajectory sample satisfies the separation and
 * visibility requirements
 *
 * @ticket 0002_collision_core_error_taxonomy
 */
class NoValidFinalFrame : public std::runtime_error
{
public:
  explicit NoValidFinalFrame(const std::string& what)
    : std::runtime_error{what}
  {
  }
};

}  // namespace cpg_sim

#endif  // CPG_SIM_ERRORS_HPP
