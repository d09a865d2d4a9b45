// Ticket: 0008_task_prompts

#include "cpg-sim/src/Prompts/PromptBuilder.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace cpg_sim
{
namespace PromptBuilder
{

namespace
{

constexpr std::size_t kTemplateCount = 4;
constexpr const char* kCollisionType = "elastic";

}  // anonymous namespace

std::size_t templateCount()
{
  return kTemplateCount;
}

std::string directionWord(double velocity)
{
  return velocity > 0.0 ? "right" : "left";
}

std::string format(std::size_t templateIndex, const InitialConditions& conditions)
{
  double const massA = conditions.massA;
  double const massB = conditions.massB;
  double const speedA = std::abs(conditions.velocityA);
  double const speedB = std::abs(conditions.velocityB);
  std::string const dirA = directionWord(conditions.velocityA);
  std::string const dirB = directionWord(conditions.velocityB);

  switch (templateIndex)
  {
    case 0:
      return fmt::format(
        "Two balls collide elastically. Ball A (mass {:.1f}kg) moves {} at "
        "{:.1f} m/s. Ball B (mass {:.1f}kg) moves {} at {:.1f} m/s. Predict "
        "the collision outcome.",
        massA, dirA, speedA, massB, dirB, speedB);
    case 1:
      return fmt::format(
        "Ball A ({:.1f}kg, {:.1f} m/s {}) and Ball B ({:.1f}kg, {:.1f} m/s {}) "
        "undergo an {} collision. Show the final velocities after impact.",
        massA, speedA, dirA, massB, speedB, dirB, kCollisionType);
    case 2:
      // Signed velocities in this one
      return fmt::format(
        "In an {} collision, Ball A (mass={:.1f}kg, velocity={:.1f} m/s) "
        "collides with Ball B (mass={:.1f}kg, velocity={:.1f} m/s). Animate "
        "the collision and resulting motion.",
        kCollisionType, massA, conditions.velocityA, massB, conditions.velocityB);
    case 3:
      return fmt::format(
        "Predict the result of an {} collision between two balls: Ball A "
        "({:.1f}kg) traveling {} at {:.1f} m/s, and Ball B ({:.1f}kg) "
        "traveling {} at {:.1f} m/s.",
        kCollisionType, massA, dirA, speedA, massB, dirB, speedB);
    default:
      throw std::out_of_range{
        fmt::format("PromptBuilder: template index {} out of range [0, {})",
                    templateIndex,
                    kTemplateCount)};
  }
}

std::string build(const InitialConditions& conditions, std::mt19937_64& rng)
{
  std::uniform_int_distribution<std::size_t> pick{0, kTemplateCount - 1};
  return format(pick(rng), conditions);
}

}  // namespace PromptBuilder
}  // namespace cpg_sim
