// Ticket: 0001_two_body_collision_core

#include "cpg-sim/src/Physics/ElasticCollision.hpp"

#include <sstream>

#include "cpg-sim/src/Errors.hpp"

namespace cpg_sim
{
namespace ElasticCollision
{

VelocityPair postCollisionVelocities(double massA,
                                     double velocityA,
                                     double massB,
                                     double velocityB)
{
  if (massA <= 0.0 || massB <= 0.0)
  {
    std::ostringstream oss;
    oss << "ElasticCollision: masses must be positive (massA=" << massA
        << ", massB=" << massB << ")";
    throw InvalidConfiguration{oss.str()};
  }

  // Equal masses: full velocity exchange, bit-exact
  if (massA == massB)
  {
    return VelocityPair{velocityB, velocityA};
  }

  double const totalMass = massA + massB;

  VelocityPair result{};
  result.velocityA =
    ((massA - massB) * velocityA + 2.0 * massB * velocityB) / totalMass;
  result.velocityB =
    ((massB - massA) * velocityB + 2.0 * massA * velocityA) / totalMass;
  return result;
}

std::optional<double> contactTime(const InitialConditions& conditions,
                                  double contactDistance)
{
  double const remainingGap = conditions.initialGap() - contactDistance;
  if (remainingGap <= 0.0)
  {
    return 0.0;
  }

  double const closingSpeed = conditions.closingSpeed();
  if (closingSpeed <= 0.0)
  {
    return std::nullopt;
  }

  return remainingGap / closingSpeed;
}

std::optional<CollisionEvent> solve(const InitialConditions& conditions,
                                    double contactDistance)
{
  auto const time = contactTime(conditions, contactDistance);
  if (!time)
  {
    return std::nullopt;
  }

  VelocityPair const after = postCollisionVelocities(conditions.massA,
                                                     conditions.velocityA,
                                                     conditions.massB,
                                                     conditions.velocityB);

  CollisionEvent event{};
  event.time = *time;
  event.velocityABefore = conditions.velocityA;
  event.velocityBBefore = conditions.velocityB;
  event.velocityAAfter = after.velocityA;
  event.velocityBAfter = after.velocityB;
  return event;
}

}  // namespace ElasticCollision
}  // namespace cpg_sim
