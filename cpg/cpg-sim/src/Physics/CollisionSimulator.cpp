// Ticket: 0001_two_body_collision_core

#include "cpg-sim/src/Physics/CollisionSimulator.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

#include "cpg-sim/src/Errors.hpp"
#include "cpg-sim/src/Physics/ElasticCollision.hpp"

namespace cpg_sim
{

CollisionSimulator::CollisionSimulator(const SimulatorConfig& config)
  : config_{config}
{
  if (config_.duration <= 0.0 || config_.videoFps < 1 ||
      config_.substepsPerFrame < 1)
  {
    std::ostringstream oss;
    oss << "CollisionSimulator: invalid time stepping (duration="
        << config_.duration << ", videoFps=" << config_.videoFps
        << ", substepsPerFrame=" << config_.substepsPerFrame << ")";
    throw InvalidConfiguration{oss.str()};
  }
  if (config_.contactRadius <= 0.0)
  {
    throw InvalidConfiguration{
      "CollisionSimulator: contactRadius must be positive"};
  }
}

CollisionSimulator::Result CollisionSimulator::run(
  const InitialConditions& conditions) const
{
  if (conditions.massA <= 0.0 || conditions.massB <= 0.0)
  {
    throw InvalidConfiguration{"CollisionSimulator: masses must be positive"};
  }

  double const contact = contactDistance();
  if (conditions.initialGap() <= contact)
  {
    std::ostringstream oss;
    oss << "CollisionSimulator: bodies overlap at t = 0 (gap="
        << conditions.initialGap() << " m, contact distance=" << contact
        << " m)";
    throw InvalidConfiguration{oss.str()};
  }

  double const dt = config_.stepSize();
  std::size_t const stepCount = config_.stepCount();

  Result result{};
  result.trajectory.dt = dt;
  result.trajectory.states.reserve(stepCount + 1);

  double positionA = conditions.positionA;
  double positionB = conditions.positionB;
  double velocityA = conditions.velocityA;
  double velocityB = conditions.velocityB;

  result.trajectory.states.push_back(
    TrajectoryState{0.0, positionA, positionB, velocityA, velocityB});

  bool collided = false;
  std::size_t collisionIndex = 0;
  double simulatedImpactTime = 0.0;

  for (std::size_t i = 1; i <= stepCount; ++i)
  {
    // ===== Free Flight =====

    double nextA = positionA + velocityA * dt;
    double nextB = positionB + velocityB * dt;

    // ===== Contact Detection and Impulse =====

    if (!collided && (nextB - nextA) <= contact)
    {
      // Back up to the time of impact within this step
      double const gap = (positionB - positionA) - contact;
      double const closing = velocityA - velocityB;
      double const tau = (gap > 0.0) ? gap / closing : 0.0;

      positionA += velocityA * tau;
      positionB += velocityB * tau;

      ElasticCollision::VelocityPair const after =
        ElasticCollision::postCollisionVelocities(
          conditions.massA, velocityA, conditions.massB, velocityB);
      velocityA = after.velocityA;
      velocityB = after.velocityB;

      nextA = positionA + velocityA * (dt - tau);
      nextB = positionB + velocityB * (dt - tau);

      collided = true;
      collisionIndex = i;
      simulatedImpactTime = static_cast<double>(i - 1) * dt + tau;
    }

    positionA = nextA;
    positionB = nextB;

    // Timestamps from the index, not accumulated, so they never drift
    result.trajectory.states.push_back(TrajectoryState{
      static_cast<double>(i) * dt, positionA, positionB, velocityA, velocityB});
  }

  if (!collided)
  {
    std::ostringstream oss;
    oss << "CollisionSimulator: no contact within " << config_.duration
        << " s (gap=" << conditions.initialGap()
        << " m, closing speed=" << conditions.closingSpeed() << " m/s)";
    throw NoCollisionDetected{oss.str()};
  }

  // The analytic event is the ground truth; the simulated one only locates
  // the trajectory index
  auto const analytic = ElasticCollision::solve(conditions, contact);
  result.collision = *analytic;
  result.collision.trajectoryIndex = collisionIndex;

  result.conservation = ConservationCheck::compare(
    result.collision, conditions.massA, conditions.massB);

  spdlog::debug(
    "CollisionSimulator: contact at t={:.6f} s (simulated {:.6f} s, step {}), "
    "v_A'={:.6f} m/s, v_B'={:.6f} m/s",
    result.collision.time,
    simulatedImpactTime,
    collisionIndex,
    result.collision.velocityAAfter,
    result.collision.velocityBAfter);

  if (!result.conservation.withinTolerance())
  {
    spdlog::warn(
      "CollisionSimulator: conservation drift (momentum rel. error {:.3e}, "
      "energy rel. error {:.3e})",
      result.conservation.relativeMomentumError(),
      result.conservation.relativeEnergyError());
  }

  return result;
}

}  // namespace cpg_sim
