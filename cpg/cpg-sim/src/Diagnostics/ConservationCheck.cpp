// Ticket: 0004_conservation_diagnostics

#include "cpg-sim/src/Diagnostics/ConservationCheck.hpp"

#include <algorithm>
#include <cmath>

#include "cpg-sim/src/DataTypes/CollisionEvent.hpp"

namespace cpg_sim
{

namespace
{

// Below this magnitude a quantity is treated as zero for relative errors
constexpr double kZeroFloor = 1e-12;

double relativeError(double before, double after)
{
  double const delta = std::abs(after - before);
  double const scale = std::abs(before);
  if (scale < kZeroFloor)
  {
    return delta;
  }
  return delta / scale;
}

}  // anonymous namespace

// ========== Report ==========

double ConservationCheck::Report::relativeMomentumError() const
{
  return relativeError(momentumBefore, momentumAfter);
}

double ConservationCheck::Report::relativeEnergyError() const
{
  return relativeError(energyBefore, energyAfter);
}

bool ConservationCheck::Report::withinTolerance(double relativeTolerance,
                                                double absoluteTolerance) const
{
  return isConserved(momentumBefore,
                     momentumAfter,
                     relativeTolerance,
                     absoluteTolerance) &&
         isConserved(
           energyBefore, energyAfter, relativeTolerance, absoluteTolerance);
}

// ========== ConservationCheck ==========

double ConservationCheck::momentum(const Eigen::Vector2d& masses,
                                   const Eigen::Vector2d& velocities)
{
  return masses.dot(velocities);
}

double ConservationCheck::kineticEnergy(const Eigen::Vector2d& masses,
                                        const Eigen::Vector2d& velocities)
{
  return 0.5 * masses.dot(velocities.cwiseAbs2());
}

ConservationCheck::Report ConservationCheck::compare(const CollisionEvent& event,
                                                     double massA,
                                                     double massB)
{
  Eigen::Vector2d const masses{massA, massB};
  Eigen::Vector2d const before{event.velocityABefore, event.velocityBBefore};
  Eigen::Vector2d const after{event.velocityAAfter, event.velocityBAfter};

  Report report{};
  report.momentumBefore = momentum(masses, before);
  report.momentumAfter = momentum(masses, after);
  report.energyBefore = kineticEnergy(masses, before);
  report.energyAfter = kineticEnergy(masses, after);
  return report;
}

bool ConservationCheck::isConserved(double before,
                                    double after,
                                    double relativeTolerance,
                                    double absoluteTolerance)
{
  double const delta = std::abs(after - before);
  double const threshold =
    std::max(relativeTolerance * std::abs(before), absoluteTolerance);
  return delta <= threshold;
}

}  // namespace cpg_sim
