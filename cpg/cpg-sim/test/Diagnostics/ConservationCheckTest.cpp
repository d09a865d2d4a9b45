// Ticket: 0004_conservation_diagnostics

#include <gtest/gtest.h>

#include "cpg-sim/src/DataTypes/CollisionEvent.hpp"
#include "cpg-sim/src/Diagnostics/ConservationCheck.hpp"
#include "cpg-sim/src/Physics/ElasticCollision.hpp"
#include "cpg-sim/test/Helpers/CollisionFixtures.hpp"

namespace cpg_sim
{
namespace test
{

// ========== Totals ==========

TEST(ConservationCheckTest, Momentum_DotProduct)
{
  EXPECT_DOUBLE_EQ(-1.0,
                   ConservationCheck::momentum(Eigen::Vector2d{2.0, 3.0},
                                               Eigen::Vector2d{1.0, -1.0}));
}

TEST(ConservationCheckTest, KineticEnergy_SignIndependent)
{
  Eigen::Vector2d const masses{2.0, 3.0};

  EXPECT_DOUBLE_EQ(2.5,
                   ConservationCheck::kineticEnergy(masses,
                                                    Eigen::Vector2d{1.0, -1.0}));
  EXPECT_DOUBLE_EQ(2.5,
                   ConservationCheck::kineticEnergy(masses,
                                                    Eigen::Vector2d{-1.0, 1.0}));
}

// ========== Report ==========

TEST(ConservationCheckTest, Compare_ReferenceCollisionIsConserved)
{
  auto const conditions = referenceConditions();
  auto const event = ElasticCollision::solve(conditions, 1.2);
  ASSERT_TRUE(event.has_value());

  auto const report =
    ConservationCheck::compare(*event, conditions.massA, conditions.massB);

  EXPECT_DOUBLE_EQ(4.8 * 4.8 - 2.3 * 3.5, report.momentumBefore);
  EXPECT_NEAR(report.momentumBefore, report.momentumAfter, 1e-9);
  EXPECT_NEAR(report.energyBefore, report.energyAfter, 1e-9);
  EXPECT_LT(report.relativeMomentumError(), 1e-12);
  EXPECT_LT(report.relativeEnergyError(), 1e-12);
  EXPECT_TRUE(report.withinTolerance());
}

TEST(ConservationCheckTest, Compare_InelasticOutcomeIsFlagged)
{
  // Both bodies stop: momentum 0 -> 0, energy lost
  CollisionEvent event{};
  event.velocityABefore = 2.0;
  event.velocityBBefore = -2.0;
  event.velocityAAfter = 0.0;
  event.velocityBAfter = 0.0;

  auto const report = ConservationCheck::compare(event, 1.0, 1.0);

  EXPECT_DOUBLE_EQ(0.0, report.relativeMomentumError());
  EXPECT_DOUBLE_EQ(1.0, report.relativeEnergyError());
  EXPECT_FALSE(report.withinTolerance());
}

TEST(ConservationCheckTest, RelativeError_ZeroBeforeFallsBackToAbsolute)
{
  ConservationCheck::Report report{};
  report.momentumBefore = 0.0;
  report.momentumAfter = 1e-3;

  EXPECT_DOUBLE_EQ(1e-3, report.relativeMomentumError());
}

// ========== isConserved ==========

TEST(ConservationCheckTest, IsConserved_RelativeThreshold)
{
  EXPECT_TRUE(ConservationCheck::isConserved(100.0, 100.00005));
  EXPECT_FALSE(ConservationCheck::isConserved(100.0, 100.001));
}

TEST(ConservationCheckTest, IsConserved_AbsoluteFloorNearZero)
{
  EXPECT_TRUE(ConservationCheck::isConserved(0.0, 1e-10));
  EXPECT_FALSE(ConservationCheck::isConserved(0.0, 1e-6));
}

}  // namespace test
}  // namespace cpg_sim
