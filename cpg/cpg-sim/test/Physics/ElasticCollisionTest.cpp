// Ticket: 0001_two_body_collision_core

#include <gtest/gtest.h>

#include "cpg-sim/src/Errors.hpp"
#include "cpg-sim/src/Physics/ElasticCollision.hpp"
#include "cpg-sim/test/Helpers/CollisionFixtures.hpp"

namespace cpg_sim
{
namespace test
{

// ========== Velocity Update Tests ==========

TEST(ElasticCollisionTest, PostCollisionVelocities_ReferenceCase)
{
  auto const after = ElasticCollision::postCollisionVelocities(4.8, 4.8, 2.3, -3.5);

  EXPECT_NEAR(kReferenceVelocityAAfter, after.velocityA, 1e-12);
  EXPECT_NEAR(kReferenceVelocityBAfter, after.velocityB, 1e-12);
  EXPECT_NEAR(-0.5775, after.velocityA, 1e-4);
  EXPECT_NEAR(7.7225, after.velocityB, 1e-4);
}

TEST(ElasticCollisionTest, PostCollisionVelocities_EqualMassesSwapExactly)
{
  auto const after = ElasticCollision::postCollisionVelocities(3.3, 5.7, 3.3, -2.9);

  EXPECT_EQ(-2.9, after.velocityA);
  EXPECT_EQ(5.7, after.velocityB);
}

TEST(ElasticCollisionTest, PostCollisionVelocities_LightBallOnHeavyAtRest)
{
  // m_A = 1, m_B = 3, v_B = 0: v_A' = -v_A / 2, v_B' = v_A / 2
  auto const after = ElasticCollision::postCollisionVelocities(1.0, 4.0, 3.0, 0.0);

  EXPECT_DOUBLE_EQ(-2.0, after.velocityA);
  EXPECT_DOUBLE_EQ(2.0, after.velocityB);
}

TEST(ElasticCollisionTest, PostCollisionVelocities_RelativeVelocityReverses)
{
  // e = 1: v_B' - v_A' = v_A - v_B
  double const vA = 6.1;
  double const vB = -2.4;
  auto const after = ElasticCollision::postCollisionVelocities(1.7, vA, 4.2, vB);

  EXPECT_NEAR(vA - vB, after.velocityB - after.velocityA, 1e-12);
}

TEST(ElasticCollisionTest, PostCollisionVelocities_NonPositiveMass_Throws)
{
  EXPECT_THROW(ElasticCollision::postCollisionVelocities(0.0, 1.0, 1.0, -1.0),
               InvalidConfiguration);
  EXPECT_THROW(ElasticCollision::postCollisionVelocities(1.0, 1.0, -2.0, -1.0),
               InvalidConfiguration);
}

// ========== Contact Time Tests ==========

TEST(ElasticCollisionTest, ContactTime_ClosingBodies)
{
  InitialConditions conditions{};
  conditions.positionA = 2.0;
  conditions.positionB = 12.0;
  conditions.velocityA = 3.0;
  conditions.velocityB = -2.0;

  auto const time = ElasticCollision::contactTime(conditions, 1.2);

  ASSERT_TRUE(time.has_value());
  EXPECT_DOUBLE_EQ((10.0 - 1.2) / 5.0, *time);
}

TEST(ElasticCollisionTest, ContactTime_AlreadyTouching_IsZero)
{
  InitialConditions conditions{};
  conditions.positionA = 5.0;
  conditions.positionB = 6.0;
  conditions.velocityA = 1.0;
  conditions.velocityB = -1.0;

  auto const time = ElasticCollision::contactTime(conditions, 1.2);

  ASSERT_TRUE(time.has_value());
  EXPECT_EQ(0.0, *time);
}

TEST(ElasticCollisionTest, ContactTime_SeparatingBodies_NoContact)
{
  InitialConditions conditions{};
  conditions.velocityA = -1.0;
  conditions.velocityB = 1.0;

  EXPECT_FALSE(ElasticCollision::contactTime(conditions, 1.2).has_value());
  EXPECT_FALSE(ElasticCollision::solve(conditions, 1.2).has_value());
}

TEST(ElasticCollisionTest, Solve_FillsBeforeAndAfter)
{
  auto const conditions = referenceConditions();
  auto const event = ElasticCollision::solve(conditions, 1.2);

  ASSERT_TRUE(event.has_value());
  EXPECT_DOUBLE_EQ((10.0 - 1.2) / 8.3, event->time);
  EXPECT_EQ(4.8, event->velocityABefore);
  EXPECT_EQ(-3.5, event->velocityBBefore);
  EXPECT_NEAR(kReferenceVelocityAAfter, event->velocityAAfter, 1e-12);
  EXPECT_NEAR(kReferenceVelocityBAfter, event->velocityBAfter, 1e-12);
  EXPECT_EQ(0u, event->trajectoryIndex);
}

}  // namespace test
}  // namespace cpg_sim
