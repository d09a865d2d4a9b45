// Ticket: 0008_task_prompts

#include <gtest/gtest.h>

#include <random>
#include <set>
#include <stdexcept>

#include "cpg-sim/src/Prompts/PromptBuilder.hpp"
#include "cpg-sim/test/Helpers/CollisionFixtures.hpp"

namespace cpg_sim
{
namespace test
{

TEST(PromptBuilderTest, DirectionWord)
{
  EXPECT_EQ("right", PromptBuilder::directionWord(4.2));
  EXPECT_EQ("left", PromptBuilder::directionWord(-0.1));
}

TEST(PromptBuilderTest, Format_FirstTemplate)
{
  EXPECT_EQ(
    "Two balls collide elastically. Ball A (mass 4.8kg) moves right at 4.8 m/s. "
    "Ball B (mass 2.3kg) moves left at 3.5 m/s. Predict the collision outcome.",
    PromptBuilder::format(0, referenceConditions()));
}

TEST(PromptBuilderTest, Format_SignedVelocityTemplate)
{
  EXPECT_EQ(
    "In an elastic collision, Ball A (mass=4.8kg, velocity=4.8 m/s) collides "
    "with Ball B (mass=2.3kg, velocity=-3.5 m/s). Animate the collision and "
    "resulting motion.",
    PromptBuilder::format(2, referenceConditions()));
}

TEST(PromptBuilderTest, Format_EveryTemplateQuotesValues)
{
  for (std::size_t i = 0; i < PromptBuilder::templateCount(); ++i)
  {
    std::string const prompt = PromptBuilder::format(i, referenceConditions());
    EXPECT_NE(prompt.find("4.8"), std::string::npos) << "template " << i;
    EXPECT_NE(prompt.find("2.3"), std::string::npos) << "template " << i;
    EXPECT_NE(prompt.find("3.5"), std::string::npos) << "template " << i;
    EXPECT_NE(prompt.find("elastic"), std::string::npos) << "template " << i;
  }
}

TEST(PromptBuilderTest, Format_OutOfRange_Throws)
{
  EXPECT_THROW(
    static_cast<void>(PromptBuilder::format(PromptBuilder::templateCount(),
                                            referenceConditions())),
    std::out_of_range);
}

TEST(PromptBuilderTest, Build_ChoosesAmongTemplatesReproducibly)
{
  auto const conditions = referenceConditions();
  std::set<std::string> all;
  for (std::size_t i = 0; i < PromptBuilder::templateCount(); ++i)
  {
    all.insert(PromptBuilder::format(i, conditions));
  }

  std::mt19937_64 rng{17};
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i)
  {
    std::string const prompt = PromptBuilder::build(conditions, rng);
    EXPECT_EQ(1u, all.count(prompt));
    seen.insert(prompt);
  }
  EXPECT_EQ(all.size(), seen.size());

  std::mt19937_64 a{5};
  std::mt19937_64 b{5};
  EXPECT_EQ(PromptBuilder::build(conditions, a), PromptBuilder::build(conditions, b));
}

}  // namespace test
}  // namespace cpg_sim
