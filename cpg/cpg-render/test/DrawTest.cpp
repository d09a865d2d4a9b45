// Ticket: 0009_scene_rendering

#include <gtest/gtest.h>

#include <stdexcept>

#include "cpg-render/src/Draw.hpp"
#include "cpg-render/src/Image.hpp"

namespace cpg_render
{
namespace test
{

// ========== Image Tests ==========

TEST(ImageTest, Constructor_FillsBackground)
{
  Image const image{8, 4};

  EXPECT_EQ(8, image.width());
  EXPECT_EQ(4, image.height());
  EXPECT_EQ(32u, image.countPixels(Colors::kWhite));
}

TEST(ImageTest, Constructor_NonPositiveSize_Throws)
{
  EXPECT_THROW(Image(0, 10), std::invalid_argument);
  EXPECT_THROW(Image(10, -1), std::invalid_argument);
}

TEST(ImageTest, SetPixel_ClipsOutsideRaster)
{
  Image image{4, 4};
  image.setPixel(-1, 2, Colors::kBlack);
  image.setPixel(4, 0, Colors::kBlack);
  image.setPixel(2, 3, Colors::kBlack);

  EXPECT_EQ(1u, image.countPixels(Colors::kBlack));
  EXPECT_EQ(Colors::kBlack, image.at(2, 3));
  EXPECT_THROW(static_cast<void>(image.at(4, 4)), std::out_of_range);
}

TEST(ImageTest, Data_IsPackedRgb)
{
  Image image{2, 2};
  image.setPixel(1, 1, Rgb{1, 2, 3});

  const uint8_t* data = image.data();
  EXPECT_EQ(1, data[9]);
  EXPECT_EQ(2, data[10]);
  EXPECT_EQ(3, data[11]);
}

// ========== Shape Tests ==========

TEST(DrawTest, DrawBall_FillWithBlackOutline)
{
  Image image{100, 100};
  drawBall(image, 50.0, 50.0, 20, Colors::kBallA);

  EXPECT_EQ(Colors::kBallA, image.at(50, 50));
  EXPECT_EQ(Colors::kBallA, image.at(67, 50));
  EXPECT_EQ(Colors::kBlack, image.at(70, 50));
  EXPECT_EQ(Colors::kBlack, image.at(50, 31));
  EXPECT_EQ(Colors::kWhite, image.at(71, 50));
  EXPECT_EQ(Colors::kWhite, image.at(0, 0));
}

TEST(DrawTest, FillCircle_IsSymmetric)
{
  Image image{41, 41};
  fillCircle(image, 20.0, 20.0, 10.0, Colors::kBallB);

  for (int d = 0; d <= 10; ++d)
  {
    EXPECT_EQ(image.at(20 + d, 20), image.at(20 - d, 20));
    EXPECT_EQ(image.at(20, 20 + d), image.at(20, 20 - d));
  }
  EXPECT_EQ(Colors::kWhite, image.at(31, 20));
}

TEST(DrawTest, FillTriangle_CoversInteriorOnly)
{
  Image image{20, 20};
  fillTriangle(image, 2.0, 2.0, 17.0, 2.0, 2.0, 17.0, Colors::kArrow);

  EXPECT_EQ(Colors::kArrow, image.at(4, 4));
  EXPECT_EQ(Colors::kWhite, image.at(16, 16));
}

// ========== Arrow Tests ==========

TEST(DrawTest, DrawVelocityArrow_PointsInDirectionOfMotion)
{
  Image right{200, 60};
  ASSERT_TRUE(drawVelocityArrow(right, 50.0, 30.0, 20, 5.0));

  // Shaft starts at the ball edge (x = 70) and spans 50 px
  EXPECT_EQ(Colors::kArrow, right.at(75, 30));
  EXPECT_EQ(Colors::kArrow, right.at(119, 30));
  EXPECT_EQ(Colors::kWhite, right.at(60, 30));
  EXPECT_EQ(Colors::kWhite, right.at(125, 30));

  Image left{200, 60};
  ASSERT_TRUE(drawVelocityArrow(left, 150.0, 30.0, 20, -5.0));
  EXPECT_EQ(Colors::kArrow, left.at(125, 30));
  EXPECT_EQ(Colors::kWhite, left.at(140, 30));
}

TEST(DrawTest, DrawVelocityArrow_ShaftWidthThreePixels)
{
  Image image{200, 60};
  ASSERT_TRUE(drawVelocityArrow(image, 50.0, 30.0, 20, 5.0));

  EXPECT_EQ(Colors::kArrow, image.at(80, 29));
  EXPECT_EQ(Colors::kArrow, image.at(80, 31));
  EXPECT_EQ(Colors::kWhite, image.at(80, 27));
  EXPECT_EQ(Colors::kWhite, image.at(80, 33));
}

TEST(DrawTest, DrawVelocityArrow_TooShortIsSkipped)
{
  Image image{100, 60};

  // 0.4 m/s * 10 px = 4 px < 5 px
  EXPECT_FALSE(drawVelocityArrow(image, 50.0, 30.0, 10, 0.4));
  EXPECT_EQ(0u, image.countPixels(Colors::kArrow));
}

TEST(DrawTest, ArrowMidpointX_HalfwayAlongShaft)
{
  // Edge at 70, 50 px long
  EXPECT_DOUBLE_EQ(95.0, arrowMidpointX(50.0, 20, 5.0));
  EXPECT_DOUBLE_EQ(105.0, arrowMidpointX(150.0, 20, -5.0));
}

}  // namespace test
}  // namespace cpg_render
