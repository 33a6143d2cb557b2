#include "image/cover_crop.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "image_test_fixation.hpp"

namespace darkroom {
TEST(CoverCropTest, CenteredByDefault) {
  // 2000x1000 onto 1200x630: height bound, scale 0.63
  const auto crop = ComputeCoverCrop(2000, 1000, 1200, 630, std::nullopt);
  EXPECT_EQ(crop.scaled_h_, 630);
  EXPECT_EQ(crop.scaled_w_, 1260);
  EXPECT_EQ(crop.offset_x_, 30);
  EXPECT_EQ(crop.offset_y_, 0);
}

TEST(CoverCropTest, FocalPointMovesWindowToEdges) {
  const auto left  = ComputeCoverCrop(2000, 1000, 1200, 630, FocalPoint{0, 50});
  const auto right = ComputeCoverCrop(2000, 1000, 1200, 630, FocalPoint{100, 50});
  EXPECT_EQ(left.offset_x_, 0);
  EXPECT_EQ(right.offset_x_, right.scaled_w_ - right.target_w_);

  const auto top    = ComputeCoverCrop(1000, 3000, 1200, 630, FocalPoint{50, 0});
  const auto bottom = ComputeCoverCrop(1000, 3000, 1200, 630, FocalPoint{50, 100});
  EXPECT_EQ(top.offset_y_, 0);
  EXPECT_EQ(bottom.offset_y_, bottom.scaled_h_ - bottom.target_h_);
}

TEST(CoverCropTest, OffsetsStayInBoundsForAnyInput) {
  const int sizes[][2]   = {{1, 1},      {7, 3000},  {3000, 7},   {1200, 630},
                            {1201, 631}, {640, 480}, {4032, 3024}, {333, 999}};
  const int targets[][2] = {{1200, 630}, {600, 600}, {1, 1}, {1600, 900}};
  for (const auto& src : sizes) {
    for (const auto& target : targets) {
      for (int fx = 0; fx <= 100; fx += 25) {
        for (int fy = 0; fy <= 100; fy += 25) {
          const auto crop =
              ComputeCoverCrop(src[0], src[1], target[0], target[1], FocalPoint{fx, fy});
          EXPECT_GE(crop.scaled_w_, crop.target_w_);
          EXPECT_GE(crop.scaled_h_, crop.target_h_);
          EXPECT_GE(crop.offset_x_, 0);
          EXPECT_GE(crop.offset_y_, 0);
          EXPECT_LE(crop.offset_x_, crop.scaled_w_ - crop.target_w_);
          EXPECT_LE(crop.offset_y_, crop.scaled_h_ - crop.target_h_);
        }
      }
    }
  }
}

TEST(CoverCropTest, RejectsEmptyDimensions) {
  EXPECT_THROW(ComputeCoverCrop(0, 100, 10, 10, std::nullopt), std::invalid_argument);
  EXPECT_THROW(ComputeCoverCrop(100, 100, 10, 0, std::nullopt), std::invalid_argument);
}

TEST(CoverCropTest, ApplyProducesTargetSize) {
  const cv::Mat img  = MakeGradient(400, 100);
  const auto    crop = ComputeCoverCrop(img.cols, img.rows, 120, 63, FocalPoint{100, 50});
  const cv::Mat out  = ApplyCoverCrop(img, crop);
  EXPECT_EQ(out.cols, 120);
  EXPECT_EQ(out.rows, 63);
}

TEST(CoverCropTest, ResizeToWidthKeepsAspect) {
  const cv::Mat img   = MakeGradient(400, 300);
  const cv::Mat small = ResizeToWidth(img, 200);
  EXPECT_EQ(small.cols, 200);
  EXPECT_EQ(small.rows, 150);
  const cv::Mat large = ResizeToWidth(img, 800);
  EXPECT_EQ(large.cols, 800);
  EXPECT_EQ(large.rows, 600);
}
}  // namespace darkroom
