#include "pipeline/variant_generator.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

#include "image/image_test_fixation.hpp"

namespace darkroom {
namespace {
auto SmallSettings() -> VariantSettings {
  VariantSettings settings;
  settings.thumb_width_    = 60;
  settings.full_width_     = 160;
  settings.preview_width_  = 120;
  settings.preview_height_ = 63;
  return settings;
}

auto DecodeVariant(const MediaVariant& variant) -> cv::Mat {
  return cv::imdecode(variant.bytes_, cv::IMREAD_COLOR);
}
}  // namespace

class VariantGeneratorTests : public ::testing::Test {
 protected:
  VariantGenerator generator_{SmallSettings()};
};

TEST_F(VariantGeneratorTests, JpegSourceIsKeptAsOriginal) {
  const auto jpeg   = EncodeAs(MakeGradient(320, 200), ".jpg");
  const auto result = generator_.Process(jpeg, ".JPEG");

  EXPECT_EQ(result.width_, 320);
  EXPECT_EQ(result.height_, 200);
  EXPECT_EQ(result.original_.bytes_, jpeg);
  EXPECT_EQ(result.original_.extension_, ".jpeg");
  EXPECT_EQ(result.original_.content_type_, "image/jpeg");

  EXPECT_EQ(result.thumb_.content_type_, "image/webp");
  EXPECT_EQ(DecodeVariant(result.thumb_).cols, 60);
  EXPECT_EQ(DecodeVariant(result.full_).cols, 160);

  const cv::Mat preview = DecodeVariant(result.preview_);
  EXPECT_EQ(preview.cols, 120);
  EXPECT_EQ(preview.rows, 63);
  EXPECT_EQ(result.preview_.extension_, ".jpg");
}

TEST_F(VariantGeneratorTests, PngSourceIsReencodedAsJpeg) {
  const auto png    = EncodeAs(MakeGradient(200, 300), ".png");
  const auto result = generator_.Process(png, ".png");

  EXPECT_NE(result.original_.bytes_, png);
  EXPECT_EQ(result.original_.extension_, ".jpg");
  const cv::Mat original = DecodeVariant(result.original_);
  EXPECT_EQ(original.cols, 200);
  EXPECT_EQ(original.rows, 300);
  EXPECT_FALSE(result.captured_at_.has_value());
}

TEST_F(VariantGeneratorTests, UndecodableBytesThrow) {
  const byte_buffer_t junk(128, 0x42);
  EXPECT_THROW(generator_.Process(junk, ".jpg"), DecodeError);
}

TEST_F(VariantGeneratorTests, FocalMovesPreviewCrop) {
  // Left half black, right half white
  cv::Mat img(100, 400, CV_8UC3, cv::Scalar(0, 0, 0));
  img(cv::Rect(200, 0, 200, 100)).setTo(cv::Scalar(255, 255, 255));
  const auto png   = EncodeAs(img, ".png");

  const auto left  = DecodeVariant(
      generator_.ProcessToPreview(png, FocalPoint{0, 50}, std::nullopt, ".png"));
  const auto right = DecodeVariant(
      generator_.ProcessToPreview(png, FocalPoint{100, 50}, std::nullopt, ".png"));
  EXPECT_LT(cv::mean(left)[0], 40.0);
  EXPECT_GT(cv::mean(right)[0], 215.0);
}

TEST_F(VariantGeneratorTests, WebPRespectsMaxWidth) {
  const auto png   = EncodeAs(MakeGradient(300, 150), ".png");

  const auto wide  = generator_.ProcessToWebP(png, ".png", 100, 80);
  EXPECT_EQ(wide.width_, 100);
  EXPECT_EQ(wide.height_, 50);
  EXPECT_EQ(wide.image_.extension_, ".webp");

  // Never upscaled
  const auto small = generator_.ProcessToWebP(png, ".png", 1000, 80);
  EXPECT_EQ(small.width_, 300);
  EXPECT_EQ(DecodeVariant(small.image_).cols, 300);
}

TEST_F(VariantGeneratorTests, GifThumbUsesFirstFrame) {
  byte_buffer_t gif;
  try {
    gif = EncodeAs(MakeGradient(120, 90), ".gif");
  } catch (const cv::Exception&) {
    GTEST_SKIP() << "OpenCV was built without GIF support";
  }
  const auto thumb = generator_.ProcessGifThumb(gif);
  EXPECT_EQ(thumb.width_, 120);
  EXPECT_EQ(thumb.height_, 90);
  EXPECT_EQ(DecodeVariant(thumb.thumb_).cols, 60);
}
}  // namespace darkroom
