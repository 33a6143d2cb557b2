#include "decoders/image_decoder.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "image_test_fixation.hpp"

namespace darkroom {
TEST(ImageDecoderTest, DecodesPngAndJpeg) {
  for (const char* ext : {".png", ".jpg"}) {
    const auto decoded = ImageDecoder::DecodeOriented(EncodeAs(MakeGradient(64, 32), ext));
    EXPECT_EQ(decoded.image_.cols, 64);
    EXPECT_EQ(decoded.image_.rows, 32);
    EXPECT_EQ(decoded.image_.type(), CV_8UC3);
    EXPECT_EQ(decoded.metadata_.orientation_, 1);
  }
}

TEST(ImageDecoderTest, OrientationSwapsDimensionsForQuarterTurns) {
  const cv::Mat img = MakeGradient(40, 20);
  for (int orientation : {5, 6, 7, 8}) {
    const cv::Mat out = ImageDecoder::ApplyOrientation(img, orientation);
    EXPECT_EQ(out.cols, 20) << "orientation " << orientation;
    EXPECT_EQ(out.rows, 40) << "orientation " << orientation;
  }
  for (int orientation : {1, 2, 3, 4}) {
    const cv::Mat out = ImageDecoder::ApplyOrientation(img, orientation);
    EXPECT_EQ(out.cols, 40) << "orientation " << orientation;
    EXPECT_EQ(out.rows, 20) << "orientation " << orientation;
  }
}

TEST(ImageDecoderTest, Orientation6RotatesClockwise) {
  cv::Mat img(2, 3, CV_8UC3, cv::Scalar(0, 0, 0));
  img.at<cv::Vec3b>(0, 0) = cv::Vec3b(255, 255, 255);  // top-left marker
  const cv::Mat out       = ImageDecoder::ApplyOrientation(img, 6);
  // After a clockwise quarter turn the top-left pixel sits at the top-right
  EXPECT_EQ(out.at<cv::Vec3b>(0, out.cols - 1), cv::Vec3b(255, 255, 255));
}

TEST(ImageDecoderTest, GarbageRaisesDecodeError) {
  const byte_buffer_t garbage(128, 0x42);
  EXPECT_THROW(ImageDecoder::DecodeOriented(garbage), DecodeError);
  EXPECT_THROW(ImageDecoder::DecodeWithFallback(garbage, ".png"), DecodeError);
}

TEST(ImageDecoderTest, HeifFailureNamesRemediation) {
  const byte_buffer_t garbage(128, 0x42);
  try {
    ImageDecoder::DecodeWithFallback(garbage, ".HEIC");
    FAIL() << "expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_NE(std::string(e.what()).find("HEIC"), std::string::npos);
  }
}
TEST(ImageDecoderTest, ExternalToolReportsExitStatus) {
  EXPECT_TRUE(ImageDecoder::RunExternalTool({"true"}));
  EXPECT_FALSE(ImageDecoder::RunExternalTool({"false"}));
  EXPECT_FALSE(ImageDecoder::RunExternalTool({"darkroom-no-such-converter", "-q"}));
  EXPECT_FALSE(ImageDecoder::RunExternalTool({}));
  // Output is discarded
  EXPECT_TRUE(ImageDecoder::RunExternalTool({"sh", "-c", "echo noise; echo more >&2"}));
}

TEST(ImageDecoderTest, ExternalToolFromManyThreads) {
  std::atomic<int>         ok{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&ok]() {
      for (int j = 0; j < 4; ++j) {
        if (ImageDecoder::RunExternalTool({"sh", "-c", "exit 0"})) ok.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(ok.load(), 32);
}
}  // namespace darkroom
