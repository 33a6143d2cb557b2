#include "overlay/overlay_compositor.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace darkroom {
TEST(OverlayCompositorTest, SvgEscapesUserText) {
  OverlayCompositor compositor("milk & henny");
  const auto        svg = compositor.BuildSvg({"<b>Tom & Jerry</b>", std::nullopt}, 1200, 630);

  EXPECT_NE(svg.find("milk &amp; henny"), std::string::npos);
  EXPECT_NE(svg.find("&lt;b&gt;Tom &amp; Jerry&lt;/b&gt;"), std::string::npos);
  EXPECT_EQ(svg.find("<b>"), std::string::npos);
  EXPECT_EQ(svg.find("text-anchor=\"end\""), std::string::npos);
}

TEST(OverlayCompositorTest, IdIsRightAligned) {
  OverlayCompositor compositor;
  const auto        svg = compositor.BuildSvg({"Summer", std::string("IMG_0042")}, 1200, 630);
  EXPECT_NE(svg.find("text-anchor=\"end\""), std::string::npos);
  EXPECT_NE(svg.find(">IMG_0042</text>"), std::string::npos);
  EXPECT_NE(svg.find("x=\"1152\""), std::string::npos);

  // An empty id draws nothing on the right
  const auto bare = compositor.BuildSvg({"Summer", std::string()}, 1200, 630);
  EXPECT_EQ(bare.find("text-anchor=\"end\""), std::string::npos);
}

TEST(OverlayCompositorTest, LayoutScalesWithWidth) {
  OverlayCompositor compositor;
  const auto        full = compositor.BuildSvg({"t", std::nullopt}, 1200, 630);
  const auto        half = compositor.BuildSvg({"t", std::nullopt}, 600, 315);
  EXPECT_NE(full.find("font-size=\"28\""), std::string::npos);
  EXPECT_NE(half.find("font-size=\"14\""), std::string::npos);
  EXPECT_NE(half.find("x=\"24\""), std::string::npos);
}

TEST(OverlayCompositorTest, AlphaBlendPremultiplied) {
  cv::Mat dst(2, 2, CV_8UC3, cv::Scalar(200, 200, 200));
  cv::Mat src(2, 2, CV_8UC4, cv::Scalar(0, 0, 0, 0));
  src.at<cv::Vec4b>(0, 0) = cv::Vec4b(64, 64, 64, 128);
  src.at<cv::Vec4b>(1, 1) = cv::Vec4b(10, 20, 30, 255);

  OverlayCompositor::AlphaBlendPremultiplied(dst, src);
  EXPECT_EQ(dst.at<cv::Vec3b>(0, 0), cv::Vec3b(164, 164, 164));
  EXPECT_EQ(dst.at<cv::Vec3b>(0, 1), cv::Vec3b(200, 200, 200));
  EXPECT_EQ(dst.at<cv::Vec3b>(1, 1), cv::Vec3b(10, 20, 30));
}

TEST(OverlayCompositorTest, AlphaBlendRejectsMismatchedSizes) {
  cv::Mat dst(4, 4, CV_8UC3, cv::Scalar::all(0));
  cv::Mat src(2, 2, CV_8UC4, cv::Scalar::all(0));
  EXPECT_THROW(OverlayCompositor::AlphaBlendPremultiplied(dst, src), std::invalid_argument);
}

TEST(OverlayCompositorTest, RasterizeMatchesRequestedSize) {
  OverlayCompositor compositor;
  const auto        overlay =
      OverlayCompositor::Rasterize(compositor.BuildSvg({"Card", std::nullopt}, 300, 160), 300, 160);
  EXPECT_EQ(overlay.cols, 300);
  EXPECT_EQ(overlay.rows, 160);
  EXPECT_EQ(overlay.type(), CV_8UC4);
  // The gradient starts below the upper half
  EXPECT_EQ(overlay.at<cv::Vec4b>(0, 150)[3], 0);
  EXPECT_GT(overlay.at<cv::Vec4b>(159, 150)[3], 0);
}

TEST(OverlayCompositorTest, CompositeDarkensBottomOnly) {
  OverlayCompositor compositor;
  cv::Mat           card(315, 600, CV_8UC3, cv::Scalar(255, 255, 255));
  compositor.Composite(card, {"Card", std::string("id")});

  EXPECT_EQ(card.at<cv::Vec3b>(10, 300), cv::Vec3b(255, 255, 255));
  const auto bottom = card.at<cv::Vec3b>(314, 300);
  EXPECT_LT(bottom[0], 255);
}
}  // namespace darkroom
