//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <opencv2/core.hpp>
#include <string>

#include "image/image_variant.hpp"

namespace darkroom {
/**
 * @brief Social-card overlay: a bottom gradient plus "brand · title" on the left and an
 * optional id on the right. Layout constants are defined for a 1200px wide card and scale
 * linearly with the output width.
 */
class OverlayCompositor {
 public:
  static constexpr double kReferenceWidth   = 1200.0;
  static constexpr double kGradientStart    = 0.58;
  static constexpr double kGradientOpacity  = 0.72;
  static constexpr double kTextInset        = 48.0;
  static constexpr double kBaselineFromBase = 44.0;
  static constexpr double kTitleFontSize    = 28.0;
  static constexpr double kIdFontSize       = 22.0;

  explicit OverlayCompositor(std::string brand = "milk & henny");

  /**
   * @brief Build the SVG document for an output of width x height. User text is escaped.
   */
  auto BuildSvg(const OverlaySpec& spec, int width, int height) const -> std::string;

  /**
   * @brief Render an SVG document with librsvg into a premultiplied BGRA image
   */
  static auto Rasterize(const std::string& svg, int width, int height) -> cv::Mat;

  /**
   * @brief Draw the overlay onto a BGR image in place
   */
  void        Composite(cv::Mat& bgr, const OverlaySpec& spec) const;

  /**
   * @brief dst = dst * (1 - alpha) + src for a premultiplied BGRA src of the same size
   */
  static void AlphaBlendPremultiplied(cv::Mat& bgr, const cv::Mat& bgra_premultiplied);

  auto        Brand() const -> const std::string& { return brand_; }

 private:
  std::string brand_;
};
};  // namespace darkroom
