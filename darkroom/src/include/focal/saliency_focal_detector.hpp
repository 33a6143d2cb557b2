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

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

#include "focal/focal_detector.hpp"

namespace darkroom {
/**
 * @brief Model-free strategy ("saliency"). The image is cover-scaled onto an analysis canvas,
 * and the canvas-sized window with the most spectral-residual saliency gives the anchor.
 * Anchors inside the 45..55 deadband on both axes carry no signal and yield nullopt.
 */
class SaliencyFocalDetector final : public FocalDetector {
 public:
  static constexpr int kCanvasWidth   = 1200;
  static constexpr int kCanvasHeight  = 630;
  static constexpr int kDeadbandLow   = 45;
  static constexpr int kDeadbandHigh  = 55;

  explicit SaliencyFocalDetector(const nlohmann::json& params = {});

  auto Name() const -> std::string override;
  auto DetectImage(const cv::Mat& upright_bgr) -> std::optional<FocalPoint> override;

  /**
   * @brief Start of the window of length `window` with the largest sum over `profile`.
   * Ties resolve toward the centered window.
   */
  static auto BestWindowOffset(const std::vector<double>& profile, int window) -> int;

  /**
   * @brief Convert a crop offset in scaled-image space into an anchor, applying the deadband
   */
  static auto AnchorFromCrop(int scaled_w, int scaled_h, int left, int top, int canvas_w,
                             int canvas_h) -> std::optional<FocalPoint>;

 private:
  int canvas_w_ = kCanvasWidth;
  int canvas_h_ = kCanvasHeight;
};
};  // namespace darkroom
