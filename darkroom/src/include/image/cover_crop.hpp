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
#include <optional>

#include "image/image_variant.hpp"

namespace darkroom {
/**
 * @brief Geometry of a "cover" fit: the source is scaled until it covers the target, then a
 * target-sized window is taken at offset_x_/offset_y_ inside the scaled image.
 */
struct CoverCrop {
  double scale_    = 1.0;
  int    scaled_w_ = 0;
  int    scaled_h_ = 0;
  int    offset_x_ = 0;
  int    offset_y_ = 0;
  int    target_w_ = 0;
  int    target_h_ = 0;
};

/**
 * @brief Compute the cover crop window for a focal point. A missing focal point is the center.
 * Always satisfies 0 <= offset <= scaled - target on both axes.
 */
auto ComputeCoverCrop(int src_w, int src_h, int target_w, int target_h,
                      const std::optional<FocalPoint>& focal) -> CoverCrop;

/**
 * @brief Scale img per crop and extract the target window
 */
auto ApplyCoverCrop(const cv::Mat& img, const CoverCrop& crop) -> cv::Mat;

/**
 * @brief Resize to a target width keeping the aspect ratio
 */
auto ResizeToWidth(const cv::Mat& img, int width) -> cv::Mat;
};  // namespace darkroom
