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

#include "image/cover_crop.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace darkroom {
namespace {
auto OffsetFor(int max_offset, percent_t focal) -> int {
  const long rounded = std::lround(static_cast<double>(max_offset) * focal / 100.0);
  return static_cast<int>(std::clamp<long>(rounded, 0, max_offset));
}
}  // namespace

auto ComputeCoverCrop(int src_w, int src_h, int target_w, int target_h,
                      const std::optional<FocalPoint>& focal) -> CoverCrop {
  if (src_w <= 0 || src_h <= 0 || target_w <= 0 || target_h <= 0) {
    throw std::invalid_argument(std::format(
        "[ERROR] CoverCrop: Invalid dimensions {}x{} -> {}x{}", src_w, src_h, target_w, target_h));
  }

  CoverCrop crop;
  crop.target_w_ = target_w;
  crop.target_h_ = target_h;
  crop.scale_    = std::max(static_cast<double>(target_w) / src_w,
                            static_cast<double>(target_h) / src_h);
  // Rounding may land one pixel short of the target on the tight axis
  crop.scaled_w_ = std::max(target_w, static_cast<int>(std::lround(src_w * crop.scale_)));
  crop.scaled_h_ = std::max(target_h, static_cast<int>(std::lround(src_h * crop.scale_)));

  const FocalPoint anchor = focal.value_or(FocalPoint{});
  crop.offset_x_          = OffsetFor(crop.scaled_w_ - target_w, anchor.x_);
  crop.offset_y_          = OffsetFor(crop.scaled_h_ - target_h, anchor.y_);
  return crop;
}

auto ApplyCoverCrop(const cv::Mat& img, const CoverCrop& crop) -> cv::Mat {
  cv::Mat scaled;
  const int interpolation = crop.scale_ < 1.0 ? cv::INTER_AREA : cv::INTER_CUBIC;
  cv::resize(img, scaled, cv::Size(crop.scaled_w_, crop.scaled_h_), 0, 0, interpolation);
  cv::Rect window(crop.offset_x_, crop.offset_y_, crop.target_w_, crop.target_h_);
  return scaled(window).clone();
}

auto ResizeToWidth(const cv::Mat& img, int width) -> cv::Mat {
  if (img.cols == width) {
    return img;
  }
  const double scale  = static_cast<double>(width) / img.cols;
  const int    height = std::max(1, static_cast<int>(std::lround(img.rows * scale)));
  cv::Mat      resized;
  cv::resize(img, resized, cv::Size(width, height), 0, 0,
             scale < 1.0 ? cv::INTER_AREA : cv::INTER_CUBIC);
  return resized;
}
};  // namespace darkroom
