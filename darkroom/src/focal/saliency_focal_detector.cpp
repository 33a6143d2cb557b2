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

#include "focal/saliency_focal_detector.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <opencv2/imgproc.hpp>
#include <opencv2/saliency.hpp>

#include "image/cover_crop.hpp"
#include "utils/profiler/profiler.hpp"

namespace darkroom {
SaliencyFocalDetector::SaliencyFocalDetector(const nlohmann::json& params)
    : canvas_w_(params.value("canvas_width", kCanvasWidth)),
      canvas_h_(params.value("canvas_height", kCanvasHeight)) {}

auto SaliencyFocalDetector::Name() const -> std::string { return kSaliencyStrategy; }

auto SaliencyFocalDetector::BestWindowOffset(const std::vector<double>& profile, int window)
    -> int {
  const int length = static_cast<int>(profile.size());
  if (window >= length) return 0;

  const int    max_offset = length - window;
  double       sum        = 0.0;
  for (int i = 0; i < window; ++i) sum += profile[i];

  int    best        = 0;
  double best_sum    = sum;
  auto   center_dist = [max_offset](int offset) { return std::abs(2 * offset - max_offset); };
  for (int offset = 1; offset <= max_offset; ++offset) {
    sum += profile[offset + window - 1] - profile[offset - 1];
    const double eps = 1e-9 * std::max(1.0, std::abs(best_sum));
    if (sum > best_sum + eps ||
        (std::abs(sum - best_sum) <= eps && center_dist(offset) < center_dist(best))) {
      best     = offset;
      best_sum = std::max(best_sum, sum);
    }
  }
  return best;
}

auto SaliencyFocalDetector::AnchorFromCrop(int scaled_w, int scaled_h, int left, int top,
                                           int canvas_w, int canvas_h)
    -> std::optional<FocalPoint> {
  const double center_x = left + canvas_w / 2.0;
  const double center_y = top + canvas_h / 2.0;
  const long   x        = std::lround(center_x / scaled_w * 100.0);
  const long   y        = std::lround(center_y / scaled_h * 100.0);

  if (x >= kDeadbandLow && x <= kDeadbandHigh && y >= kDeadbandLow && y <= kDeadbandHigh) {
    return std::nullopt;
  }
  return FocalPoint{static_cast<percent_t>(std::clamp<long>(x, 0, 100)),
                    static_cast<percent_t>(std::clamp<long>(y, 0, 100))};
}

auto SaliencyFocalDetector::DetectImage(const cv::Mat& upright_bgr) -> std::optional<FocalPoint> {
  EASY_BLOCK("SaliencyFocalDetector::DetectImage");
  const CoverCrop crop =
      ComputeCoverCrop(upright_bgr.cols, upright_bgr.rows, canvas_w_, canvas_h_, std::nullopt);

  cv::Mat scaled;
  cv::resize(upright_bgr, scaled, cv::Size(crop.scaled_w_, crop.scaled_h_), 0, 0,
             cv::INTER_AREA);

  cv::Mat saliency_map;
  auto    saliency = cv::saliency::StaticSaliencySpectralResidual::create();
  if (!saliency->computeSaliency(scaled, saliency_map) || saliency_map.empty()) {
    return std::nullopt;
  }
  if (saliency_map.size() != scaled.size()) {
    cv::resize(saliency_map, saliency_map, scaled.size(), 0, 0, cv::INTER_LINEAR);
  }
  saliency_map.convertTo(saliency_map, CV_64F);

  // Column and row mass of the saliency map
  cv::Mat col_sum;
  cv::Mat row_sum;
  cv::reduce(saliency_map, col_sum, 0, cv::REDUCE_SUM, CV_64F);
  cv::reduce(saliency_map, row_sum, 1, cv::REDUCE_SUM, CV_64F);
  std::vector<double> col_profile(col_sum.begin<double>(), col_sum.end<double>());
  std::vector<double> row_profile(row_sum.begin<double>(), row_sum.end<double>());

  const int left = BestWindowOffset(col_profile, canvas_w_);
  const int top  = BestWindowOffset(row_profile, canvas_h_);
  return AnchorFromCrop(crop.scaled_w_, crop.scaled_h_, left, top, canvas_w_, canvas_h_);
}
};  // namespace darkroom
