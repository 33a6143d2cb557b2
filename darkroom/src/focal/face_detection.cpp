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

#include "focal/face_detection.hpp"

#include <algorithm>
#include <cmath>

namespace darkroom {
namespace {
auto ClampPercent(double v) -> percent_t {
  return static_cast<percent_t>(std::clamp<long>(std::lround(v), 0, 100));
}
}  // namespace

auto FaceBox::Area() const -> float {
  return std::max(0.0f, x2_ - x1_) * std::max(0.0f, y2_ - y1_);
}

auto IoU(const FaceBox& a, const FaceBox& b) -> float {
  const float ix1   = std::max(a.x1_, b.x1_);
  const float iy1   = std::max(a.y1_, b.y1_);
  const float ix2   = std::min(a.x2_, b.x2_);
  const float iy2   = std::min(a.y2_, b.y2_);
  const float inter = std::max(0.0f, ix2 - ix1) * std::max(0.0f, iy2 - iy1);
  return inter / (a.Area() + b.Area() - inter + 1e-5f);
}

auto DecodeDetections(const float* scores, const float* boxes, size_t anchor_count,
                      float threshold) -> std::vector<FaceBox> {
  std::vector<FaceBox> result;
  for (size_t i = 0; i < anchor_count; ++i) {
    const float score = scores[i * 2 + 1];
    if (score < threshold) continue;
    FaceBox box;
    box.x1_    = boxes[i * 4 + 0];
    box.y1_    = boxes[i * 4 + 1];
    box.x2_    = boxes[i * 4 + 2];
    box.y2_    = boxes[i * 4 + 3];
    box.score_ = score;
    result.push_back(box);
  }
  return result;
}

auto NonMaxSuppression(std::vector<FaceBox> boxes, float iou_threshold) -> std::vector<FaceBox> {
  std::stable_sort(boxes.begin(), boxes.end(),
                   [](const FaceBox& a, const FaceBox& b) { return a.score_ > b.score_; });
  std::vector<FaceBox> kept;
  for (const auto& candidate : boxes) {
    bool overlaps = false;
    for (const auto& k : kept) {
      if (IoU(candidate, k) > iou_threshold) {
        overlaps = true;
        break;
      }
    }
    if (!overlaps) kept.push_back(candidate);
  }
  return kept;
}

auto WeightedCentroid(const std::vector<FaceBox>& boxes) -> std::optional<FocalPoint> {
  double total_area = 0.0;
  double cx         = 0.0;
  double cy         = 0.0;
  for (const auto& box : boxes) {
    const double area = box.Area();
    cx += (box.x1_ + box.x2_) / 2.0 * area;
    cy += (box.y1_ + box.y2_) / 2.0 * area;
    total_area += area;
  }
  if (boxes.empty() || total_area <= 0.0) {
    return std::nullopt;
  }
  return FocalPoint{ClampPercent(cx / total_area * 100.0), ClampPercent(cy / total_area * 100.0)};
}
};  // namespace darkroom
