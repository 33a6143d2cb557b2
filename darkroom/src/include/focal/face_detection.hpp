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

#include <cstddef>
#include <optional>
#include <vector>

#include "image/image_variant.hpp"

namespace darkroom {
/**
 * @brief A detection in normalized image coordinates ([0,1] on both axes)
 */
struct FaceBox {
  float x1_    = 0.0f;
  float y1_    = 0.0f;
  float x2_    = 0.0f;
  float y2_    = 0.0f;
  float score_ = 0.0f;

  auto  Area() const -> float;
};

constexpr float kFaceScoreThreshold = 0.7f;
constexpr float kNmsIouThreshold    = 0.5f;

auto IoU(const FaceBox& a, const FaceBox& b) -> float;

/**
 * @brief Collect boxes whose face score is at least threshold.
 *
 * @param scores 2 values per anchor (background, face)
 * @param boxes  4 values per anchor (x1, y1, x2, y2)
 * @param anchor_count
 */
auto DecodeDetections(const float* scores, const float* boxes, size_t anchor_count,
                      float threshold = kFaceScoreThreshold) -> std::vector<FaceBox>;

/**
 * @brief Greedy non-max suppression. Sorted by score descending, a box is kept when its IoU
 * with every kept box is at most iou_threshold.
 */
auto NonMaxSuppression(std::vector<FaceBox> boxes, float iou_threshold = kNmsIouThreshold)
    -> std::vector<FaceBox>;

/**
 * @brief Area-weighted centroid of box centers as an integer percentage, clamped to [0,100].
 * Empty input has no centroid.
 */
auto WeightedCentroid(const std::vector<FaceBox>& boxes) -> std::optional<FocalPoint>;
};  // namespace darkroom
