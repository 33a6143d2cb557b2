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

#include <optional>
#include <string>

#include "type/type.hpp"

namespace darkroom {
/**
 * @brief One encoded output of the variant generator
 */
struct MediaVariant {
  byte_buffer_t bytes_{};
  std::string   content_type_{};
  // Dot-prefixed, e.g. ".webp"
  std::string   extension_{};
};

/**
 * @brief Crop anchor as a percentage of the image dimensions
 */
struct FocalPoint {
  percent_t x_ = 50;
  percent_t y_ = 50;

  auto      operator==(const FocalPoint&) const -> bool = default;
};

struct OverlaySpec {
  std::string                title_{};
  std::optional<std::string> id_{};
};

struct ProcessedImage {
  MediaVariant               thumb_{};
  MediaVariant               full_{};
  MediaVariant               original_{};
  MediaVariant               preview_{};

  // Post-orientation dimensions
  int                        width_  = 0;
  int                        height_ = 0;

  std::optional<std::string> captured_at_{};
  // Why orientation and capture time fell back to defaults
  std::optional<std::string> metadata_error_{};
};

struct ProcessedGif {
  MediaVariant thumb_{};
  int          width_  = 0;
  int          height_ = 0;
};

struct ProcessedWebP {
  MediaVariant image_{};
  int          width_  = 0;
  int          height_ = 0;
};
};  // namespace darkroom
