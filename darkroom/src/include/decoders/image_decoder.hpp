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
#include <stdexcept>
#include <string>
#include <vector>

#include "image/metadata_extractor.hpp"
#include "type/type.hpp"

namespace darkroom {
/**
 * @brief Raised when image bytes cannot be turned into pixels and no fallback path exists.
 * The message carries remediation for the operator.
 */
class DecodeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct DecodedImage {
  // BGR, 8-bit, already rotated upright
  cv::Mat          image_;
  EmbeddedMetadata metadata_{};
};

class ImageDecoder {
 public:
  /**
   * @brief Decode bytes and apply the EXIF orientation
   *
   * @param bytes
   * @return DecodedImage
   * @throws DecodeError if the codec cannot read the bytes
   */
  static auto DecodeOriented(const byte_buffer_t& bytes) -> DecodedImage;

  /**
   * @brief DecodeOriented, retried once through the platform HEIF converter when the source
   * extension is .heic/.hif
   */
  static auto DecodeWithFallback(const byte_buffer_t& bytes, const std::string& source_ext)
      -> DecodedImage;

  static auto ApplyOrientation(const cv::Mat& img, int orientation) -> cv::Mat;

  /**
   * @brief Convert HEIF bytes to JPEG with an external tool (sips on macOS, heif-convert
   * elsewhere). Returns nullopt when the tool is missing or fails.
   */
  static auto ConvertHeifToJpeg(const byte_buffer_t& bytes, const std::string& source_ext)
      -> std::optional<byte_buffer_t>;

  static auto HeifDecodeError(const std::string& source_ext) -> DecodeError;

  /**
   * @brief Spawn argv[0] (searched on PATH) with stdout and stderr discarded and wait for it
   *
   * @return true when the tool exited with status 0
   */
  static auto RunExternalTool(const std::vector<std::string>& argv) -> bool;
};
}  // namespace darkroom
