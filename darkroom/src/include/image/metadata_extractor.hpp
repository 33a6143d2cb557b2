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
#include <cstdint>
#include <exiv2/exiv2.hpp>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace darkroom {
struct EmbeddedMetadata {
  // EXIF orientation tag value, 1..8. 1 means "as stored".
  int                        orientation_ = 1;
  std::optional<std::string> captured_at_{};
  // Set when Exiv2 could not read the container; the fields above are then defaults
  std::optional<std::string> read_error_{};
};

class MetadataExtractor {
 public:
  /**
   * @brief Open an in-memory image with Exiv2 and read its metadata.
   *
   * @param buffer
   * @param size
   * @return Exiv2::Image::UniquePtr, nullptr if Exiv2 does not recognize the container
   */
  static auto ExtractEXIFFromBuffer(const uint8_t* buffer, size_t size) -> Exiv2::Image::UniquePtr;

  /**
   * @brief Orientation and capture timestamp. Never throws; unreadable metadata yields the
   * defaults with read_error_ set.
   */
  static auto ReadEmbeddedMetadata(const uint8_t* buffer, size_t size) -> EmbeddedMetadata;

  /**
   * @brief Capture time from EXIF, preferring DateTimeOriginal over DateTimeDigitized over
   * Image.DateTime, as "YYYY-MM-DDTHH:MM:SS.000Z"
   */
  static auto CaptureTimestamp(const Exiv2::ExifData& exif) -> std::optional<std::string>;

  /**
   * @brief Convert an EXIF "YYYY:MM:DD HH:MM:SS" value into ISO-8601
   */
  static auto ExifDateToIso(const std::string& exif_date) -> std::optional<std::string>;
};
}  // namespace darkroom
