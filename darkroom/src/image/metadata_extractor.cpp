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

#include "image/metadata_extractor.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <format>
#include <stdexcept>

namespace darkroom {
namespace {
auto IsDigits(const std::string& s, size_t pos, size_t len) -> bool {
  if (pos + len > s.size()) return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

auto ReadExifString(const Exiv2::ExifData& exif, const char* key) -> std::optional<std::string> {
  auto it = exif.findKey(Exiv2::ExifKey(key));
  if (it == exif.end()) {
    return std::nullopt;
  }
  return it->toString();
}
}  // namespace

auto MetadataExtractor::ExtractEXIFFromBuffer(const uint8_t* buffer, size_t size)
    -> Exiv2::Image::UniquePtr {
  if (!buffer || size == 0) {
    throw std::runtime_error("[ERROR] MetadataExtractor: empty buffer");
  }
  Exiv2::Image::UniquePtr image =
      Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(buffer), size);
  image->readMetadata();
  return image;
}

auto MetadataExtractor::ExifDateToIso(const std::string& exif_date) -> std::optional<std::string> {
  // "YYYY:MM:DD HH:MM:SS"
  if (exif_date.size() < 19) return std::nullopt;
  if (!IsDigits(exif_date, 0, 4) || !IsDigits(exif_date, 5, 2) || !IsDigits(exif_date, 8, 2) ||
      !IsDigits(exif_date, 11, 2) || !IsDigits(exif_date, 14, 2) || !IsDigits(exif_date, 17, 2)) {
    return std::nullopt;
  }
  const int year   = std::stoi(exif_date.substr(0, 4));
  const int month  = std::stoi(exif_date.substr(5, 2));
  const int day    = std::stoi(exif_date.substr(8, 2));
  const int hour   = std::stoi(exif_date.substr(11, 2));
  const int minute = std::stoi(exif_date.substr(14, 2));
  const int second = std::stoi(exif_date.substr(17, 2));
  // Cameras without a set clock write "0000:00:00 00:00:00"
  if (year == 0 || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return std::nullopt;
  }
  return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.000Z", year, month, day, hour, minute,
                     second);
}

auto MetadataExtractor::CaptureTimestamp(const Exiv2::ExifData& exif)
    -> std::optional<std::string> {
  static constexpr std::array<const char*, 3> kDateKeys = {
      "Exif.Photo.DateTimeOriginal", "Exif.Photo.DateTimeDigitized", "Exif.Image.DateTime"};
  for (const char* key : kDateKeys) {
    auto value = ReadExifString(exif, key);
    if (!value) continue;
    auto iso = ExifDateToIso(*value);
    if (iso) return iso;
  }
  return std::nullopt;
}

auto MetadataExtractor::ReadEmbeddedMetadata(const uint8_t* buffer, size_t size)
    -> EmbeddedMetadata {
  EmbeddedMetadata metadata;
  try {
    auto image = ExtractEXIFFromBuffer(buffer, size);
    if (!image) {
      return metadata;
    }
    const Exiv2::ExifData& exif = image->exifData();
    if (exif.empty()) {
      return metadata;
    }
    auto it = exif.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
    if (it != exif.end()) {
      const auto orientation = static_cast<int>(it->toInt64());
      if (orientation >= 1 && orientation <= 8) {
        metadata.orientation_ = orientation;
      }
    }
    metadata.captured_at_ = CaptureTimestamp(exif);
  } catch (const Exiv2::Error& e) {
    // Formats Exiv2 does not know (e.g. some HEIF builds) simply carry no metadata
    metadata.read_error_ = e.what();
  } catch (const std::exception& e) {
    metadata.read_error_ = e.what();
  }
  return metadata;
}
}  // namespace darkroom
