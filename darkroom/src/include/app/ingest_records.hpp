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

#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "image/image_variant.hpp"
#include "type/supported_file_type.hpp"
#include "type/type.hpp"

namespace darkroom {
enum class IngestErrorCode : uint8_t {
  UNKNOWN = 0,
  UNSUPPORTED_FORMAT,
  FOCAL_DETECTION_FAILED,
  THUMBNAIL_FAILED,
  METADATA_UNAVAILABLE
};

auto IngestErrorCodeToString(IngestErrorCode code) -> std::string;

/**
 * @brief A per-file degradation that did not stop the batch
 */
struct IngestWarning {
  IngestErrorCode code_ = IngestErrorCode::UNKNOWN;
  file_name_t     source_{};
  std::string     message_{};
};

struct AlbumPhotoRecord {
  std::string                id_{};
  file_name_t                source_{};
  int                        width_  = 0;
  int                        height_ = 0;
  std::optional<std::string> taken_at_{};
  std::optional<FocalPoint>  focal_{};
};

struct TransferFileRecord {
  std::string                id_{};
  file_name_t                filename_{};
  FileKind                   kind_ = FileKind::FILE;
  uint64_t                   size_ = 0;
  std::string                mime_type_{};
  std::optional<int>         width_{};
  std::optional<int>         height_{};
  std::optional<std::string> taken_at_{};
};

struct MediaFileRecord {
  file_name_t        original_{};
  std::string        filename_{};
  FileKind           kind_ = FileKind::FILE;
  uint64_t           size_ = 0;
  std::optional<int> width_{};
  std::optional<int> height_{};
  bool               overwrote_ = false;
  // Ready-to-paste link to the stored object
  std::string        markdown_{};
};

/**
 * @brief "![label](path)" for images, videos and GIFs, "[label](path)" otherwise. The label is
 * the filename without its extension.
 */
auto MarkdownSnippet(const std::string& prefix, const std::string& filename, FileKind kind)
    -> std::string;

// Checkpoint and manifest representation
void to_json(nlohmann::json& j, const FocalPoint& focal);
void from_json(const nlohmann::json& j, FocalPoint& focal);
void to_json(nlohmann::json& j, const AlbumPhotoRecord& record);
void from_json(const nlohmann::json& j, AlbumPhotoRecord& record);
void to_json(nlohmann::json& j, const TransferFileRecord& record);
void from_json(const nlohmann::json& j, TransferFileRecord& record);
void to_json(nlohmann::json& j, const MediaFileRecord& record);
void from_json(const nlohmann::json& j, MediaFileRecord& record);

struct ManifestSortKey {
  bool                       visual_ = true;
  std::optional<std::string> taken_at_{};
  std::string                filename_{};
};

/**
 * @brief Visual items first: dated ones by capture time, then undated ones; filename breaks
 * ties. Non-visual items follow, by filename.
 */
auto ManifestOrderLess(const ManifestSortKey& a, const ManifestSortKey& b) -> bool;

template <typename Record, typename KeyOf>
void SortForManifest(std::vector<Record>& records, KeyOf key_of) {
  std::stable_sort(records.begin(), records.end(), [&](const Record& a, const Record& b) {
    return ManifestOrderLess(key_of(a), key_of(b));
  });
}
};  // namespace darkroom
