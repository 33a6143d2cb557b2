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

#include "app/ingest_records.hpp"

#include <format>

namespace darkroom {
namespace {
template <typename T>
void PutOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) j[key] = *value;
}

template <typename T>
auto GetOptional(const nlohmann::json& j, const char* key) -> std::optional<T> {
  if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
  return j.at(key).get<T>();
}
}  // namespace

auto IngestErrorCodeToString(IngestErrorCode code) -> std::string {
  switch (code) {
    case IngestErrorCode::UNSUPPORTED_FORMAT:
      return "unsupported_format";
    case IngestErrorCode::FOCAL_DETECTION_FAILED:
      return "focal_detection_failed";
    case IngestErrorCode::THUMBNAIL_FAILED:
      return "thumbnail_failed";
    case IngestErrorCode::METADATA_UNAVAILABLE:
      return "metadata_unavailable";
    default:
      return "unknown";
  }
}

void to_json(nlohmann::json& j, const FocalPoint& focal) {
  j = nlohmann::json{{"x", focal.x_}, {"y", focal.y_}};
}

void from_json(const nlohmann::json& j, FocalPoint& focal) {
  j.at("x").get_to(focal.x_);
  j.at("y").get_to(focal.y_);
}

void to_json(nlohmann::json& j, const AlbumPhotoRecord& record) {
  j = nlohmann::json{{"id", record.id_},
                     {"source", record.source_},
                     {"width", record.width_},
                     {"height", record.height_}};
  PutOptional(j, "takenAt", record.taken_at_);
  PutOptional(j, "focal", record.focal_);
}

void from_json(const nlohmann::json& j, AlbumPhotoRecord& record) {
  j.at("id").get_to(record.id_);
  record.source_   = j.value("source", std::string{});
  j.at("width").get_to(record.width_);
  j.at("height").get_to(record.height_);
  record.taken_at_ = GetOptional<std::string>(j, "takenAt");
  record.focal_    = GetOptional<FocalPoint>(j, "focal");
}

void to_json(nlohmann::json& j, const TransferFileRecord& record) {
  j = nlohmann::json{{"id", record.id_},
                     {"filename", record.filename_},
                     {"kind", FileKindToString(record.kind_)},
                     {"size", record.size_},
                     {"mimeType", record.mime_type_}};
  PutOptional(j, "width", record.width_);
  PutOptional(j, "height", record.height_);
  PutOptional(j, "takenAt", record.taken_at_);
}

void from_json(const nlohmann::json& j, TransferFileRecord& record) {
  j.at("id").get_to(record.id_);
  j.at("filename").get_to(record.filename_);
  record.kind_ = FileKindFromString(j.at("kind").get<std::string>());
  j.at("size").get_to(record.size_);
  j.at("mimeType").get_to(record.mime_type_);
  record.width_    = GetOptional<int>(j, "width");
  record.height_   = GetOptional<int>(j, "height");
  record.taken_at_ = GetOptional<std::string>(j, "takenAt");
}

void to_json(nlohmann::json& j, const MediaFileRecord& record) {
  j = nlohmann::json{{"original", record.original_},
                     {"filename", record.filename_},
                     {"kind", FileKindToString(record.kind_)},
                     {"size", record.size_},
                     {"overwrote", record.overwrote_},
                     {"markdown", record.markdown_}};
  PutOptional(j, "width", record.width_);
  PutOptional(j, "height", record.height_);
}

void from_json(const nlohmann::json& j, MediaFileRecord& record) {
  j.at("original").get_to(record.original_);
  j.at("filename").get_to(record.filename_);
  record.kind_ = FileKindFromString(j.at("kind").get<std::string>());
  j.at("size").get_to(record.size_);
  record.overwrote_ = j.value("overwrote", false);
  record.markdown_  = j.value("markdown", std::string{});
  record.width_     = GetOptional<int>(j, "width");
  record.height_    = GetOptional<int>(j, "height");
}

auto MarkdownSnippet(const std::string& prefix, const std::string& filename, FileKind kind)
    -> std::string {
  const auto        dot   = filename.rfind('.');
  const std::string label =
      dot == std::string::npos || dot == 0 ? filename : filename.substr(0, dot);
  switch (kind) {
    case FileKind::IMAGE:
    case FileKind::VIDEO:
    case FileKind::GIF:
      return std::format("![{}]({}{})", label, prefix, filename);
    default:
      return std::format("[{}]({}{})", label, prefix, filename);
  }
}

auto ManifestOrderLess(const ManifestSortKey& a, const ManifestSortKey& b) -> bool {
  if (a.visual_ != b.visual_) return a.visual_;
  if (!a.visual_) return a.filename_ < b.filename_;

  const bool a_dated = a.taken_at_.has_value();
  const bool b_dated = b.taken_at_.has_value();
  if (a_dated != b_dated) return a_dated;
  if (a_dated && *a.taken_at_ != *b.taken_at_) return *a.taken_at_ < *b.taken_at_;
  return a.filename_ < b.filename_;
}
};  // namespace darkroom
