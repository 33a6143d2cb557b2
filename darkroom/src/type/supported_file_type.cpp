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

#include "type/supported_file_type.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

namespace darkroom {
namespace {
const std::unordered_map<std::string, std::string> kMimeTypes = {
    // Images
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".webp", "image/webp"},
    {".gif", "image/gif"},
    {".heic", "image/heic"},
    {".hif", "image/heif"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".svg", "image/svg+xml"},
    {".bmp", "image/bmp"},
    {".ico", "image/x-icon"},
    // Video
    {".mp4", "video/mp4"},
    {".mov", "video/quicktime"},
    {".webm", "video/webm"},
    {".avi", "video/x-msvideo"},
    {".mkv", "video/x-matroska"},
    {".m4v", "video/x-m4v"},
    {".wmv", "video/x-ms-wmv"},
    {".flv", "video/x-flv"},
    // Audio
    {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".ogg", "audio/ogg"},
    {".flac", "audio/flac"},
    {".aac", "audio/aac"},
    {".m4a", "audio/mp4"},
    {".wma", "audio/x-ms-wma"},
    // Documents
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".csv", "text/csv"},
    {".json", "application/json"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".ppt", "application/vnd.ms-powerpoint"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
};
}  // namespace

auto LowerExtension(const fs::path& filename) -> std::string {
  std::string ext = filename.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

auto NormalizeExtension(std::string_view ext) -> std::string {
  std::string out(ext);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!out.empty() && out.front() != '.') {
    out.insert(out.begin(), '.');
  }
  return out;
}

auto GetMimeType(const fs::path& filename) -> std::string {
  auto it = kMimeTypes.find(LowerExtension(filename));
  if (it == kMimeTypes.end()) {
    return "application/octet-stream";
  }
  return it->second;
}

auto GetFileKind(const fs::path& filename) -> FileKind {
  const std::string ext = LowerExtension(filename);
  if (animated_extensions.count(ext) > 0) return FileKind::GIF;
  if (processable_extensions.count(ext) > 0) return FileKind::IMAGE;
  if (video_extensions.count(ext) > 0) return FileKind::VIDEO;
  if (audio_extensions.count(ext) > 0) return FileKind::AUDIO;
  return FileKind::FILE;
}

auto FileKindToString(FileKind kind) -> std::string {
  switch (kind) {
    case FileKind::IMAGE:
      return "image";
    case FileKind::VIDEO:
      return "video";
    case FileKind::GIF:
      return "gif";
    case FileKind::AUDIO:
      return "audio";
    case FileKind::FILE:
      return "file";
  }
  return "file";
}

auto FileKindFromString(std::string_view kind) -> FileKind {
  if (kind == "image") return FileKind::IMAGE;
  if (kind == "video") return FileKind::VIDEO;
  if (kind == "gif") return FileKind::GIF;
  if (kind == "audio") return FileKind::AUDIO;
  return FileKind::FILE;
}

auto IsProcessableImage(const fs::path& filename) -> bool {
  return processable_extensions.count(LowerExtension(filename)) > 0;
}

auto IsAnimatedImage(const fs::path& filename) -> bool {
  return animated_extensions.count(LowerExtension(filename)) > 0;
}

auto IsHeifExtension(std::string_view ext) -> bool {
  return heif_extensions.count(NormalizeExtension(ext)) > 0;
}

auto IsVisualKind(FileKind kind) -> bool { return kind == FileKind::IMAGE || kind == FileKind::GIF; }

auto FormatBytes(uint64_t bytes) -> std::string {
  if (bytes < 1024) {
    return std::format("{} B", bytes);
  }
  if (bytes < 1024 * 1024) {
    return std::format("{:.1f} KB", static_cast<double>(bytes) / 1024.0);
  }
  return std::format("{:.2f} MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
}
};  // namespace darkroom
