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

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>

namespace fs = std::filesystem;

namespace darkroom {
enum class FileKind : uint8_t { IMAGE = 0, VIDEO, GIF, AUDIO, FILE };

// Lowercase, dot-prefixed
static const std::unordered_set<std::string> processable_extensions = {
    ".jpg", ".jpeg", ".png", ".webp", ".heic", ".hif", ".tif", ".tiff"};
static const std::unordered_set<std::string> animated_extensions = {".gif"};
static const std::unordered_set<std::string> video_extensions    = {
    ".mp4", ".mov", ".webm", ".avi", ".mkv", ".m4v", ".wmv", ".flv"};
static const std::unordered_set<std::string> audio_extensions = {".mp3", ".wav", ".ogg", ".flac",
                                                                 ".aac", ".m4a", ".wma"};
static const std::unordered_set<std::string> heif_extensions  = {".heic", ".hif"};

/**
 * @brief Lowercased extension of a file name, including the leading dot
 */
auto LowerExtension(const fs::path& filename) -> std::string;

/**
 * @brief Lowercase a bare extension and make sure it starts with a dot: "JPG" -> ".jpg"
 */
auto NormalizeExtension(std::string_view ext) -> std::string;

/**
 * @brief MIME type for a file name; application/octet-stream when unknown
 */
auto GetMimeType(const fs::path& filename) -> std::string;

auto GetFileKind(const fs::path& filename) -> FileKind;

auto FileKindToString(FileKind kind) -> std::string;
auto FileKindFromString(std::string_view kind) -> FileKind;

/**
 * @brief Whether the image codec path can re-encode this file (thumb/full/preview)
 */
auto IsProcessableImage(const fs::path& filename) -> bool;

auto IsAnimatedImage(const fs::path& filename) -> bool;

auto IsHeifExtension(std::string_view ext) -> bool;

/**
 * @brief Whether the file has a visual representation in a manifest (images and gifs)
 */
auto IsVisualKind(FileKind kind) -> bool;

/**
 * @brief Human-readable size: "512 B", "1.5 KB", "2.25 MB"
 */
auto FormatBytes(uint64_t bytes) -> std::string;
};  // namespace darkroom
