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

#include <string>

#include "type/type.hpp"

namespace darkroom {
/**
 * @brief Lowercase the stem, map every char outside [a-z0-9-] to '-', collapse dash runs and
 * trim dashes from both ends. Returns "file" when nothing is left.
 */
auto SanitizeStem(const std::string& stem) -> std::string;

/**
 * @brief Destination file name for the word/asset media flow: processable images become
 * "<stem>.webp", everything else keeps its lowercased extension.
 */
auto DeriveMediaFilename(const file_name_t& source) -> std::string;

/**
 * @brief Destination file name that keeps the (lowercased) source extension.
 * "IMG 01.JPG" -> "img-01.jpg"
 */
auto DeriveArchiveFilename(const file_name_t& source) -> std::string;

/**
 * @brief Sanitized stem of a source file, used as a photo/file id
 */
auto DeriveItemId(const file_name_t& source) -> std::string;

/**
 * @brief Escape the five XML special characters
 */
auto EscapeXml(const std::string& text) -> std::string;
};  // namespace darkroom
