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
#include <string>
#include <vector>

#include "type/type.hpp"

namespace darkroom {
/**
 * @brief Write bytes to "<path>.tmp" and rename it over path. Readers never observe a
 * partially written file.
 */
void WriteFileAtomic(const file_path_t& path, const uint8_t* data, size_t size);
void WriteFileAtomic(const file_path_t& path, const std::string& text);

auto ReadFileBytes(const file_path_t& path) -> byte_buffer_t;
auto ReadFileText(const file_path_t& path) -> std::string;

/**
 * @brief Regular, non-hidden files directly under dir, sorted by name
 */
auto ListVisibleFiles(const file_path_t& dir) -> std::vector<file_name_t>;
};  // namespace darkroom
