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
#include <string_view>
#include <vector>

#include "image/image_variant.hpp"

namespace darkroom {
/**
 * @brief Parse a focal argument: a preset name ("center", "top left", ...), its shorthand
 * ("c", "tl", ...) or an "x,y" pair of percentages. Pairs are clamped to [0,100].
 * Returns nullopt for anything else.
 */
auto ParseFocal(std::string_view text) -> std::optional<FocalPoint>;

/**
 * @brief Long preset names, in display order
 */
auto FocalPresetNames() -> std::vector<std::string>;
};  // namespace darkroom
