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

#include "focal/focal_presets.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace darkroom {
namespace {
struct FocalPreset {
  const char* name_;
  const char* shorthand_;
  FocalPoint  point_;
};

constexpr FocalPreset kPresets[] = {
    {"center", "c", {50, 50}},        {"top", "t", {50, 0}},
    {"bottom", "b", {50, 100}},       {"top left", "tl", {0, 0}},
    {"top right", "tr", {100, 0}},    {"bottom left", "bl", {0, 100}},
    {"bottom right", "br", {100, 100}},
};

auto Normalize(std::string_view text) -> std::string {
  std::string out;
  bool        pending_space = false;
  for (unsigned char c : text) {
    if (std::isspace(c) || c == '-' || c == '_') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

auto ParseInt(std::string_view text) -> std::optional<int> {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);
  int  value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}
}  // namespace

auto ParseFocal(std::string_view text) -> std::optional<FocalPoint> {
  const auto comma = text.find(',');
  if (comma != std::string_view::npos) {
    auto x = ParseInt(text.substr(0, comma));
    auto y = ParseInt(text.substr(comma + 1));
    if (!x || !y) return std::nullopt;
    return FocalPoint{std::clamp(*x, 0, 100), std::clamp(*y, 0, 100)};
  }

  const std::string key = Normalize(text);
  for (const auto& preset : kPresets) {
    if (key == preset.name_ || key == preset.shorthand_) {
      return preset.point_;
    }
  }
  return std::nullopt;
}

auto FocalPresetNames() -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& preset : kPresets) names.emplace_back(preset.name_);
  return names;
}
};  // namespace darkroom
