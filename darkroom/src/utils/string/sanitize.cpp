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

#include "utils/string/sanitize.hpp"

#include <cctype>
#include <filesystem>

#include "type/supported_file_type.hpp"

namespace darkroom {
auto SanitizeStem(const std::string& stem) -> std::string {
  std::string out;
  out.reserve(stem.size());
  for (unsigned char c : stem) {
    const char lower = static_cast<char>(std::tolower(c));
    const bool keep  = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9') ||
                      lower == '-';
    const char mapped = keep ? lower : '-';
    if (mapped == '-' && !out.empty() && out.back() == '-') {
      continue;
    }
    out.push_back(mapped);
  }

  size_t begin = 0;
  while (begin < out.size() && out[begin] == '-') ++begin;
  size_t end = out.size();
  while (end > begin && out[end - 1] == '-') --end;
  out = out.substr(begin, end - begin);

  if (out.empty()) {
    return "file";
  }
  return out;
}

auto DeriveItemId(const file_name_t& source) -> std::string {
  return SanitizeStem(std::filesystem::path(source).stem().string());
}

auto DeriveMediaFilename(const file_name_t& source) -> std::string {
  const std::string stem = DeriveItemId(source);
  if (IsProcessableImage(source)) {
    return stem + ".webp";
  }
  return stem + LowerExtension(source);
}

auto DeriveArchiveFilename(const file_name_t& source) -> std::string {
  return DeriveItemId(source) + LowerExtension(source);
}

auto EscapeXml(const std::string& text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}
};  // namespace darkroom
