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

#include "utils/fs/atomic_file.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace darkroom {
void WriteFileAtomic(const file_path_t& path, const uint8_t* data, size_t size) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error(std::format("[ERROR] AtomicFile: Cannot create directory {}: {}",
                                           path.parent_path().string(), ec.message()));
    }
  }

  const file_path_t tmp_path = path.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error(
          std::format("[ERROR] AtomicFile: Cannot open {} for writing", tmp_path.string()));
    }
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
      throw std::runtime_error(
          std::format("[ERROR] AtomicFile: Failed while writing {}", tmp_path.string()));
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file
    std::error_code remove_ec;
    std::filesystem::remove(path, remove_ec);
    ec.clear();
    std::filesystem::rename(tmp_path, path, ec);
  }
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw std::runtime_error(std::format("[ERROR] AtomicFile: Cannot publish {}: {}",
                                         path.string(), ec.message()));
  }
}

void WriteFileAtomic(const file_path_t& path, const std::string& text) {
  WriteFileAtomic(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

auto ReadFileBytes(const file_path_t& path) -> byte_buffer_t {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error(
        std::format("[ERROR] AtomicFile: Cannot open {} for reading", path.string()));
  }
  return byte_buffer_t(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

auto ReadFileText(const file_path_t& path) -> std::string {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error(
        std::format("[ERROR] AtomicFile: Cannot open {} for reading", path.string()));
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

auto ListVisibleFiles(const file_path_t& dir) -> std::vector<file_name_t> {
  std::vector<file_name_t> files;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    const std::string name = entry.path().filename().string();
    if (name.empty() || name.front() == '.') continue;
    files.push_back(name);
  }
  std::sort(files.begin(), files.end());
  return files;
}
};  // namespace darkroom
