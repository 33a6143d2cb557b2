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

#include "storage/local_object_store.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <system_error>

#include "type/supported_file_type.hpp"
#include "utils/fs/atomic_file.hpp"

namespace darkroom {
namespace {
constexpr const char* kContentTypeSuffix = ".content-type";

// Hidden names hold object metadata and in-flight writes, never objects
auto IsObjectFile(const std::filesystem::path& path) -> bool {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() != '.' && path.extension() != ".tmp";
}

auto ContentTypePath(const file_path_t& object_path) -> file_path_t {
  return object_path.parent_path() /
         ("." + object_path.filename().string() + kContentTypeSuffix);
}

auto ToSystemTime(std::filesystem::file_time_type ftime) -> std::chrono::system_clock::time_point {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(ftime));
}
}  // namespace

LocalObjectStore::LocalObjectStore(file_path_t root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw std::runtime_error(std::format("[ERROR] LocalObjectStore: Cannot create bucket root {}: {}",
                                         root_.string(), ec.message()));
  }
}

auto LocalObjectStore::PathForKey(const object_key_t& key) const -> file_path_t {
  if (key.empty() || key.front() == '/' || key.back() == '/') {
    throw std::invalid_argument(std::format("[ERROR] LocalObjectStore: Invalid key \"{}\"", key));
  }
  const std::filesystem::path relative(key);
  for (const auto& part : relative) {
    if (part == ".." || part == ".") {
      throw std::invalid_argument(
          std::format("[ERROR] LocalObjectStore: Key escapes bucket \"{}\"", key));
    }
    if (!part.empty() && part.string().front() == '.') {
      throw std::invalid_argument(std::format(
          "[ERROR] LocalObjectStore: Key \"{}\" has a hidden segment; those names are reserved",
          key));
    }
  }
  return root_ / relative;
}

void LocalObjectStore::Upload(const object_key_t& key, const byte_buffer_t& bytes,
                              const std::string& content_type) {
  const auto path      = PathForKey(key);
  const auto type_path = ContentTypePath(path);
  // The sidecar lands first so a visible object always carries its own type
  if (content_type.empty()) {
    std::error_code ec;
    std::filesystem::remove(type_path, ec);
  } else {
    WriteFileAtomic(type_path, content_type);
  }
  WriteFileAtomic(path, bytes.data(), bytes.size());
}

auto LocalObjectStore::BatchDelete(const std::vector<object_key_t>& keys) -> size_t {
  size_t deleted = 0;
  for (size_t begin = 0; begin < keys.size(); begin += kDeleteBatchSize) {
    const size_t end = std::min(keys.size(), begin + kDeleteBatchSize);
    for (size_t i = begin; i < end; ++i) {
      std::error_code ec;
      const auto      path = PathForKey(keys[i]);
      if (std::filesystem::remove(path, ec)) {
        ++deleted;
        std::error_code type_ec;
        std::filesystem::remove(ContentTypePath(path), type_ec);
        PruneEmptyParents(path);
      } else if (ec) {
        throw std::runtime_error(std::format("[ERROR] LocalObjectStore: Cannot delete {}: {}",
                                             keys[i], ec.message()));
      }
    }
  }
  return deleted;
}

void LocalObjectStore::PruneEmptyParents(const file_path_t& removed) const {
  // A prefix disappears once its last object is gone
  std::error_code ec;
  for (auto dir = removed.parent_path(); dir != root_ && dir.has_relative_path();
       dir = dir.parent_path()) {
    if (!std::filesystem::is_empty(dir, ec) || ec) return;
    std::filesystem::remove(dir, ec);
    if (ec) return;
  }
}

auto LocalObjectStore::List(const std::string& prefix) -> std::vector<ObjectInfo> {
  std::vector<ObjectInfo> objects;
  // Walk only the deepest directory the prefix names
  const auto              slash = prefix.rfind('/');
  const file_path_t       start = slash == std::string::npos ? root_ : root_ / prefix.substr(0, slash);
  std::error_code         ec;
  if (!std::filesystem::is_directory(start, ec)) {
    return objects;
  }

  for (const auto& entry : std::filesystem::recursive_directory_iterator(start)) {
    if (!entry.is_regular_file() || !IsObjectFile(entry.path())) continue;
    const std::string key = std::filesystem::relative(entry.path(), root_).generic_string();
    if (key.compare(0, prefix.size(), prefix) != 0) continue;

    ObjectInfo info;
    info.key_           = key;
    info.size_          = entry.file_size();
    info.last_modified_ = ToSystemTime(entry.last_write_time());
    objects.push_back(std::move(info));
  }
  std::sort(objects.begin(), objects.end(),
            [](const ObjectInfo& a, const ObjectInfo& b) { return a.key_ < b.key_; });
  return objects;
}

auto LocalObjectStore::Head(const object_key_t& key) -> ObjectHead {
  ObjectHead      head;
  std::error_code ec;
  const auto      path = PathForKey(key);
  if (!std::filesystem::is_regular_file(path, ec)) {
    return head;
  }
  head.exists_       = true;
  head.size_         = std::filesystem::file_size(path);
  const auto type_path = ContentTypePath(path);
  head.content_type_   = std::filesystem::is_regular_file(type_path, ec) ? ReadFileText(type_path)
                                                                         : GetMimeType(path);
  return head;
}

auto LocalObjectStore::ListPrefixes(const std::string& prefix) -> std::vector<std::string> {
  std::vector<std::string> prefixes;
  std::string              normalized = prefix;
  if (!normalized.empty() && normalized.back() != '/') normalized.push_back('/');

  const file_path_t dir = normalized.empty() ? root_ : root_ / normalized;
  std::error_code   ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return prefixes;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_directory()) continue;
    prefixes.push_back(normalized + entry.path().filename().string() + "/");
  }
  std::sort(prefixes.begin(), prefixes.end());
  return prefixes;
}
};  // namespace darkroom
