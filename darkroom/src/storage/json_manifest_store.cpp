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

#include "storage/manifest_store.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "utils/fs/atomic_file.hpp"

namespace darkroom {
JsonManifestStore::JsonManifestStore(file_path_t root) : root_(std::move(root)) {}

auto JsonManifestStore::PathForKey(const std::string& key) const -> file_path_t {
  if (key.empty() || key.find("..") != std::string::npos || key.front() == '/') {
    throw std::invalid_argument(
        std::format("[ERROR] JsonManifestStore: Invalid record key \"{}\"", key));
  }
  return root_ / (key + ".json");
}

void JsonManifestStore::Put(const std::string& key, const nlohmann::json& record) {
  WriteFileAtomic(PathForKey(key), record.dump(2) + "\n");
}

auto JsonManifestStore::Get(const std::string& key) -> std::optional<nlohmann::json> {
  const auto      path = PathForKey(key);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(ReadFileText(path));
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::format("[ERROR] JsonManifestStore: Corrupt record {}: {}",
                                         path.string(), e.what()));
  }
}

auto JsonManifestStore::Delete(const std::string& key) -> bool {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(PathForKey(key), ec);
  if (ec) {
    throw std::runtime_error(std::format("[ERROR] JsonManifestStore: Cannot delete {}: {}", key,
                                         ec.message()));
  }
  return removed;
}

auto JsonManifestStore::List(const std::string& prefix) -> std::vector<std::string> {
  std::vector<std::string> keys;
  const auto               slash = prefix.rfind('/');
  const file_path_t start = slash == std::string::npos ? root_ : root_ / prefix.substr(0, slash);
  std::error_code   ec;
  if (!std::filesystem::is_directory(start, ec)) {
    return keys;
  }
  for (const auto& entry : std::filesystem::recursive_directory_iterator(start)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
    auto key = std::filesystem::relative(entry.path(), root_).generic_string();
    key.resize(key.size() - std::string_view(".json").size());
    if (key.compare(0, prefix.size(), prefix) == 0) keys.push_back(std::move(key));
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}
};  // namespace darkroom
