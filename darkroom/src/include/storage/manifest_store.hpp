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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace darkroom {
/**
 * @brief Per-entity metadata records (album, transfer, media listing). Keys look like
 * "albums/<slug>".
 */
class ManifestStore {
 public:
  virtual ~ManifestStore()                                                 = default;

  virtual void Put(const std::string& key, const nlohmann::json& record)   = 0;
  virtual auto Get(const std::string& key) -> std::optional<nlohmann::json> = 0;

  /**
   * @brief Returns false if there was nothing to delete
   */
  virtual auto Delete(const std::string& key) -> bool                      = 0;

  /**
   * @brief Keys of every record starting with prefix, sorted
   */
  virtual auto List(const std::string& prefix) -> std::vector<std::string> = 0;
};

/**
 * @brief One pretty-printed JSON file per record under a root directory
 */
class JsonManifestStore final : public ManifestStore {
 public:
  explicit JsonManifestStore(file_path_t root);

  void Put(const std::string& key, const nlohmann::json& record) override;
  auto Get(const std::string& key) -> std::optional<nlohmann::json> override;
  auto Delete(const std::string& key) -> bool override;
  auto List(const std::string& prefix) -> std::vector<std::string> override;

  auto PathForKey(const std::string& key) const -> file_path_t;

 private:
  file_path_t root_;
};
};  // namespace darkroom
