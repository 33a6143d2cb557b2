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

#include "app/resumable_batch_job.hpp"
#include "pipeline/variant_generator.hpp"
#include "type/type.hpp"

namespace darkroom {
/**
 * @brief Runtime settings of the ingest tool. Every key is optional in the JSON file.
 */
struct IngestConfig {
  file_path_t     store_root_      = "bucket";
  file_path_t     manifest_root_   = "manifests";
  file_path_t     model_path_      = "models/ultraface-320.onnx";
  // Registry name, or "none" to disable automatic focal detection
  std::string     focal_strategy_  = "onnx";
  LaneLimits      lanes_{};
  VariantSettings variants_{};
  int             media_max_width_ = 1600;
  int             media_quality_   = 85;
  std::string     brand_           = "milk & henny";
  std::string     default_expiry_  = "7d";

  static auto     FromJson(const nlohmann::json& payload) -> IngestConfig;
  auto            ToJson() const -> nlohmann::json;

  /**
   * @brief Parse a config file
   *
   * @throws std::runtime_error when the file is unreadable or not valid JSON
   */
  static auto     Load(const file_path_t& path) -> IngestConfig;

  /**
   * @brief First existing candidate of: explicit path, $DARKROOM_CONFIG,
   * CONFIG_PATH/darkroom.json. An explicit path that does not exist is an error.
   */
  static auto     ResolvePath(const std::optional<file_path_t>& explicit_path)
      -> std::optional<file_path_t>;

  /**
   * @brief Load from ResolvePath(), or defaults when nothing is found
   */
  static auto     LoadResolved(const std::optional<file_path_t>& explicit_path) -> IngestConfig;

  auto            DetectorParams() const -> nlohmann::json;
};
};  // namespace darkroom
