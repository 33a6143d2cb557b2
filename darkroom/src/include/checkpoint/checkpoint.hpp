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
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace darkroom {
enum class UploadLane : uint8_t {
  IMAGE = 0,  // decode + re-encode, CPU bound
  RAW   = 1   // bytes as-is, network bound
};

auto UploadLaneToString(UploadLane lane) -> std::string;
auto UploadLaneFromString(const std::string& lane) -> UploadLane;

struct UploadPlanEntry {
  file_name_t source_filename_{};
  std::string derived_key_{};
  bool        overwrites_ = false;
  UploadLane  lane_       = UploadLane::RAW;

  auto        operator==(const UploadPlanEntry&) const -> bool = default;
};

/**
 * @brief Durable progress of one batch job.
 *
 * Everything except completed_ is fixed when the checkpoint is created. completed_ only grows
 * until the checkpoint file is deleted.
 */
struct Checkpoint {
  static constexpr int                  kVersion = 1;

  int                                   version_ = kVersion;
  std::string                           directory_{};
  std::vector<file_name_t>              file_list_snapshot_{};
  // Job identity and options, including "force"
  nlohmann::json                        run_parameters_ = nlohmann::json::object();
  std::vector<std::string>              skipped_{};
  std::vector<UploadPlanEntry>          plan_{};
  std::map<file_name_t, nlohmann::json> completed_{};

  auto                                  IsComplete() const -> bool;
  auto                                  Pending() const -> std::vector<UploadPlanEntry>;
};

/**
 * @brief On-disk shape:
 * {version, directory, fileListSnapshot, runParameters, skipped, plan, completed}
 */
auto CheckpointToJson(const Checkpoint& checkpoint) -> nlohmann::json;

/**
 * @brief Parse a stored checkpoint. Anything malformed fails closed.
 *
 * @param location used in the error message
 * @throws std::runtime_error telling the operator to delete the file
 */
auto CheckpointFromJson(const nlohmann::json& payload, const std::string& location) -> Checkpoint;

/**
 * @brief Reject resuming a checkpoint that was created for a different directory, different
 * parameters or a different file list. Messages name the remediation.
 */
void VerifyResumable(const Checkpoint& stored, const std::string& directory,
                     const nlohmann::json& run_parameters, const std::vector<file_name_t>& files,
                     const std::string& location);
};  // namespace darkroom
