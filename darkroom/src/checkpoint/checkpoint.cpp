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

#include "checkpoint/checkpoint.hpp"

#include <format>
#include <stdexcept>

namespace darkroom {
namespace {
auto InvalidCheckpoint(const std::string& location, const std::string& detail)
    -> std::runtime_error {
  return std::runtime_error(
      std::format("[ERROR] Checkpoint: Invalid checkpoint file: {} ({}). Delete it and retry to "
                  "start fresh.",
                  location, detail));
}

auto RequireField(const nlohmann::json& payload, const char* key, nlohmann::json::value_t type,
                  const std::string& location) -> const nlohmann::json& {
  if (!payload.contains(key)) {
    throw InvalidCheckpoint(location, std::format("missing \"{}\"", key));
  }
  const auto& field = payload.at(key);
  if (field.type() != type) {
    throw InvalidCheckpoint(location, std::format("\"{}\" has the wrong type", key));
  }
  return field;
}

auto StringArray(const nlohmann::json& array, const char* key, const std::string& location)
    -> std::vector<std::string> {
  std::vector<std::string> values;
  values.reserve(array.size());
  for (const auto& item : array) {
    if (!item.is_string()) {
      throw InvalidCheckpoint(location, std::format("\"{}\" must contain strings", key));
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}
}  // namespace

auto UploadLaneToString(UploadLane lane) -> std::string {
  return lane == UploadLane::IMAGE ? "image" : "raw";
}

auto UploadLaneFromString(const std::string& lane) -> UploadLane {
  if (lane == "image") return UploadLane::IMAGE;
  if (lane == "raw") return UploadLane::RAW;
  throw std::invalid_argument(std::format("[ERROR] Checkpoint: Unknown lane \"{}\"", lane));
}

auto Checkpoint::IsComplete() const -> bool {
  for (const auto& entry : plan_) {
    if (completed_.count(entry.source_filename_) == 0) return false;
  }
  return true;
}

auto Checkpoint::Pending() const -> std::vector<UploadPlanEntry> {
  std::vector<UploadPlanEntry> pending;
  for (const auto& entry : plan_) {
    if (completed_.count(entry.source_filename_) == 0) pending.push_back(entry);
  }
  return pending;
}

auto CheckpointToJson(const Checkpoint& checkpoint) -> nlohmann::json {
  nlohmann::json plan = nlohmann::json::array();
  for (const auto& entry : checkpoint.plan_) {
    plan.push_back({{"file", entry.source_filename_},
                    {"key", entry.derived_key_},
                    {"overwrites", entry.overwrites_},
                    {"lane", UploadLaneToString(entry.lane_)}});
  }
  nlohmann::json completed = nlohmann::json::object();
  for (const auto& [file, result] : checkpoint.completed_) {
    completed[file] = result;
  }
  return {{"version", checkpoint.version_},
          {"directory", checkpoint.directory_},
          {"fileListSnapshot", checkpoint.file_list_snapshot_},
          {"runParameters", checkpoint.run_parameters_},
          {"skipped", checkpoint.skipped_},
          {"plan", plan},
          {"completed", completed}};
}

auto CheckpointFromJson(const nlohmann::json& payload, const std::string& location)
    -> Checkpoint {
  using value_t = nlohmann::json::value_t;
  if (!payload.is_object()) {
    throw InvalidCheckpoint(location, "not a JSON object");
  }
  const auto& version = payload.contains("version") ? payload.at("version") : nlohmann::json();
  if (!version.is_number_integer() || version.get<int>() != Checkpoint::kVersion) {
    throw InvalidCheckpoint(location, "unsupported version");
  }

  Checkpoint checkpoint;
  checkpoint.version_   = Checkpoint::kVersion;
  checkpoint.directory_ = RequireField(payload, "directory", value_t::string, location).get<std::string>();
  checkpoint.file_list_snapshot_ = StringArray(
      RequireField(payload, "fileListSnapshot", value_t::array, location), "fileListSnapshot",
      location);
  checkpoint.run_parameters_ = RequireField(payload, "runParameters", value_t::object, location);
  checkpoint.skipped_ =
      StringArray(RequireField(payload, "skipped", value_t::array, location), "skipped", location);

  for (const auto& item : RequireField(payload, "plan", value_t::array, location)) {
    if (!item.is_object() || !item.contains("file") || !item.contains("key") ||
        !item.contains("lane") || !item.at("file").is_string() || !item.at("key").is_string() ||
        !item.at("lane").is_string()) {
      throw InvalidCheckpoint(location, "malformed plan entry");
    }
    UploadPlanEntry entry;
    entry.source_filename_ = item.at("file").get<std::string>();
    entry.derived_key_     = item.at("key").get<std::string>();
    entry.overwrites_      = item.value("overwrites", false);
    try {
      entry.lane_ = UploadLaneFromString(item.at("lane").get<std::string>());
    } catch (const std::invalid_argument&) {
      throw InvalidCheckpoint(location, "unknown lane in plan");
    }
    checkpoint.plan_.push_back(std::move(entry));
  }

  const auto& completed = RequireField(payload, "completed", value_t::object, location);
  for (auto it = completed.begin(); it != completed.end(); ++it) {
    checkpoint.completed_[it.key()] = it.value();
  }
  return checkpoint;
}

void VerifyResumable(const Checkpoint& stored, const std::string& directory,
                     const nlohmann::json& run_parameters, const std::vector<file_name_t>& files,
                     const std::string& location) {
  if (stored.directory_ != directory) {
    throw std::runtime_error(std::format(
        "[ERROR] Checkpoint: Checkpoint directory mismatch at {} (created for {}). Delete it and "
        "retry.",
        location, stored.directory_));
  }
  const auto stored_force  = stored.run_parameters_.value("force", false);
  const auto current_force = run_parameters.value("force", false);
  if (stored_force != current_force) {
    throw std::runtime_error(std::format(
        "[ERROR] Checkpoint: Checkpoint force flag mismatch at {}. Rerun with the same --force "
        "setting or delete the checkpoint.",
        location));
  }
  if (stored.run_parameters_ != run_parameters) {
    throw std::runtime_error(std::format(
        "[ERROR] Checkpoint: Run parameters differ from the checkpoint at {} (stored: {}, "
        "current: {}). Rerun with the original arguments or delete the checkpoint.",
        location, stored.run_parameters_.dump(), run_parameters.dump()));
  }
  if (stored.file_list_snapshot_ != files) {
    throw std::runtime_error(std::format(
        "[ERROR] Checkpoint: Source files changed since the checkpoint was created ({}). Restore "
        "the original files or delete the checkpoint file to start a new upload.",
        location));
  }
}
};  // namespace darkroom
