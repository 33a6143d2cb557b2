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

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "checkpoint/checkpoint.hpp"
#include "type/type.hpp"

namespace darkroom {
class CheckpointStore {
 public:
  virtual ~CheckpointStore()                        = default;

  /**
   * @brief Load the stored checkpoint, if any. Throws on a corrupt file.
   */
  virtual auto Read() -> std::optional<Checkpoint>  = 0;
  virtual void Write(const Checkpoint& checkpoint)  = 0;
  virtual void Delete()                             = 0;
  virtual auto Location() const -> std::string      = 0;
};

/**
 * @brief A hidden JSON file next to the source files, replaced atomically on every write.
 */
class FileCheckpointStore final : public CheckpointStore {
 public:
  explicit FileCheckpointStore(file_path_t path);

  /**
   * @brief Store at <directory>/.darkroom-<job>.<identity>.checkpoint.json
   */
  static auto ForJob(const file_path_t& directory, const std::string& job,
                     const std::string& identity) -> std::shared_ptr<FileCheckpointStore>;
  static auto CheckpointFilename(const std::string& job, const std::string& identity)
      -> file_name_t;

  auto        Read() -> std::optional<Checkpoint> override;
  void        Write(const Checkpoint& checkpoint) override;
  void        Delete() override;
  auto        Location() const -> std::string override;

 private:
  file_path_t path_;
};

/**
 * @brief Serializes completion records of concurrent workers. Each Record() rewrites the whole
 * checkpoint before returning, so a crash loses at most in-flight items.
 */
class CheckpointJournal {
 public:
  CheckpointJournal(std::shared_ptr<CheckpointStore> store, Checkpoint checkpoint);

  void Record(const file_name_t& source_filename, nlohmann::json result);
  auto Snapshot() const -> Checkpoint;
  auto CompletedCount() const -> size_t;

 private:
  mutable std::mutex               mtx_;
  std::shared_ptr<CheckpointStore> store_;
  Checkpoint                       checkpoint_;
};
};  // namespace darkroom
