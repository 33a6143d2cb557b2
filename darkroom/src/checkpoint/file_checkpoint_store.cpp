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

#include <filesystem>
#include <format>
#include <stdexcept>
#include <system_error>

#include "checkpoint/checkpoint_store.hpp"
#include "utils/fs/atomic_file.hpp"

namespace darkroom {
FileCheckpointStore::FileCheckpointStore(file_path_t path) : path_(std::move(path)) {}

auto FileCheckpointStore::CheckpointFilename(const std::string& job, const std::string& identity)
    -> file_name_t {
  return std::format(".darkroom-{}.{}.checkpoint.json", job, identity);
}

auto FileCheckpointStore::ForJob(const file_path_t& directory, const std::string& job,
                                 const std::string& identity)
    -> std::shared_ptr<FileCheckpointStore> {
  return std::make_shared<FileCheckpointStore>(directory / CheckpointFilename(job, identity));
}

auto FileCheckpointStore::Read() -> std::optional<Checkpoint> {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return std::nullopt;
  }
  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(ReadFileText(path_));
  } catch (const nlohmann::json::parse_error&) {
    throw std::runtime_error(std::format(
        "[ERROR] Checkpoint: Invalid checkpoint file: {}. Delete it and retry to start fresh.",
        path_.string()));
  }
  return CheckpointFromJson(payload, path_.string());
}

void FileCheckpointStore::Write(const Checkpoint& checkpoint) {
  WriteFileAtomic(path_, CheckpointToJson(checkpoint).dump(2) + "\n");
}

void FileCheckpointStore::Delete() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    throw std::runtime_error(std::format("[ERROR] Checkpoint: Cannot delete {}: {}",
                                         path_.string(), ec.message()));
  }
}

auto FileCheckpointStore::Location() const -> std::string { return path_.string(); }

CheckpointJournal::CheckpointJournal(std::shared_ptr<CheckpointStore> store,
                                     Checkpoint                       checkpoint)
    : store_(std::move(store)), checkpoint_(std::move(checkpoint)) {
  if (!store_) {
    throw std::invalid_argument("[ERROR] CheckpointJournal: store must not be null");
  }
}

void CheckpointJournal::Record(const file_name_t& source_filename, nlohmann::json result) {
  std::lock_guard<std::mutex> lock(mtx_);
  const bool                  fresh = checkpoint_.completed_.count(source_filename) == 0;
  checkpoint_.completed_[source_filename] = std::move(result);
  try {
    store_->Write(checkpoint_);
  } catch (const std::exception&) {
    // Keep memory in step with what is durable
    if (fresh) checkpoint_.completed_.erase(source_filename);
    throw;
  }
}

auto CheckpointJournal::Snapshot() const -> Checkpoint {
  std::lock_guard<std::mutex> lock(mtx_);
  return checkpoint_;
}

auto CheckpointJournal::CompletedCount() const -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return checkpoint_.completed_.size();
}
};  // namespace darkroom
