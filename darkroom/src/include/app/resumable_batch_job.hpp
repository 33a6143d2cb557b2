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

#include <atomic>
#include <cstdint>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "checkpoint/checkpoint.hpp"
#include "checkpoint/checkpoint_store.hpp"
#include "concurrency/bounded_runner.hpp"
#include "type/type.hpp"

namespace darkroom {
struct LaneLimits {
  size_t image_ = 3;
  size_t raw_   = 6;
};

/**
 * @brief Everything that must match for a stored checkpoint to be resumed
 */
struct BatchJobIdentity {
  // "album", "transfer", "media"; used in operator-facing messages
  std::string    job_label_{};
  std::string    directory_{};
  // Must carry "force"
  nlohmann::json run_parameters_ = nlohmann::json::object();

  auto           Force() const -> bool { return run_parameters_.value("force", false); }
};

struct BatchProgress {
  uint32_t              total_     = 0;
  uint32_t              resumed_   = 0;
  std::atomic<uint32_t> completed_ = 0;
};

template <typename ItemResult>
struct BatchOutcome {
  // Plan order, previously completed items included
  std::vector<ItemResult>  results_{};
  std::vector<std::string> skipped_{};
  size_t                   resumed_   = 0;
  size_t                   processed_ = 0;
  bool                     from_checkpoint_ = false;
};

/**
 * @brief Plan, checkpoint and run one batch of per-file work.
 *
 * A new run snapshots the directory listing, derives destination keys, rejects key
 * collisions and writes the initial checkpoint before any work starts. A resumed run reuses the
 * stored plan after verifying it belongs to the same directory, parameters and file list.
 *
 * Items on the image lane and on the raw lane run concurrently, each lane bounded by its own
 * limit. Every finished item is journaled before the next one on that worker starts. The
 * checkpoint is removed only after finalize() returns.
 *
 * ItemResult must be convertible to and from nlohmann::json.
 */
template <typename ItemResult>
class ResumableBatchJob {
 public:
  using KeyFn            = std::function<std::string(const file_name_t&)>;
  using LaneFn           = std::function<UploadLane(const file_name_t&)>;
  using ProcessFn        = std::function<ItemResult(const UploadPlanEntry&)>;
  using FinalizeFn       = std::function<void(const BatchOutcome<ItemResult>&)>;
  using ProgressCallback = std::function<void(const BatchProgress&, const UploadPlanEntry&)>;
  using NoteCallback     = std::function<void(const std::string&)>;

  static constexpr size_t kCollisionPreview = 5;

  ProgressCallback        on_progress_{};
  NoteCallback            on_note_{};

  ResumableBatchJob(std::shared_ptr<CheckpointStore> store, BatchJobIdentity identity,
                    LaneLimits limits = {})
      : store_(std::move(store)), identity_(std::move(identity)), limits_(limits) {
    if (!store_) {
      throw std::invalid_argument("[ERROR] ResumableBatchJob: checkpoint store must not be null");
    }
    if (limits_.image_ == 0 || limits_.raw_ == 0) {
      throw std::invalid_argument("[ERROR] ResumableBatchJob: lane limits must be at least 1");
    }
  }

  /**
   * @brief Build the upload plan for a fresh run.
   *
   * Files whose key is already present are skipped unless force is set, in which case they are
   * planned with overwrites_ = true.
   *
   * @throws std::runtime_error if two files map to the same key
   */
  static auto BuildPlan(const std::vector<file_name_t>&        files,
                        const std::unordered_set<std::string>& existing_keys,
                        const KeyFn& derive_key, const LaneFn& lane, bool force)
      -> std::pair<std::vector<UploadPlanEntry>, std::vector<std::string>> {
    std::map<std::string, std::vector<file_name_t>> by_key;
    for (const auto& file : files) {
      by_key[derive_key(file)].push_back(file);
    }

    std::vector<std::string> collisions;
    for (const auto& [key, sources] : by_key) {
      if (sources.size() < 2) continue;
      std::string joined;
      for (const auto& source : sources) {
        if (!joined.empty()) joined += ", ";
        joined += source;
      }
      collisions.push_back(std::format("{} <- {}", key, joined));
    }
    if (!collisions.empty()) {
      std::string listing;
      for (size_t i = 0; i < collisions.size() && i < kCollisionPreview; ++i) {
        listing += "\n  " + collisions[i];
      }
      if (collisions.size() > kCollisionPreview) listing += "\n  …";
      throw std::runtime_error(std::format(
          "[ERROR] ResumableBatchJob: {} destination key collision(s). Rename the files so each "
          "maps to a distinct key:{}",
          collisions.size(), listing));
    }

    std::vector<UploadPlanEntry> plan;
    std::vector<std::string>     skipped;
    for (const auto& file : files) {
      UploadPlanEntry entry;
      entry.source_filename_ = file;
      entry.derived_key_     = derive_key(file);
      entry.lane_            = lane(file);
      const bool exists      = existing_keys.count(entry.derived_key_) > 0;
      if (exists && !force) {
        skipped.push_back(file);
        continue;
      }
      entry.overwrites_ = exists;
      plan.push_back(std::move(entry));
    }
    return {std::move(plan), std::move(skipped)};
  }

  auto Run(const std::vector<file_name_t>& files, const std::unordered_set<std::string>& existing_keys,
           const KeyFn& derive_key, const LaneFn& lane, const ProcessFn& process,
           const FinalizeFn& finalize) -> BatchOutcome<ItemResult> {
    if (files.empty()) {
      throw std::runtime_error(std::format(
          "[ERROR] ResumableBatchJob: No files found in {}. Add the {} files to that directory "
          "(hidden files are ignored) and rerun.",
          identity_.directory_, identity_.job_label_));
    }

    BatchOutcome<ItemResult> outcome;
    Checkpoint               checkpoint;
    if (auto stored = store_->Read(); stored.has_value()) {
      VerifyResumable(*stored, identity_.directory_, identity_.run_parameters_, files,
                      store_->Location());
      checkpoint               = std::move(*stored);
      outcome.from_checkpoint_ = true;
      Note(std::format("Resuming {} from {}: {}/{} files already complete.", identity_.job_label_,
                       store_->Location(), checkpoint.completed_.size(), checkpoint.plan_.size()));
    } else {
      auto [plan, skipped] =
          BuildPlan(files, existing_keys, derive_key, lane, identity_.Force());
      checkpoint.directory_          = identity_.directory_;
      checkpoint.file_list_snapshot_ = files;
      checkpoint.run_parameters_     = identity_.run_parameters_;
      checkpoint.skipped_            = std::move(skipped);
      checkpoint.plan_               = std::move(plan);
      if (!checkpoint.plan_.empty()) {
        store_->Write(checkpoint);
      }
    }
    outcome.skipped_ = checkpoint.skipped_;

    if (checkpoint.plan_.empty()) {
      Note(std::format("Nothing to upload: all {} files already exist. Use --force to overwrite.",
                       checkpoint.skipped_.size()));
      DeleteCheckpointQuietly();
      return outcome;
    }

    outcome.resumed_ = checkpoint.completed_.size();
    std::vector<UploadPlanEntry> image_lane;
    std::vector<UploadPlanEntry> raw_lane;
    for (auto& entry : checkpoint.Pending()) {
      (entry.lane_ == UploadLane::IMAGE ? image_lane : raw_lane).push_back(std::move(entry));
    }

    BatchProgress progress;
    progress.total_   = static_cast<uint32_t>(checkpoint.plan_.size());
    progress.resumed_ = static_cast<uint32_t>(outcome.resumed_);

    CheckpointJournal journal(store_, checkpoint);
    auto              run_lane = [&](const std::vector<UploadPlanEntry>& entries, size_t limit) {
      RunBounded(entries, limit, [&](const UploadPlanEntry& entry) {
        ItemResult     result = process(entry);
        nlohmann::json record = result;
        journal.Record(entry.source_filename_, std::move(record));
        progress.completed_.fetch_add(1);
        if (on_progress_) on_progress_(progress, entry);
        return true;
      });
    };

    auto raw_future =
        std::async(std::launch::async, [&]() { run_lane(raw_lane, limits_.raw_); });
    std::exception_ptr image_error;
    try {
      run_lane(image_lane, limits_.image_);
    } catch (...) {
      image_error = std::current_exception();
    }
    raw_future.wait();
    if (image_error) {
      std::rethrow_exception(image_error);
    }
    raw_future.get();

    const auto finished = journal.Snapshot();
    if (!finished.IsComplete()) {
      throw std::runtime_error(std::format(
          "[ERROR] ResumableBatchJob: checkpoint incomplete ({}/{}). Rerun the same {} command to "
          "continue.",
          finished.completed_.size(), finished.plan_.size(), identity_.job_label_));
    }

    outcome.processed_ = progress.completed_.load();
    outcome.results_.reserve(finished.plan_.size());
    for (const auto& entry : finished.plan_) {
      outcome.results_.push_back(finished.completed_.at(entry.source_filename_).get<ItemResult>());
    }

    if (finalize) {
      finalize(outcome);
    }
    DeleteCheckpointQuietly();
    return outcome;
  }

  auto Identity() const -> const BatchJobIdentity& { return identity_; }

 private:
  void Note(const std::string& message) const {
    if (on_note_) on_note_(message);
  }

  // The work is already durable; a stale checkpoint only costs a no-op resume.
  void DeleteCheckpointQuietly() {
    try {
      store_->Delete();
    } catch (const std::exception& e) {
      std::cerr << "[WARN] ResumableBatchJob: " << e.what() << std::endl;
    }
  }

  std::shared_ptr<CheckpointStore> store_;
  BatchJobIdentity                 identity_;
  LaneLimits                       limits_;
};
};  // namespace darkroom
