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

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "app/ingest_records.hpp"
#include "app/resumable_batch_job.hpp"
#include "checkpoint/checkpoint_store.hpp"
#include "config/ingest_config.hpp"
#include "focal/focal_detector.hpp"
#include "pipeline/variant_generator.hpp"
#include "storage/manifest_store.hpp"
#include "storage/object_store.hpp"
#include "type/type.hpp"

namespace darkroom {
struct AlbumRequest {
  file_path_t                directory_{};
  std::string                slug_{};
  std::string                title_{};
  std::string                date_{};
  std::optional<std::string> description_{};
  // Applied to every photo; detection is used when absent
  std::optional<FocalPoint>  focal_{};
  bool                       force_ = false;
};

struct TransferRequest {
  file_path_t                directory_{};
  std::string                title_{};
  // Generated when absent
  std::optional<std::string> id_{};
  // "<n>d", "<n>h" or "<n>m"; the configured default when absent
  std::optional<std::string> expires_{};
  bool                       force_ = false;
};

enum class MediaScope : uint8_t { WORD = 0, ASSET };

struct MediaRequest {
  file_path_t directory_{};
  MediaScope  scope_ = MediaScope::WORD;
  // Word slug or asset id
  std::string target_{};
  bool        force_ = false;
};

struct IngestReport {
  // Album slug, transfer id or media target
  std::string                   entity_id_{};
  std::string                   manifest_key_{};
  size_t                        planned_  = 0;
  size_t                        uploaded_ = 0;
  size_t                        resumed_  = 0;
  std::vector<std::string>      skipped_{};
  std::vector<IngestWarning>    warnings_{};
  // Absent when nothing was uploaded
  std::optional<nlohmann::json> manifest_{};
};

struct AlbumDetails {
  std::string                   slug_{};
  std::string                   title_{};
  std::string                   date_{};
  std::optional<std::string>    description_{};
  std::optional<std::string>    cover_{};
  std::vector<AlbumPhotoRecord> photos_{};
};

struct TransferSummary {
  std::string id_{};
  std::string title_{};
  size_t      file_count_ = 0;
  std::string created_at_{};
  std::string expires_at_{};
  // Zero or negative once expired
  int64_t     remaining_seconds_ = 0;
};

struct TransferDetails {
  TransferSummary                 summary_{};
  std::vector<TransferFileRecord> files_{};
};

struct PurgeReport {
  size_t objects_   = 0;
  size_t manifests_ = 0;
};

// Transfers live at most 30 days
constexpr int64_t kMaxExpirySeconds = 30LL * 24 * 60 * 60;

/**
 * @brief Parse "<n>d" / "<n>h" / "<n>m". Surrounding whitespace and an uppercase unit are
 * accepted.
 *
 * @throws std::invalid_argument on anything else, zero, or more than 30 days
 */
auto ParseExpiry(const std::string& text) -> std::chrono::seconds;

/**
 * @brief "2d 5h", "3h 12m", "< 1m", or "expired" for non-positive input. Minutes are dropped
 * once the duration reaches a day.
 */
auto FormatDuration(int64_t seconds) -> std::string;

/**
 * @brief 8 random bytes, base64url without padding (11 chars)
 */
auto GenerateTransferId() -> std::string;

/**
 * @brief Reject slugs that would not survive SanitizeStem unchanged
 */
void ValidateSlug(const std::string& slug, const std::string& what);

class IngestService {
 public:
  // Invoked from worker threads
  using ProgressCallback       = std::function<void(const std::string&)>;
  using CheckpointStoreFactory = std::function<std::shared_ptr<CheckpointStore>(
      const file_path_t& directory, const std::string& job, const std::string& identity)>;

  ProgressCallback       on_progress_{};
  CheckpointStoreFactory checkpoint_factory_ = [](const file_path_t& directory,
                                                  const std::string& job,
                                                  const std::string& identity) {
    return std::static_pointer_cast<CheckpointStore>(
        FileCheckpointStore::ForJob(directory, job, identity));
  };

  /**
   * @param detector may be null, which disables automatic focal detection
   */
  IngestService(std::shared_ptr<ObjectStore> objects, std::shared_ptr<ManifestStore> manifests,
                std::shared_ptr<VariantGenerator> generator,
                std::shared_ptr<FocalDetector> detector, IngestConfig config = {});

  auto IngestAlbum(const AlbumRequest& request) -> IngestReport;
  auto IngestTransfer(const TransferRequest& request) -> IngestReport;
  auto IngestMedia(const MediaRequest& request) -> IngestReport;

  /**
   * @brief Remove every object under the album prefix and its manifest
   *
   * @return number of objects deleted
   */
  auto DeleteAlbum(const std::string& slug) -> size_t;
  auto DeleteTransfer(const std::string& id) -> size_t;

  /**
   * @brief Album slugs present in the object store, sorted
   */
  auto ListAlbums() -> std::vector<std::string>;

  /**
   * @return nullopt when the album has no manifest
   */
  auto GetAlbum(const std::string& slug) -> std::optional<AlbumDetails>;

  /**
   * @brief Remove one photo's variants and its manifest entry. A deleted cover passes to the
   * first remaining photo.
   *
   * @return the object keys that were deleted
   */
  auto DeletePhoto(const std::string& slug, const std::string& photo_id)
      -> std::vector<object_key_t>;
  void SetCover(const std::string& slug, const std::string& photo_id);

  /**
   * @brief Unexpired transfers, newest first
   */
  auto ListTransfers() -> std::vector<TransferSummary>;
  auto GetTransfer(const std::string& id) -> std::optional<TransferDetails>;

  /**
   * @brief Remove every object under transfers/ and every transfer manifest
   */
  auto DeleteAllTransfers() -> PurgeReport;

  /**
   * @brief Objects stored for a word or asset, sorted by filename
   */
  auto ListMedia(MediaScope scope, const std::string& target) -> std::vector<ObjectInfo>;
  void DeleteMedia(MediaScope scope, const std::string& target, const std::string& filename);
  auto DeleteAllMedia(MediaScope scope, const std::string& target) -> size_t;

  static auto AlbumPrefix(const std::string& slug) -> std::string;
  static auto TransferPrefix(const std::string& id) -> std::string;
  static auto MediaPrefix(MediaScope scope, const std::string& target) -> std::string;
  static auto MediaManifestKey(MediaScope scope, const std::string& target) -> std::string;

 private:
  auto ListSourceFiles(const file_path_t& directory) const -> std::vector<file_name_t>;
  // Names of the objects directly under prefix
  auto ExistingNames(const std::string& prefix) const -> std::unordered_set<std::string>;
  auto DeletePrefix(const std::string& prefix, const std::string& manifest_key) -> size_t;
  auto ReadAlbumManifest(const std::string& slug) -> nlohmann::json;
  auto ReadTransfer(const std::string& key) -> std::optional<TransferDetails>;
  void Progress(const std::string& message) const;

  template <typename ItemResult>
  void AttachProgress(ResumableBatchJob<ItemResult>& job) const;

  std::shared_ptr<ObjectStore>      objects_;
  std::shared_ptr<ManifestStore>    manifests_;
  std::shared_ptr<VariantGenerator> generator_;
  std::shared_ptr<FocalDetector>    detector_;
  IngestConfig                      config_;
};
};  // namespace darkroom
