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

#include "app/ingest_service.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/fs/atomic_file.hpp"
#include "utils/profiler/profiler.hpp"
#include "utils/string/sanitize.hpp"

namespace darkroom {
namespace {
constexpr const char* kAlbumsRoot    = "albums/";
constexpr const char* kTransfersRoot = "transfers/";

/**
 * @brief Collects per-file warnings from concurrent workers
 */
class WarningSink {
 public:
  void Add(IngestErrorCode code, const file_name_t& source, const std::string& message) {
    std::cerr << "[WARN] IngestService: " << source << ": " << message << std::endl;
    std::lock_guard<std::mutex> lock(mtx_);
    warnings_.push_back({code, source, message});
  }

  auto Take() -> std::vector<IngestWarning> {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::move(warnings_);
  }

 private:
  std::mutex                 mtx_;
  std::vector<IngestWarning> warnings_;
};

auto ResolveDirectory(const file_path_t& directory) -> file_path_t {
  std::error_code ec;
  if (directory.empty() || !std::filesystem::is_directory(directory, ec)) {
    throw std::runtime_error(
        std::format("[ERROR] IngestService: Directory not found: {}. Check the path and pass an "
                    "existing directory.",
                    directory.string()));
  }
  return std::filesystem::absolute(directory, ec).lexically_normal();
}

// Run parameter of a stored checkpoint; a wrong type means the file was tampered with
auto StoredString(const Checkpoint& stored, const char* key, const std::string& location)
    -> std::optional<std::string> {
  if (!stored.run_parameters_.contains(key)) return std::nullopt;
  const auto& value = stored.run_parameters_.at(key);
  if (!value.is_string()) {
    throw std::runtime_error(std::format(
        "[ERROR] IngestService: Invalid checkpoint file: {} (\"{}\" is not a string). Delete it "
        "and retry to start fresh.",
        location, key));
  }
  return value.get<std::string>();
}

void ReportMetadata(const ProcessedImage& processed, const file_name_t& source,
                    WarningSink& warnings) {
  if (processed.metadata_error_.has_value()) {
    warnings.Add(IngestErrorCode::METADATA_UNAVAILABLE, source,
                 std::format("EXIF unreadable, orientation and capture time unknown: {}",
                             *processed.metadata_error_));
  }
}

// Focal detection never fails a photo
auto DetectQuietly(FocalDetector* detector, const cv::Mat& upright, const file_name_t& source,
                   WarningSink& warnings) -> std::optional<FocalPoint> {
  if (detector == nullptr) {
    return std::nullopt;
  }
  try {
    EASY_BLOCK("DetectFocal");
    return detector->DetectImage(upright);
  } catch (const std::exception& e) {
    warnings.Add(IngestErrorCode::FOCAL_DETECTION_FAILED, source,
                 std::format("{} focal detection failed, using center crop: {}",
                             detector->Name(), e.what()));
    return std::nullopt;
  }
}

void ValidateTransferId(const std::string& id) {
  const bool valid = !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
  });
  if (!valid) {
    throw std::invalid_argument(std::format(
        "[ERROR] IngestService: Invalid transfer id \"{}\". Use letters, digits, '-' and '_'.",
        id));
  }
}

template <typename T>
auto OptionalJson(const std::optional<T>& value) -> nlohmann::json {
  return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Records of a previous manifest that this run did not replace
template <typename Record, typename IdOf>
void KeepUnreplaced(const std::optional<nlohmann::json>& previous, const char* field,
                    std::vector<Record>& records, IdOf id_of) {
  if (!previous.has_value() || !previous->contains(field) || !previous->at(field).is_array()) {
    return;
  }
  std::unordered_set<std::string> fresh;
  for (const auto& record : records) fresh.insert(id_of(record));
  for (const auto& item : previous->at(field)) {
    Record old = item.template get<Record>();
    if (fresh.count(id_of(old)) == 0) records.push_back(std::move(old));
  }
}
}  // namespace

auto ParseExpiry(const std::string& text) -> std::chrono::seconds {
  const auto invalid = [&]() {
    return std::invalid_argument(std::format(
        "[ERROR] IngestService: Invalid expiry \"{}\". Use a number followed by d, h or m "
        "(e.g. 30m, 12h, 7d).",
        text));
  };
  const auto too_long = [&]() {
    return std::invalid_argument(std::format(
        "[ERROR] IngestService: Expiry cannot exceed 30 days (got \"{}\"). Pick a shorter "
        "expiry.",
        text));
  };

  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) throw invalid();
  const auto  last    = text.find_last_not_of(" \t\r\n");
  const auto  trimmed = std::string_view(text).substr(first, last - first + 1);
  if (trimmed.size() < 2) throw invalid();

  int64_t unit_seconds = 0;
  switch (std::tolower(static_cast<unsigned char>(trimmed.back()))) {
    case 'd':
      unit_seconds = 24 * 60 * 60;
      break;
    case 'h':
      unit_seconds = 60 * 60;
      break;
    case 'm':
      unit_seconds = 60;
      break;
    default:
      throw invalid();
  }

  const auto digits = trimmed.substr(0, trimmed.size() - 1);
  if (!std::all_of(digits.begin(), digits.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw invalid();
  }
  uint64_t amount = 0;
  auto [ptr, ec]  = std::from_chars(digits.data(), digits.data() + digits.size(), amount);
  if (ec == std::errc::result_out_of_range) throw too_long();
  if (ec != std::errc() || ptr != digits.data() + digits.size()) throw invalid();
  if (amount == 0) {
    throw std::invalid_argument(
        std::format("[ERROR] IngestService: Expiry \"{}\" must be greater than 0", text));
  }
  // Bound before multiplying
  if (amount > static_cast<uint64_t>(kMaxExpirySeconds / unit_seconds)) throw too_long();
  return std::chrono::seconds(static_cast<int64_t>(amount) * unit_seconds);
}

auto FormatDuration(int64_t seconds) -> std::string {
  if (seconds <= 0) return "expired";
  const int64_t days    = seconds / 86400;
  const int64_t hours   = (seconds % 86400) / 3600;
  const int64_t minutes = (seconds % 3600) / 60;

  std::string out;
  const auto  append = [&out](int64_t value, char unit) {
    if (!out.empty()) out.push_back(' ');
    out += std::format("{}{}", value, unit);
  };
  if (days > 0) append(days, 'd');
  if (hours > 0) append(hours, 'h');
  if (minutes > 0 && days == 0) append(minutes, 'm');
  return out.empty() ? "< 1m" : out;
}

auto GenerateTransferId() -> std::string {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
  std::random_device          rd;
  std::array<uint8_t, 8>      bytes{};
  for (auto& b : bytes) b = static_cast<uint8_t>(rd() & 0xFF);

  std::string out;
  uint32_t    buffer = 0;
  int         bits   = 0;
  for (uint8_t b : bytes) {
    buffer = (buffer << 8) | b;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kAlphabet[(buffer >> bits) & 0x3F]);
    }
  }
  if (bits > 0) {
    out.push_back(kAlphabet[(buffer << (6 - bits)) & 0x3F]);
  }
  return out;
}

void ValidateSlug(const std::string& slug, const std::string& what) {
  if (slug.empty() || SanitizeStem(slug) != slug) {
    throw std::invalid_argument(std::format(
        "[ERROR] IngestService: Invalid {} \"{}\". Use lowercase letters, digits and dashes, "
        "e.g. \"{}\".",
        what, slug, SanitizeStem(slug)));
  }
}

IngestService::IngestService(std::shared_ptr<ObjectStore>      objects,
                             std::shared_ptr<ManifestStore>    manifests,
                             std::shared_ptr<VariantGenerator> generator,
                             std::shared_ptr<FocalDetector> detector, IngestConfig config)
    : objects_(std::move(objects)),
      manifests_(std::move(manifests)),
      generator_(std::move(generator)),
      detector_(std::move(detector)),
      config_(std::move(config)) {
  if (!objects_ || !manifests_ || !generator_) {
    throw std::invalid_argument(
        "[ERROR] IngestService: object store, manifest store and generator are required");
  }
}

auto IngestService::AlbumPrefix(const std::string& slug) -> std::string {
  return std::string(kAlbumsRoot) + slug + "/";
}

auto IngestService::TransferPrefix(const std::string& id) -> std::string {
  return std::string(kTransfersRoot) + id + "/";
}

auto IngestService::MediaPrefix(MediaScope scope, const std::string& target) -> std::string {
  return scope == MediaScope::WORD ? std::format("words/{}/media/", target)
                                   : std::format("assets/{}/", target);
}

auto IngestService::MediaManifestKey(MediaScope scope, const std::string& target)
    -> std::string {
  return scope == MediaScope::WORD ? std::format("media/words/{}", target)
                                   : std::format("media/assets/{}", target);
}

void IngestService::Progress(const std::string& message) const {
  if (on_progress_) on_progress_(message);
}

template <typename ItemResult>
void IngestService::AttachProgress(ResumableBatchJob<ItemResult>& job) const {
  job.on_note_     = [this](const std::string& message) { Progress(message); };
  job.on_progress_ = [this](const BatchProgress& progress, const UploadPlanEntry& entry) {
    Progress(std::format("[{}/{}] {} -> {}", progress.resumed_ + progress.completed_.load(),
                         progress.total_, entry.source_filename_, entry.derived_key_));
  };
}

auto IngestService::ListSourceFiles(const file_path_t& directory) const
    -> std::vector<file_name_t> {
  return ListVisibleFiles(directory);
}

auto IngestService::ExistingNames(const std::string& prefix) const
    -> std::unordered_set<std::string> {
  std::unordered_set<std::string> names;
  for (const auto& object : objects_->List(prefix)) {
    const std::string rest = object.key_.substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string::npos) continue;
    names.insert(rest);
  }
  return names;
}

auto IngestService::IngestAlbum(const AlbumRequest& request) -> IngestReport {
  EASY_FUNCTION();
  ValidateSlug(request.slug_, "album slug");
  if (request.title_.empty()) {
    throw std::invalid_argument("[ERROR] IngestService: Album title must not be empty");
  }
  const file_path_t        directory = ResolveDirectory(request.directory_);
  const std::string        prefix    = AlbumPrefix(request.slug_);
  WarningSink              warnings;

  std::vector<file_name_t> files;
  for (auto& file : ListSourceFiles(directory)) {
    if (IsProcessableImage(file)) {
      files.push_back(std::move(file));
    } else {
      warnings.Add(IngestErrorCode::UNSUPPORTED_FORMAT, file,
                   "not a processable image, left out of the album");
    }
  }

  BatchJobIdentity identity;
  identity.job_label_      = "album";
  identity.directory_      = directory.string();
  identity.run_parameters_ = {{"slug", request.slug_},
                              {"title", request.title_},
                              {"date", request.date_},
                              {"description", OptionalJson(request.description_)},
                              {"focal", OptionalJson(request.focal_)},
                              {"force", request.force_}};

  ResumableBatchJob<AlbumPhotoRecord> job(
      checkpoint_factory_(directory, "album", request.slug_), identity, config_.lanes_);
  AttachProgress(job);

  std::unordered_set<std::string> existing;
  for (const auto& name : ExistingNames(prefix + "og/")) {
    existing.insert(std::filesystem::path(name).stem().string());
  }

  IngestReport report;
  report.entity_id_    = request.slug_;
  report.manifest_key_ = std::string(kAlbumsRoot) + request.slug_;

  auto process = [&](const UploadPlanEntry& entry) -> AlbumPhotoRecord {
    EASY_BLOCK("AlbumPhoto");
    const auto        bytes   = ReadFileBytes(directory / entry.source_filename_);
    const std::string ext     = LowerExtension(entry.source_filename_);
    const auto        decoded = generator_->Decode(bytes, ext);

    std::optional<FocalPoint> focal = request.focal_;
    if (!focal.has_value()) {
      focal = DetectQuietly(detector_.get(), decoded.image_, entry.source_filename_, warnings);
    }

    const std::string& id        = entry.derived_key_;
    const auto         processed = generator_->ProcessDecoded(
        decoded, bytes, ext, focal, OverlaySpec{request.title_, id});
    ReportMetadata(processed, entry.source_filename_, warnings);

    // og/ goes last; its presence marks a finished photo
    objects_->Upload(prefix + "original/" + id + processed.original_.extension_,
                     processed.original_.bytes_, processed.original_.content_type_);
    objects_->Upload(prefix + "full/" + id + processed.full_.extension_, processed.full_.bytes_,
                     processed.full_.content_type_);
    objects_->Upload(prefix + "thumb/" + id + processed.thumb_.extension_,
                     processed.thumb_.bytes_, processed.thumb_.content_type_);
    objects_->Upload(prefix + "og/" + id + processed.preview_.extension_,
                     processed.preview_.bytes_, processed.preview_.content_type_);

    AlbumPhotoRecord record;
    record.id_       = id;
    record.source_   = entry.source_filename_;
    record.width_    = processed.width_;
    record.height_   = processed.height_;
    record.taken_at_ = processed.captured_at_;
    record.focal_    = focal;
    return record;
  };

  auto finalize = [&](const BatchOutcome<AlbumPhotoRecord>& outcome) {
    std::vector<AlbumPhotoRecord> photos = outcome.results_;
    KeepUnreplaced(manifests_->Get(report.manifest_key_), "photos", photos,
                   [](const AlbumPhotoRecord& p) { return p.id_; });
    SortForManifest(photos, [](const AlbumPhotoRecord& p) {
      return ManifestSortKey{true, p.taken_at_, p.source_.empty() ? p.id_ : p.source_};
    });

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& photo : photos) {
      nlohmann::json item = photo;
      item.erase("source");
      entries.push_back(std::move(item));
    }
    nlohmann::json manifest = {{"title", request.title_},
                               {"date", request.date_},
                               {"cover", photos.empty() ? nlohmann::json(nullptr)
                                                        : nlohmann::json(photos.front().id_)},
                               {"photos", entries}};
    if (request.description_.has_value()) manifest["description"] = *request.description_;
    manifests_->Put(report.manifest_key_, manifest);
    report.manifest_ = std::move(manifest);
  };

  const auto outcome = job.Run(
      files, existing, [](const file_name_t& file) { return DeriveItemId(file); },
      [](const file_name_t&) { return UploadLane::IMAGE; }, process, finalize);

  report.planned_  = outcome.results_.size();
  report.uploaded_ = outcome.processed_;
  report.resumed_  = outcome.resumed_;
  report.skipped_  = outcome.skipped_;
  report.warnings_ = warnings.Take();
  return report;
}

auto IngestService::IngestTransfer(const TransferRequest& request) -> IngestReport {
  EASY_FUNCTION();
  if (request.title_.empty()) {
    throw std::invalid_argument("[ERROR] IngestService: Transfer title must not be empty");
  }
  if (request.id_.has_value()) ValidateTransferId(*request.id_);
  const std::string expires = request.expires_.value_or(config_.default_expiry_);
  const auto        ttl     = ParseExpiry(expires);

  const file_path_t directory = ResolveDirectory(request.directory_);
  const auto        files     = ListSourceFiles(directory);
  auto store = checkpoint_factory_(directory, "transfer", SanitizeStem(request.title_));

  // A resumed transfer keeps the id and timestamps it was created with
  const auto        stored    = store->Read();
  std::optional<std::string> stored_id;
  std::optional<std::string> stored_expires;
  std::optional<std::string> stored_created_at;
  std::optional<std::string> stored_expires_at;
  if (stored.has_value()) {
    const auto location = store->Location();
    stored_id           = StoredString(*stored, "id", location);
    stored_expires      = StoredString(*stored, "expires", location);
    stored_created_at   = StoredString(*stored, "createdAt", location);
    stored_expires_at   = StoredString(*stored, "expiresAt", location);
  }

  std::string id;
  if (request.id_.has_value()) {
    id = *request.id_;
  } else if (stored_id.has_value()) {
    ValidateTransferId(*stored_id);
    id = *stored_id;
  } else {
    id = GenerateTransferId();
  }

  std::string created_at;
  std::string expires_at;
  if (stored_expires == expires && stored_created_at.has_value()) {
    created_at = *stored_created_at;
    expires_at = stored_expires_at.value_or("");
  } else {
    TimeProvider::Refresh();
    const auto now = TimeProvider::Now();
    created_at     = TimeProvider::ToIsoString(now);
    expires_at     = TimeProvider::ToIsoString(now + ttl);
  }

  BatchJobIdentity identity;
  identity.job_label_      = "transfer";
  identity.directory_      = directory.string();
  identity.run_parameters_ = {{"id", id},
                              {"title", request.title_},
                              {"expires", expires},
                              {"createdAt", created_at},
                              {"expiresAt", expires_at},
                              {"force", request.force_}};

  ResumableBatchJob<TransferFileRecord> job(store, identity, config_.lanes_);
  AttachProgress(job);

  const std::string               prefix = TransferPrefix(id);
  std::unordered_set<std::string> existing;
  for (const auto& name : ExistingNames(prefix + "original/")) {
    existing.insert(DeriveItemId(name));
  }

  WarningSink  warnings;
  IngestReport report;
  report.entity_id_    = id;
  report.manifest_key_ = std::string(kTransfersRoot) + id;

  auto process = [&](const UploadPlanEntry& entry) -> TransferFileRecord {
    EASY_BLOCK("TransferFile");
    const auto&       file  = entry.source_filename_;
    const auto        bytes = ReadFileBytes(directory / file);
    const std::string ext   = LowerExtension(file);
    const std::string& fid  = entry.derived_key_;

    TransferFileRecord record;
    record.id_        = fid;
    record.filename_  = file;
    record.kind_      = GetFileKind(file);
    record.size_      = bytes.size();
    record.mime_type_ = GetMimeType(file);

    if (IsProcessableImage(file)) {
      const auto processed =
          generator_->Process(bytes, ext, std::nullopt, OverlaySpec{request.title_, std::nullopt});
      ReportMetadata(processed, file, warnings);
      objects_->Upload(prefix + "full/" + fid + processed.full_.extension_,
                       processed.full_.bytes_, processed.full_.content_type_);
      objects_->Upload(prefix + "thumb/" + fid + processed.thumb_.extension_,
                       processed.thumb_.bytes_, processed.thumb_.content_type_);
      objects_->Upload(prefix + "og/" + fid + processed.preview_.extension_,
                       processed.preview_.bytes_, processed.preview_.content_type_);
      record.width_    = processed.width_;
      record.height_   = processed.height_;
      record.taken_at_ = processed.captured_at_;
    } else if (record.kind_ == FileKind::GIF) {
      std::optional<ProcessedGif> gif;
      try {
        gif = generator_->ProcessGifThumb(bytes);
      } catch (const std::exception& e) {
        warnings.Add(IngestErrorCode::THUMBNAIL_FAILED, file,
                     std::format("no thumbnail, uploading the GIF only: {}", e.what()));
      }
      if (gif.has_value()) {
        objects_->Upload(prefix + "thumb/" + fid + gif->thumb_.extension_, gif->thumb_.bytes_,
                         gif->thumb_.content_type_);
        record.width_  = gif->width_;
        record.height_ = gif->height_;
      }
    }

    // original/ goes last; its presence marks a finished file
    objects_->Upload(prefix + "original/" + DeriveArchiveFilename(file), bytes,
                     record.mime_type_);
    return record;
  };

  auto finalize = [&](const BatchOutcome<TransferFileRecord>& outcome) {
    std::vector<TransferFileRecord> records = outcome.results_;
    KeepUnreplaced(manifests_->Get(report.manifest_key_), "files", records,
                   [](const TransferFileRecord& r) { return r.id_; });
    SortForManifest(records, [](const TransferFileRecord& r) {
      return ManifestSortKey{IsVisualKind(r.kind_), r.taken_at_, r.filename_};
    });
    nlohmann::json manifest = {{"id", id},
                               {"title", request.title_},
                               {"files", records},
                               {"createdAt", created_at},
                               {"expiresAt", expires_at}};
    manifests_->Put(report.manifest_key_, manifest);
    report.manifest_ = std::move(manifest);
  };

  const auto outcome = job.Run(
      files, existing, [](const file_name_t& file) { return DeriveItemId(file); },
      [](const file_name_t& file) {
        return IsProcessableImage(file) || IsAnimatedImage(file) ? UploadLane::IMAGE
                                                                 : UploadLane::RAW;
      },
      process, finalize);

  report.planned_  = outcome.results_.size();
  report.uploaded_ = outcome.processed_;
  report.resumed_  = outcome.resumed_;
  report.skipped_  = outcome.skipped_;
  report.warnings_ = warnings.Take();
  return report;
}

auto IngestService::IngestMedia(const MediaRequest& request) -> IngestReport {
  EASY_FUNCTION();
  ValidateSlug(request.target_, request.scope_ == MediaScope::WORD ? "word slug" : "asset id");
  const file_path_t directory = ResolveDirectory(request.directory_);
  const std::string prefix    = MediaPrefix(request.scope_, request.target_);
  const std::string scope     = request.scope_ == MediaScope::WORD ? "word" : "asset";

  BatchJobIdentity  identity;
  identity.job_label_      = "media";
  identity.directory_      = directory.string();
  identity.run_parameters_ = {{"scope", scope},
                              {"target", request.target_},
                              {"maxWidth", config_.media_max_width_},
                              {"quality", config_.media_quality_},
                              {"force", request.force_}};

  ResumableBatchJob<MediaFileRecord> job(
      checkpoint_factory_(directory, "media", scope + "-" + request.target_), identity,
      config_.lanes_);
  AttachProgress(job);

  WarningSink  warnings;
  IngestReport report;
  report.entity_id_    = request.target_;
  report.manifest_key_ = MediaManifestKey(request.scope_, request.target_);

  auto process = [&](const UploadPlanEntry& entry) -> MediaFileRecord {
    EASY_BLOCK("MediaFile");
    const auto& file  = entry.source_filename_;
    const auto  bytes = ReadFileBytes(directory / file);

    MediaFileRecord record;
    record.original_  = file;
    record.filename_  = entry.derived_key_;
    record.kind_      = GetFileKind(file);
    record.overwrote_ = entry.overwrites_;
    record.markdown_  = MarkdownSnippet(prefix, entry.derived_key_, record.kind_);

    if (IsProcessableImage(file)) {
      const auto webp = generator_->ProcessToWebP(bytes, LowerExtension(file),
                                                  config_.media_max_width_,
                                                  config_.media_quality_);
      objects_->Upload(prefix + entry.derived_key_, webp.image_.bytes_,
                       webp.image_.content_type_);
      record.size_   = webp.image_.bytes_.size();
      record.width_  = webp.width_;
      record.height_ = webp.height_;
    } else {
      objects_->Upload(prefix + entry.derived_key_, bytes, GetMimeType(file));
      record.size_ = bytes.size();
    }
    return record;
  };

  auto finalize = [&](const BatchOutcome<MediaFileRecord>& outcome) {
    std::vector<MediaFileRecord> records = outcome.results_;
    KeepUnreplaced(manifests_->Get(report.manifest_key_), "files", records,
                   [](const MediaFileRecord& r) { return r.filename_; });
    SortForManifest(records, [](const MediaFileRecord& r) {
      return ManifestSortKey{IsVisualKind(r.kind_), std::nullopt, r.filename_};
    });
    nlohmann::json manifest = {
        {"scope", scope}, {"target", request.target_}, {"prefix", prefix}, {"files", records}};
    manifests_->Put(report.manifest_key_, manifest);
    report.manifest_ = std::move(manifest);
  };

  const auto outcome = job.Run(
      ListSourceFiles(directory), ExistingNames(prefix),
      [](const file_name_t& file) { return DeriveMediaFilename(file); },
      [](const file_name_t& file) {
        return IsProcessableImage(file) ? UploadLane::IMAGE : UploadLane::RAW;
      },
      process, finalize);

  report.planned_  = outcome.results_.size();
  report.uploaded_ = outcome.processed_;
  report.resumed_  = outcome.resumed_;
  report.skipped_  = outcome.skipped_;
  report.warnings_ = warnings.Take();
  return report;
}

auto IngestService::DeletePrefix(const std::string& prefix, const std::string& manifest_key)
    -> size_t {
  std::vector<object_key_t> keys;
  for (auto& object : objects_->List(prefix)) {
    keys.push_back(std::move(object.key_));
  }
  const size_t deleted          = keys.empty() ? 0 : objects_->BatchDelete(keys);
  const bool   manifest_deleted = manifests_->Delete(manifest_key);
  if (deleted == 0 && !manifest_deleted) {
    Progress(std::format("Nothing stored under {}", prefix));
  }
  return deleted;
}

auto IngestService::DeleteAlbum(const std::string& slug) -> size_t {
  ValidateSlug(slug, "album slug");
  return DeletePrefix(AlbumPrefix(slug), std::string(kAlbumsRoot) + slug);
}

auto IngestService::DeleteTransfer(const std::string& id) -> size_t {
  ValidateTransferId(id);
  return DeletePrefix(TransferPrefix(id), std::string(kTransfersRoot) + id);
}

auto IngestService::ListAlbums() -> std::vector<std::string> {
  std::vector<std::string> slugs;
  const std::string        root = kAlbumsRoot;
  for (const auto& prefix : objects_->ListPrefixes(root)) {
    if (prefix.size() <= root.size() + 1) continue;
    slugs.push_back(prefix.substr(root.size(), prefix.size() - root.size() - 1));
  }
  std::sort(slugs.begin(), slugs.end());
  return slugs;
}

auto IngestService::ReadAlbumManifest(const std::string& slug) -> nlohmann::json {
  ValidateSlug(slug, "album slug");
  auto manifest = manifests_->Get(std::string(kAlbumsRoot) + slug);
  if (!manifest.has_value()) {
    throw std::runtime_error(std::format(
        "[ERROR] IngestService: Album \"{}\" not found. Run list-albums to see stored albums.",
        slug));
  }
  return std::move(*manifest);
}

auto IngestService::GetAlbum(const std::string& slug) -> std::optional<AlbumDetails> {
  ValidateSlug(slug, "album slug");
  const auto manifest = manifests_->Get(std::string(kAlbumsRoot) + slug);
  if (!manifest.has_value()) {
    return std::nullopt;
  }
  try {
    AlbumDetails details;
    details.slug_  = slug;
    details.title_ = manifest->value("title", std::string{});
    details.date_  = manifest->value("date", std::string{});
    if (manifest->contains("description") && manifest->at("description").is_string()) {
      details.description_ = manifest->at("description").get<std::string>();
    }
    if (manifest->contains("cover") && manifest->at("cover").is_string()) {
      details.cover_ = manifest->at("cover").get<std::string>();
    }
    details.photos_ =
        manifest->value("photos", nlohmann::json::array()).get<std::vector<AlbumPhotoRecord>>();
    return details;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(
        std::format("[ERROR] IngestService: Corrupt album manifest \"{}\": {}", slug, e.what()));
  }
}

auto IngestService::DeletePhoto(const std::string& slug, const std::string& photo_id)
    -> std::vector<object_key_t> {
  EASY_FUNCTION();
  auto  manifest = ReadAlbumManifest(slug);
  auto& photos   = manifest["photos"];
  const auto it  = std::find_if(photos.begin(), photos.end(), [&](const nlohmann::json& p) {
    return p.value("id", std::string{}) == photo_id;
  });
  if (it == photos.end()) {
    throw std::runtime_error(std::format(
        "[ERROR] IngestService: Photo \"{}\" not found in album \"{}\". Run album-info {} to "
        "see its photos.",
        photo_id, slug, slug));
  }

  const std::string         prefix = AlbumPrefix(slug);
  std::vector<object_key_t> keys;
  for (const char* variant : {"thumb/", "full/", "original/", "og/"}) {
    const std::string dir = prefix + variant;
    for (const auto& name : ExistingNames(dir)) {
      if (std::filesystem::path(name).stem().string() == photo_id) keys.push_back(dir + name);
    }
  }
  Progress(std::format("Deleting {} objects of {}", keys.size(), photo_id));
  if (!keys.empty()) objects_->BatchDelete(keys);

  photos.erase(it);
  if (manifest.value("cover", nlohmann::json(nullptr)) == photo_id) {
    manifest["cover"] = photos.empty() ? nlohmann::json(nullptr) : photos.front().at("id");
    if (!photos.empty()) {
      Progress(std::format("Cover was deleted. New cover: {}",
                           photos.front().at("id").get<std::string>()));
    }
  }
  manifests_->Put(std::string(kAlbumsRoot) + slug, manifest);
  return keys;
}

void IngestService::SetCover(const std::string& slug, const std::string& photo_id) {
  auto        manifest = ReadAlbumManifest(slug);
  const auto& photos   = manifest.value("photos", nlohmann::json::array());
  const bool  found    = std::any_of(photos.begin(), photos.end(), [&](const nlohmann::json& p) {
    return p.value("id", std::string{}) == photo_id;
  });
  if (!found) {
    throw std::runtime_error(std::format(
        "[ERROR] IngestService: Photo \"{}\" not found in album \"{}\". Run album-info {} to "
        "see its photos.",
        photo_id, slug, slug));
  }
  manifest["cover"] = photo_id;
  manifests_->Put(std::string(kAlbumsRoot) + slug, manifest);
}

auto IngestService::ReadTransfer(const std::string& key) -> std::optional<TransferDetails> {
  const auto manifest = manifests_->Get(key);
  if (!manifest.has_value()) {
    return std::nullopt;
  }
  TransferDetails details;
  try {
    auto& summary       = details.summary_;
    summary.id_ = manifest->value("id", key.substr(std::string_view(kTransfersRoot).size()));
    summary.title_      = manifest->value("title", std::string{});
    summary.created_at_ = manifest->value("createdAt", std::string{});
    summary.expires_at_ = manifest->value("expiresAt", std::string{});
    details.files_ =
        manifest->value("files", nlohmann::json::array()).get<std::vector<TransferFileRecord>>();
    summary.file_count_ = details.files_.size();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(
        std::format("[ERROR] IngestService: Corrupt transfer manifest \"{}\": {}", key, e.what()));
  }

  // An unreadable expiry counts as expired
  const auto expires_at = TimeProvider::FromIsoString(details.summary_.expires_at_);
  if (expires_at.has_value()) {
    details.summary_.remaining_seconds_ =
        std::chrono::duration_cast<std::chrono::seconds>(*expires_at - TimeProvider::Now())
            .count();
  }
  return details;
}

auto IngestService::ListTransfers() -> std::vector<TransferSummary> {
  TimeProvider::Refresh();
  std::vector<TransferSummary> active;
  for (const auto& key : manifests_->List(kTransfersRoot)) {
    auto details = ReadTransfer(key);
    if (details.has_value() && details->summary_.remaining_seconds_ > 0) {
      active.push_back(std::move(details->summary_));
    }
  }
  std::sort(active.begin(), active.end(), [](const TransferSummary& a, const TransferSummary& b) {
    return a.created_at_ != b.created_at_ ? a.created_at_ > b.created_at_ : a.id_ < b.id_;
  });
  return active;
}

auto IngestService::GetTransfer(const std::string& id) -> std::optional<TransferDetails> {
  ValidateTransferId(id);
  TimeProvider::Refresh();
  return ReadTransfer(std::string(kTransfersRoot) + id);
}

auto IngestService::DeleteAllTransfers() -> PurgeReport {
  EASY_FUNCTION();
  PurgeReport               report;
  std::vector<object_key_t> keys;
  for (auto& object : objects_->List(kTransfersRoot)) {
    keys.push_back(std::move(object.key_));
  }
  if (keys.empty()) {
    Progress(std::format("No objects found under {}", kTransfersRoot));
  } else {
    Progress(std::format("Deleting {} objects under {}", keys.size(), kTransfersRoot));
    report.objects_ = objects_->BatchDelete(keys);
  }
  for (const auto& key : manifests_->List(kTransfersRoot)) {
    if (manifests_->Delete(key)) ++report.manifests_;
  }
  return report;
}

auto IngestService::ListMedia(MediaScope scope, const std::string& target)
    -> std::vector<ObjectInfo> {
  ValidateSlug(target, scope == MediaScope::WORD ? "word slug" : "asset id");
  auto objects = objects_->List(MediaPrefix(scope, target));
  std::sort(objects.begin(), objects.end(),
            [](const ObjectInfo& a, const ObjectInfo& b) { return a.key_ < b.key_; });
  return objects;
}

void IngestService::DeleteMedia(MediaScope scope, const std::string& target,
                                const std::string& filename) {
  ValidateSlug(target, scope == MediaScope::WORD ? "word slug" : "asset id");
  if (filename.empty() || filename.find('/') != std::string::npos || filename.front() == '.') {
    throw std::invalid_argument(
        std::format("[ERROR] IngestService: Invalid media filename \"{}\"", filename));
  }
  const std::string prefix = MediaPrefix(scope, target);
  if (objects_->BatchDelete({prefix + filename}) == 0) {
    throw std::runtime_error(std::format(
        "[ERROR] IngestService: {}{} not found. Run list-media to see stored files.", prefix,
        filename));
  }

  const std::string manifest_key = MediaManifestKey(scope, target);
  auto              manifest     = manifests_->Get(manifest_key);
  if (!manifest.has_value() || !manifest->contains("files") || !manifest->at("files").is_array()) {
    return;
  }
  nlohmann::json files = nlohmann::json::array();
  for (const auto& file : manifest->at("files")) {
    if (file.value("filename", std::string{}) != filename) files.push_back(file);
  }
  (*manifest)["files"] = files;
  if (files.empty()) {
    manifests_->Delete(manifest_key);
  } else {
    manifests_->Put(manifest_key, *manifest);
  }
}

auto IngestService::DeleteAllMedia(MediaScope scope, const std::string& target) -> size_t {
  ValidateSlug(target, scope == MediaScope::WORD ? "word slug" : "asset id");
  return DeletePrefix(MediaPrefix(scope, target), MediaManifestKey(scope, target));
}
};  // namespace darkroom
