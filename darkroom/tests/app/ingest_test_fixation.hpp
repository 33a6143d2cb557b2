#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/ingest_service.hpp"
#include "image/image_test_fixation.hpp"
#include "storage/local_object_store.hpp"
#include "utils/fs/atomic_file.hpp"
#include "utils/utils_test_fixation.hpp"

namespace darkroom {
/**
 * @brief LocalObjectStore that records uploads and can fail the n-th upload whose key contains
 * a marker
 */
class FaultyObjectStore final : public ObjectStore {
 public:
  explicit FaultyObjectStore(file_path_t root) : inner_(std::move(root)) {}

  void FailOn(std::string marker, int nth) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_marker_ = std::move(marker);
    fail_nth_    = nth;
    seen_        = 0;
  }

  void Heal() { FailOn("", 0); }

  void Upload(const object_key_t& key, const byte_buffer_t& bytes,
              const std::string& content_type) override {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!fail_marker_.empty() && key.find(fail_marker_) != std::string::npos &&
          ++seen_ == fail_nth_) {
        throw std::runtime_error("[ERROR] FaultyObjectStore: injected failure for " + key);
      }
    }
    inner_.Upload(key, bytes, content_type);
    uploads_.fetch_add(1);
  }

  auto BatchDelete(const std::vector<object_key_t>& keys) -> size_t override {
    return inner_.BatchDelete(keys);
  }
  auto List(const std::string& prefix) -> std::vector<ObjectInfo> override {
    return inner_.List(prefix);
  }
  auto Head(const object_key_t& key) -> ObjectHead override { return inner_.Head(key); }
  auto ListPrefixes(const std::string& prefix) -> std::vector<std::string> override {
    return inner_.ListPrefixes(prefix);
  }

  auto Uploads() const -> int { return uploads_.load(); }
  auto Exists(const object_key_t& key) -> bool { return inner_.Head(key).exists_; }

 private:
  LocalObjectStore inner_;
  std::mutex       mtx_;
  std::string      fail_marker_;
  int              fail_nth_ = 0;
  int              seen_     = 0;
  std::atomic<int> uploads_{0};
};

class FixedFocalDetector final : public FocalDetector {
 public:
  explicit FixedFocalDetector(std::optional<FocalPoint> point, bool fail = false)
      : point_(point), fail_(fail) {}

  auto Name() const -> std::string override { return "fixed"; }
  auto DetectImage(const cv::Mat&) -> std::optional<FocalPoint> override {
    if (fail_) throw std::runtime_error("model exploded");
    return point_;
  }

 private:
  std::optional<FocalPoint> point_;
  bool                      fail_;
};

class IngestServiceTests : public TempDirTests {
 protected:
  std::filesystem::path              source_;
  std::shared_ptr<FaultyObjectStore> objects_;
  std::shared_ptr<JsonManifestStore> manifests_;
  std::shared_ptr<VariantGenerator>  generator_;
  std::vector<std::string>           progress_;
  std::mutex                         progress_mtx_;

  void                               SetUp() override {
    TempDirTests::SetUp();
    source_    = dir_ / "source";
    std::filesystem::create_directories(source_);
    objects_   = std::make_shared<FaultyObjectStore>(dir_ / "bucket");
    manifests_ = std::make_shared<JsonManifestStore>(dir_ / "manifests");

    VariantSettings settings;
    settings.thumb_width_    = 40;
    settings.full_width_     = 80;
    settings.preview_width_  = 120;
    settings.preview_height_ = 63;
    generator_               = std::make_shared<VariantGenerator>(settings);
  }

  auto MakeService(std::shared_ptr<FocalDetector> detector = nullptr) -> IngestService {
    IngestConfig config;
    // One worker per lane keeps failure injection deterministic
    config.lanes_ = {1, 1};
    IngestService service(objects_, manifests_, generator_, std::move(detector), config);
    service.on_progress_ = [this](const std::string& message) {
      std::lock_guard<std::mutex> lock(progress_mtx_);
      progress_.push_back(message);
    };
    return service;
  }

  void AddImage(const std::string& name, int width = 96, int height = 64) {
    const std::string ext = std::filesystem::path(name).extension().string();
    std::string       lowered;
    for (char c : ext) lowered.push_back(static_cast<char>(std::tolower(c)));
    const auto bytes = EncodeAs(MakeGradient(width, height), lowered == ".jpeg" ? ".jpg" : lowered);
    WriteFileAtomic(source_ / name, bytes.data(), bytes.size());
  }

  void AddFile(const std::string& name, const std::string& content = "payload") {
    WriteFileAtomic(source_ / name, content);
  }

  auto CheckpointFiles() const -> std::vector<std::string> {
    std::vector<std::string> found;
    for (const auto& entry : std::filesystem::directory_iterator(source_)) {
      const auto name = entry.path().filename().string();
      if (name.find(".checkpoint.json") != std::string::npos) found.push_back(name);
    }
    return found;
  }
};
}  // namespace darkroom
