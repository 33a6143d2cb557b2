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

#include "cli/cli_app.hpp"

#include <format>
#include <memory>
#include <mutex>
#include <utility>
#include <stdexcept>

#include "app/ingest_service.hpp"
#include "config/ingest_config.hpp"
#include "focal/focal_detector.hpp"
#include "focal/focal_presets.hpp"
#include "overlay/overlay_compositor.hpp"
#include "pipeline/variant_generator.hpp"
#include "storage/local_object_store.hpp"
#include "storage/manifest_store.hpp"
#include "type/supported_file_type.hpp"
#include "utils/fs/atomic_file.hpp"

namespace darkroom {
namespace {
auto FormatFocal(const std::optional<FocalPoint>& focal) -> std::string {
  return focal.has_value() ? std::format("{},{}", focal->x_, focal->y_) : "none";
}

auto RequireFocal(const std::optional<std::string>& text) -> std::optional<FocalPoint> {
  if (!text.has_value()) return std::nullopt;
  auto focal = ParseFocal(*text);
  if (!focal.has_value()) {
    std::string presets;
    for (const auto& name : FocalPresetNames()) {
      if (!presets.empty()) presets += ", ";
      presets += name;
    }
    throw std::invalid_argument(std::format(
        "[ERROR] CLI: Unknown focal \"{}\". Use one of: {}, or \"x,y\" percentages.", *text,
        presets));
  }
  return focal;
}

auto MakeGenerator(const IngestConfig& config) -> std::shared_ptr<VariantGenerator> {
  return std::make_shared<VariantGenerator>(config.variants_,
                                            std::make_shared<OverlayCompositor>(config.brand_));
}

// null when the strategy is "none"
auto MakeDetector(const IngestConfig& config, const CliOptions& options)
    -> std::shared_ptr<FocalDetector> {
  const std::string strategy = options.strategy_.value_or(config.focal_strategy_);
  if (strategy == "none") {
    return nullptr;
  }
  return FocalDetectorRegistry::Instance().Create(strategy, config.DetectorParams());
}

auto MakeService(const IngestConfig& config, std::shared_ptr<FocalDetector> detector,
                 std::ostream& out) -> std::unique_ptr<IngestService> {
  auto service = std::make_unique<IngestService>(
      std::make_shared<LocalObjectStore>(config.store_root_),
      std::make_shared<JsonManifestStore>(config.manifest_root_), MakeGenerator(config),
      std::move(detector), config);
  auto out_mtx         = std::make_shared<std::mutex>();
  service->on_progress_ = [&out, out_mtx](const std::string& message) {
    std::lock_guard<std::mutex> lock(*out_mtx);
    out << message << std::endl;
  };
  return service;
}

auto MediaTarget(const CliOptions& options) -> std::pair<MediaScope, std::string> {
  if (options.asset_.has_value()) return {MediaScope::ASSET, *options.asset_};
  return {MediaScope::WORD, options.positionals_.front()};
}

void PrintAlbum(const AlbumDetails& album, std::ostream& out) {
  out << std::format("{}: {} ({})", album.slug_, album.title_, album.date_) << std::endl;
  if (album.description_.has_value()) out << "  " << *album.description_ << std::endl;
  out << "cover: " << album.cover_.value_or("none") << std::endl;
  out << std::format("photos: {}", album.photos_.size()) << std::endl;
  for (const auto& photo : album.photos_) {
    out << std::format("  {:<24} {}x{}  {}  focal {}", photo.id_, photo.width_, photo.height_,
                       photo.taken_at_.value_or("undated"), FormatFocal(photo.focal_))
        << std::endl;
  }
}

void PrintTransfer(const TransferDetails& transfer, std::ostream& out) {
  const auto& summary = transfer.summary_;
  out << std::format("{}: {}", summary.id_, summary.title_) << std::endl;
  out << "created: " << summary.created_at_ << std::endl;
  out << std::format("expires: {} ({})", summary.expires_at_,
                     FormatDuration(summary.remaining_seconds_))
      << std::endl;
  uint64_t total = 0;
  for (const auto& file : transfer.files_) total += file.size_;
  out << std::format("files: {} ({})", transfer.files_.size(), FormatBytes(total)) << std::endl;
  for (const auto& file : transfer.files_) {
    out << std::format("  {:<32} {:<6} {}", file.filename_, FileKindToString(file.kind_),
                       FormatBytes(file.size_))
        << std::endl;
  }
}

void PrintReport(const IngestReport& report, std::ostream& out) {
  out << std::format("{}: {} uploaded, {} resumed, {} skipped", report.entity_id_,
                     report.uploaded_, report.resumed_, report.skipped_.size())
      << std::endl;
  for (const auto& file : report.skipped_) {
    out << "  skipped (exists): " << file << std::endl;
  }
  for (const auto& warning : report.warnings_) {
    out << std::format("  warning [{}] {}: {}", IngestErrorCodeToString(warning.code_),
                       warning.source_, warning.message_)
        << std::endl;
  }
  if (report.manifest_.has_value()) {
    out << "manifest: " << report.manifest_key_ << std::endl;
  }
}
}  // namespace

auto RunCli(const CliOptions& options, std::ostream& out) -> int {
  if (options.command_ == CliCommand::HELP) {
    out << CliUsage();
    return 0;
  }

  RegisterBuiltinFocalDetectors();
  const IngestConfig config = IngestConfig::LoadResolved(options.config_path_);
  const auto&        args   = options.positionals_;

  switch (options.command_) {
    case CliCommand::ALBUM: {
      AlbumRequest request;
      request.directory_   = args[0];
      request.slug_        = args[1];
      request.title_       = options.title_.value_or("");
      request.date_        = options.date_.value_or("");
      request.description_ = options.description_;
      request.focal_       = RequireFocal(options.focal_);
      request.force_       = options.force_;
      auto service = MakeService(config, MakeDetector(config, options), out);
      PrintReport(service->IngestAlbum(request), out);
      return 0;
    }
    case CliCommand::TRANSFER: {
      TransferRequest request;
      request.directory_ = args[0];
      request.title_     = options.title_.value_or("");
      request.id_        = options.id_;
      request.expires_   = options.expires_;
      request.force_     = options.force_;
      const auto report  = MakeService(config, nullptr, out)->IngestTransfer(request);
      PrintReport(report, out);
      if (report.manifest_.has_value()) {
        out << "expires: " << report.manifest_->value("expiresAt", std::string{}) << std::endl;
      }
      return 0;
    }
    case CliCommand::MEDIA: {
      MediaRequest request;
      request.directory_ = args[0];
      request.scope_     = options.asset_.has_value() ? MediaScope::ASSET : MediaScope::WORD;
      request.target_    = options.asset_.has_value() ? *options.asset_ : args[1];
      request.force_     = options.force_;
      PrintReport(MakeService(config, nullptr, out)->IngestMedia(request), out);
      return 0;
    }
    case CliCommand::FOCAL: {
      const auto bytes = ReadFileBytes(args[0]);
      if (options.compare_) {
        for (const auto& [name, focal] : CompareStrategies(bytes, config.DetectorParams())) {
          out << std::format("{:<10} {}", name, FormatFocal(focal)) << std::endl;
        }
        return 0;
      }
      const std::string strategy = options.strategy_.value_or(config.focal_strategy_);
      out << FormatFocal(DetectFocal(bytes, strategy, config.DetectorParams())) << std::endl;
      return 0;
    }
    case CliCommand::PREVIEW: {
      const auto bytes = ReadFileBytes(args[0]);
      std::optional<OverlaySpec> overlay;
      if (options.title_.has_value()) overlay = OverlaySpec{*options.title_, options.id_};
      const auto preview = MakeGenerator(config)->ProcessToPreview(
          bytes, RequireFocal(options.focal_), overlay, LowerExtension(args[0]));
      WriteFileAtomic(args[1], preview.bytes_.data(), preview.bytes_.size());
      out << std::format("wrote {} ({})", args[1], FormatBytes(preview.bytes_.size()))
          << std::endl;
      return 0;
    }
    case CliCommand::DELETE_ALBUM: {
      const size_t deleted = MakeService(config, nullptr, out)->DeleteAlbum(args[0]);
      out << std::format("deleted {} objects from album {}", deleted, args[0]) << std::endl;
      return 0;
    }
    case CliCommand::DELETE_TRANSFER: {
      const size_t deleted = MakeService(config, nullptr, out)->DeleteTransfer(args[0]);
      out << std::format("deleted {} objects from transfer {}", deleted, args[0]) << std::endl;
      return 0;
    }
    case CliCommand::LIST_ALBUMS: {
      for (const auto& slug : MakeService(config, nullptr, out)->ListAlbums()) {
        out << slug << std::endl;
      }
      return 0;
    }
    case CliCommand::ALBUM_INFO: {
      const auto album = MakeService(config, nullptr, out)->GetAlbum(args[0]);
      if (!album.has_value()) {
        throw std::runtime_error(std::format(
            "[ERROR] CLI: Album \"{}\" not found. Run list-albums to see stored albums.",
            args[0]));
      }
      PrintAlbum(*album, out);
      return 0;
    }
    case CliCommand::DELETE_PHOTO: {
      const auto keys = MakeService(config, nullptr, out)->DeletePhoto(args[0], args[1]);
      out << std::format("deleted photo {} ({} objects) from album {}", args[1], keys.size(),
                         args[0])
          << std::endl;
      return 0;
    }
    case CliCommand::SET_COVER: {
      MakeService(config, nullptr, out)->SetCover(args[0], args[1]);
      out << std::format("cover of {} is now {}", args[0], args[1]) << std::endl;
      return 0;
    }
    case CliCommand::LIST_TRANSFERS: {
      const auto transfers = MakeService(config, nullptr, out)->ListTransfers();
      if (transfers.empty()) {
        out << "no active transfers" << std::endl;
      }
      for (const auto& transfer : transfers) {
        out << std::format("{:<14} {:<32} {:>4} files  expires in {}", transfer.id_,
                           transfer.title_, transfer.file_count_,
                           FormatDuration(transfer.remaining_seconds_))
            << std::endl;
      }
      return 0;
    }
    case CliCommand::TRANSFER_INFO: {
      const auto transfer = MakeService(config, nullptr, out)->GetTransfer(args[0]);
      if (!transfer.has_value()) {
        throw std::runtime_error(std::format(
            "[ERROR] CLI: Transfer \"{}\" not found. Run list-transfers to see active ones.",
            args[0]));
      }
      PrintTransfer(*transfer, out);
      return 0;
    }
    case CliCommand::DELETE_ALL_TRANSFERS: {
      const auto purged = MakeService(config, nullptr, out)->DeleteAllTransfers();
      out << std::format("deleted {} objects and {} transfer records", purged.objects_,
                         purged.manifests_)
          << std::endl;
      return 0;
    }
    case CliCommand::LIST_MEDIA: {
      const auto [scope, target] = MediaTarget(options);
      const std::string prefix   = IngestService::MediaPrefix(scope, target);
      const auto        objects  = MakeService(config, nullptr, out)->ListMedia(scope, target);
      if (objects.empty()) {
        out << "no files stored under " << prefix << std::endl;
      }
      for (const auto& object : objects) {
        out << std::format("{:<40} {}", object.key_.substr(prefix.size()),
                           FormatBytes(object.size_))
            << std::endl;
      }
      return 0;
    }
    case CliCommand::DELETE_MEDIA: {
      const auto [scope, target] = MediaTarget(options);
      auto service               = MakeService(config, nullptr, out);
      if (options.all_) {
        const size_t deleted = service->DeleteAllMedia(scope, target);
        out << std::format("deleted {} objects from {}", deleted,
                           IngestService::MediaPrefix(scope, target))
            << std::endl;
        return 0;
      }
      const std::string& filename = args.back();
      service->DeleteMedia(scope, target, filename);
      out << "deleted " << IngestService::MediaPrefix(scope, target) << filename << std::endl;
      return 0;
    }
    default:
      out << CliUsage();
      return 1;
  }
}
};  // namespace darkroom
