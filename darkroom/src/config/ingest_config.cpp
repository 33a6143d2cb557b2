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

#include "config/ingest_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "utils/fs/atomic_file.hpp"

namespace darkroom {
namespace {
template <typename T>
void ReadInto(const nlohmann::json& obj, const char* key, T& out) {
  if (obj.contains(key) && !obj.at(key).is_null()) {
    try {
      out = obj.at(key).get<T>();
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(
          std::format("[ERROR] IngestConfig: \"{}\" has the wrong type: {}", key, e.what()));
    }
  }
}

void RequirePositive(const char* key, long long value) {
  if (value <= 0) {
    throw std::runtime_error(
        std::format("[ERROR] IngestConfig: \"{}\" must be positive, got {}", key, value));
  }
}

void RequireQuality(const char* key, int value) {
  if (value < 1 || value > 100) {
    throw std::runtime_error(
        std::format("[ERROR] IngestConfig: \"{}\" must be within 1..100, got {}", key, value));
  }
}
}  // namespace

auto IngestConfig::FromJson(const nlohmann::json& payload) -> IngestConfig {
  if (!payload.is_object()) {
    throw std::runtime_error("[ERROR] IngestConfig: config root must be a JSON object");
  }
  IngestConfig config;
  std::string  store_root    = config.store_root_.string();
  std::string  manifest_root = config.manifest_root_.string();
  std::string  model_path    = config.model_path_.string();
  ReadInto(payload, "store_root", store_root);
  ReadInto(payload, "manifest_root", manifest_root);
  ReadInto(payload, "model_path", model_path);
  config.store_root_    = store_root;
  config.manifest_root_ = manifest_root;
  config.model_path_    = model_path;

  ReadInto(payload, "focal_strategy", config.focal_strategy_);
  ReadInto(payload, "brand", config.brand_);
  ReadInto(payload, "default_expiry", config.default_expiry_);
  ReadInto(payload, "media_max_width", config.media_max_width_);
  ReadInto(payload, "media_quality", config.media_quality_);

  if (payload.contains("lanes")) {
    const auto& lanes = payload.at("lanes");
    ReadInto(lanes, "image", config.lanes_.image_);
    ReadInto(lanes, "raw", config.lanes_.raw_);
  }
  if (payload.contains("variants")) {
    const auto& v = payload.at("variants");
    ReadInto(v, "thumb_width", config.variants_.thumb_width_);
    ReadInto(v, "thumb_quality", config.variants_.thumb_quality_);
    ReadInto(v, "full_width", config.variants_.full_width_);
    ReadInto(v, "full_quality", config.variants_.full_quality_);
    ReadInto(v, "original_quality", config.variants_.original_quality_);
    ReadInto(v, "preview_width", config.variants_.preview_width_);
    ReadInto(v, "preview_height", config.variants_.preview_height_);
    ReadInto(v, "preview_quality", config.variants_.preview_quality_);
  }

  RequirePositive("lanes.image", static_cast<long long>(config.lanes_.image_));
  RequirePositive("lanes.raw", static_cast<long long>(config.lanes_.raw_));
  RequirePositive("variants.thumb_width", config.variants_.thumb_width_);
  RequirePositive("variants.full_width", config.variants_.full_width_);
  RequirePositive("variants.preview_width", config.variants_.preview_width_);
  RequirePositive("variants.preview_height", config.variants_.preview_height_);
  RequirePositive("media_max_width", config.media_max_width_);
  RequireQuality("variants.thumb_quality", config.variants_.thumb_quality_);
  RequireQuality("variants.full_quality", config.variants_.full_quality_);
  RequireQuality("variants.original_quality", config.variants_.original_quality_);
  RequireQuality("variants.preview_quality", config.variants_.preview_quality_);
  RequireQuality("media_quality", config.media_quality_);
  return config;
}

auto IngestConfig::ToJson() const -> nlohmann::json {
  return {{"store_root", store_root_.string()},
          {"manifest_root", manifest_root_.string()},
          {"model_path", model_path_.string()},
          {"focal_strategy", focal_strategy_},
          {"brand", brand_},
          {"default_expiry", default_expiry_},
          {"media_max_width", media_max_width_},
          {"media_quality", media_quality_},
          {"lanes", {{"image", lanes_.image_}, {"raw", lanes_.raw_}}},
          {"variants",
           {{"thumb_width", variants_.thumb_width_},
            {"thumb_quality", variants_.thumb_quality_},
            {"full_width", variants_.full_width_},
            {"full_quality", variants_.full_quality_},
            {"original_quality", variants_.original_quality_},
            {"preview_width", variants_.preview_width_},
            {"preview_height", variants_.preview_height_},
            {"preview_quality", variants_.preview_quality_}}}};
}

auto IngestConfig::Load(const file_path_t& path) -> IngestConfig {
  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(ReadFileText(path));
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(
        std::format("[ERROR] IngestConfig: {} is not valid JSON: {}", path.string(), e.what()));
  }
  return FromJson(payload);
}

auto IngestConfig::ResolvePath(const std::optional<file_path_t>& explicit_path)
    -> std::optional<file_path_t> {
  std::error_code ec;
  if (explicit_path.has_value()) {
    if (!std::filesystem::exists(*explicit_path, ec)) {
      throw std::runtime_error(std::format("[ERROR] IngestConfig: Config file {} does not exist",
                                           explicit_path->string()));
    }
    return explicit_path;
  }

  std::vector<file_path_t> candidates;
  if (const char* env = std::getenv("DARKROOM_CONFIG"); env != nullptr && *env != '\0') {
    candidates.emplace_back(env);
  }
#ifdef CONFIG_PATH
  candidates.emplace_back(std::filesystem::path(CONFIG_PATH) / "darkroom.json");
#endif
  for (const auto& path : candidates) {
    if (std::filesystem::exists(path, ec) && !ec) {
      return path;
    }
  }
  return std::nullopt;
}

auto IngestConfig::LoadResolved(const std::optional<file_path_t>& explicit_path)
    -> IngestConfig {
  const auto path = ResolvePath(explicit_path);
  return path.has_value() ? Load(*path) : IngestConfig{};
}

auto IngestConfig::DetectorParams() const -> nlohmann::json {
  return {{"model_path", model_path_.string()},
          {"canvas_width", variants_.preview_width_},
          {"canvas_height", variants_.preview_height_}};
}
};  // namespace darkroom
