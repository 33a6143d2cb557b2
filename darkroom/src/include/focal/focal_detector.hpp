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

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

#include "image/image_variant.hpp"
#include "type/type.hpp"

namespace darkroom {
/**
 * @brief Strategy that proposes a crop anchor for an image
 */
class FocalDetector {
 public:
  virtual ~FocalDetector() = default;

  virtual auto Name() const -> std::string = 0;

  /**
   * @brief Decode, auto-orient and run DetectImage. "Nothing found" is nullopt.
   *
   * @throws DecodeError when the bytes are not an image
   */
  auto         Detect(const byte_buffer_t& bytes) -> std::optional<FocalPoint>;

  /**
   * @brief Detect on an already decoded, upright BGR image
   */
  virtual auto DetectImage(const cv::Mat& upright_bgr) -> std::optional<FocalPoint> = 0;
};

class FocalDetectorRegistry {
 public:
  using Creator = std::function<std::shared_ptr<FocalDetector>(const nlohmann::json&)>;

  static auto Instance() -> FocalDetectorRegistry&;

  void        Register(const std::string& name, Creator creator);

  /**
   * @brief Create a detector by strategy name
   *
   * @throws std::invalid_argument for an unknown strategy
   */
  auto        Create(const std::string& name, const nlohmann::json& params = {}) const
      -> std::shared_ptr<FocalDetector>;

  auto        Contains(const std::string& name) const -> bool;
  auto        Names() const -> std::vector<std::string>;

  template <typename T>
  static Creator MakeCreator() {
    return [](const nlohmann::json& params) -> std::shared_ptr<FocalDetector> {
      return std::make_shared<T>(params);
    };
  }

 private:
  mutable std::mutex             mtx_;
  std::map<std::string, Creator> creators_;
};

constexpr const char* kNeuralStrategy   = "onnx";
constexpr const char* kSaliencyStrategy = "saliency";
constexpr const char* kDefaultStrategy  = kNeuralStrategy;

/**
 * @brief Register the neural and saliency detectors. Safe to call more than once.
 */
void RegisterBuiltinFocalDetectors();

/**
 * @brief One-shot detection with a named strategy
 *
 * @throws std::invalid_argument for an unknown strategy, DecodeError on undecodable bytes
 */
auto DetectFocal(const byte_buffer_t& bytes, const std::string& strategy = kDefaultStrategy,
                 const nlohmann::json& params = {}) -> std::optional<FocalPoint>;

/**
 * @brief Run every registered strategy on the same bytes. Failures are reported as nullopt.
 * Diagnostic use only.
 */
auto CompareStrategies(const byte_buffer_t& bytes, const nlohmann::json& params = {})
    -> std::map<std::string, std::optional<FocalPoint>>;
};  // namespace darkroom
