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

#include "focal/focal_detector.hpp"

#include <format>
#include <iostream>
#include <stdexcept>

#include "decoders/image_decoder.hpp"
#include "focal/neural_focal_detector.hpp"
#include "focal/saliency_focal_detector.hpp"

namespace darkroom {
auto FocalDetector::Detect(const byte_buffer_t& bytes) -> std::optional<FocalPoint> {
  auto decoded = ImageDecoder::DecodeOriented(bytes);
  return DetectImage(decoded.image_);
}

auto FocalDetectorRegistry::Instance() -> FocalDetectorRegistry& {
  static FocalDetectorRegistry instance;
  return instance;
}

void FocalDetectorRegistry::Register(const std::string& name, Creator creator) {
  std::lock_guard<std::mutex> lock(mtx_);
  creators_[name] = std::move(creator);
}

auto FocalDetectorRegistry::Create(const std::string& name, const nlohmann::json& params) const
    -> std::shared_ptr<FocalDetector> {
  Creator creator;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = creators_.find(name);
    if (it == creators_.end()) {
      std::string known;
      for (const auto& [key, _] : creators_) {
        known += known.empty() ? key : ", " + key;
      }
      throw std::invalid_argument(std::format(
          "[ERROR] FocalDetectorRegistry: Unknown focal strategy \"{}\" (available: {})", name,
          known));
    }
    creator = it->second;
  }
  return creator(params);
}

auto FocalDetectorRegistry::Contains(const std::string& name) const -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return creators_.count(name) > 0;
}

auto FocalDetectorRegistry::Names() const -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<std::string>    names;
  names.reserve(creators_.size());
  for (const auto& [name, _] : creators_) {
    names.push_back(name);
  }
  return names;
}

void RegisterBuiltinFocalDetectors() {
  auto& registry = FocalDetectorRegistry::Instance();
  registry.Register(kNeuralStrategy, FocalDetectorRegistry::MakeCreator<NeuralFocalDetector>());
  registry.Register(kSaliencyStrategy,
                    FocalDetectorRegistry::MakeCreator<SaliencyFocalDetector>());
}

auto DetectFocal(const byte_buffer_t& bytes, const std::string& strategy,
                 const nlohmann::json& params) -> std::optional<FocalPoint> {
  auto detector = FocalDetectorRegistry::Instance().Create(strategy, params);
  return detector->Detect(bytes);
}

auto CompareStrategies(const byte_buffer_t& bytes, const nlohmann::json& params)
    -> std::map<std::string, std::optional<FocalPoint>> {
  std::map<std::string, std::optional<FocalPoint>> results;
  auto&                                            registry = FocalDetectorRegistry::Instance();
  for (const auto& name : registry.Names()) {
    try {
      results[name] = registry.Create(name, params)->Detect(bytes);
    } catch (const std::exception& e) {
      std::cerr << "[WARN] FocalDetector: strategy " << name << " failed: " << e.what()
                << std::endl;
      results[name] = std::nullopt;
    }
  }
  return results;
}
};  // namespace darkroom
