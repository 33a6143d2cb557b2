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
#include <nlohmann/json.hpp>
#include <opencv2/dnn.hpp>
#include <optional>
#include <utility>

#include "focal/focal_detector.hpp"
#include "type/type.hpp"

namespace darkroom {
/**
 * @brief Lazily built UltraFace network. The network is read from disk on the first Run and
 * reused until Reset. Forward passes are serialized.
 */
class FaceNetSession {
 public:
  static constexpr int kInputWidth  = 320;
  static constexpr int kInputHeight = 240;

  explicit FaceNetSession(file_path_t model_path);

  /**
   * @brief Forward a [1,3,240,320] blob
   *
   * @return (scores, boxes) with 2 and 4 floats per anchor
   * @throws std::runtime_error when the model file is missing or unreadable
   */
  auto Run(const cv::Mat& blob) -> std::pair<cv::Mat, cv::Mat>;

  auto IsLoaded() const -> bool;

  /**
   * @brief Drop the cached network; the next Run reloads it
   */
  void Reset();

  auto ModelPath() const -> const file_path_t& { return model_path_; }

 private:
  void                        EnsureLoaded();

  file_path_t                 model_path_;
  mutable std::mutex          mtx_;
  std::optional<cv::dnn::Net> net_;
};

/**
 * @brief Face-centroid strategy ("onnx")
 */
class NeuralFocalDetector final : public FocalDetector {
 public:
  static constexpr const char* kDefaultModelPath = "models/ultraface-320.onnx";

  explicit NeuralFocalDetector(const nlohmann::json& params = {});
  explicit NeuralFocalDetector(std::shared_ptr<FaceNetSession> session);

  auto Name() const -> std::string override;
  auto DetectImage(const cv::Mat& upright_bgr) -> std::optional<FocalPoint> override;

  auto Session() const -> const std::shared_ptr<FaceNetSession>& { return session_; }

  /**
   * @brief Normalized CHW RGB blob: (p - 127) / 128 at 320x240
   */
  static auto MakeInputBlob(const cv::Mat& upright_bgr) -> cv::Mat;

 private:
  std::shared_ptr<FaceNetSession> session_;
};
};  // namespace darkroom
