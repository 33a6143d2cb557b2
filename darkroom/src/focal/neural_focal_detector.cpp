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

#include "focal/neural_focal_detector.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

#include "focal/face_detection.hpp"
#include "utils/profiler/profiler.hpp"

namespace darkroom {
FaceNetSession::FaceNetSession(file_path_t model_path) : model_path_(std::move(model_path)) {}

void FaceNetSession::EnsureLoaded() {
  if (net_) return;
  if (!std::filesystem::exists(model_path_)) {
    throw std::runtime_error(std::format(
        "[ERROR] FaceNetSession: Face detection model not found at {}. Set \"model_path\" in "
        "the config or use the saliency strategy.",
        model_path_.string()));
  }
  EASY_BLOCK("FaceNetSession::Load");
  try {
    cv::dnn::Net net = cv::dnn::readNetFromONNX(model_path_.string());
    if (net.empty()) {
      throw std::runtime_error(std::format(
          "[ERROR] FaceNetSession: Model {} contains no layers", model_path_.string()));
    }
    net_ = std::move(net);
  } catch (const cv::Exception& e) {
    throw std::runtime_error(std::format("[ERROR] FaceNetSession: Cannot load {}: {}",
                                         model_path_.string(), e.what()));
  }
}

auto FaceNetSession::Run(const cv::Mat& blob) -> std::pair<cv::Mat, cv::Mat> {
  std::lock_guard<std::mutex> lock(mtx_);
  EnsureLoaded();

  EASY_BLOCK("FaceNetSession::Run");
  std::vector<cv::Mat> outputs;
  try {
    net_->setInput(blob);
    net_->forward(outputs, std::vector<cv::String>{"scores", "boxes"});
  } catch (const cv::Exception& e) {
    throw std::runtime_error(std::format("[ERROR] FaceNetSession: Inference failed: {}", e.what()));
  }
  if (outputs.size() != 2) {
    throw std::runtime_error("[ERROR] FaceNetSession: Unexpected model outputs");
  }
  // Outputs may be views into network-owned memory
  return {outputs[0].clone(), outputs[1].clone()};
}

auto FaceNetSession::IsLoaded() const -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return net_.has_value();
}

void FaceNetSession::Reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  net_.reset();
}

NeuralFocalDetector::NeuralFocalDetector(const nlohmann::json& params)
    : session_(std::make_shared<FaceNetSession>(
          params.value("model_path", std::string(kDefaultModelPath)))) {}

NeuralFocalDetector::NeuralFocalDetector(std::shared_ptr<FaceNetSession> session)
    : session_(std::move(session)) {
  if (!session_) {
    throw std::invalid_argument("[ERROR] NeuralFocalDetector: null session");
  }
}

auto NeuralFocalDetector::Name() const -> std::string { return kNeuralStrategy; }

auto NeuralFocalDetector::MakeInputBlob(const cv::Mat& upright_bgr) -> cv::Mat {
  return cv::dnn::blobFromImage(upright_bgr, 1.0 / 128.0,
                                cv::Size(FaceNetSession::kInputWidth, FaceNetSession::kInputHeight),
                                cv::Scalar(127.0, 127.0, 127.0), /*swapRB=*/true, /*crop=*/false);
}

auto NeuralFocalDetector::DetectImage(const cv::Mat& upright_bgr) -> std::optional<FocalPoint> {
  EASY_BLOCK("NeuralFocalDetector::DetectImage");
  auto [scores, boxes]      = session_->Run(MakeInputBlob(upright_bgr));

  const size_t anchor_count = scores.total() / 2;
  if (boxes.total() < anchor_count * 4) {
    throw std::runtime_error("[ERROR] NeuralFocalDetector: scores/boxes size mismatch");
  }
  auto candidates = DecodeDetections(scores.ptr<float>(), boxes.ptr<float>(), anchor_count);
  auto kept       = NonMaxSuppression(std::move(candidates));
  return WeightedCentroid(kept);
}
};  // namespace darkroom
