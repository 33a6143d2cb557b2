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

#include "pipeline/variant_generator.hpp"

#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <vector>

#include "image/cover_crop.hpp"
#include "type/supported_file_type.hpp"
#include "utils/profiler/profiler.hpp"

namespace darkroom {
namespace {
auto IsJpegExtension(const std::string& ext) -> bool {
  const std::string lowered = NormalizeExtension(ext);
  return lowered == ".jpg" || lowered == ".jpeg";
}
}  // namespace

VariantGenerator::VariantGenerator(VariantSettings                    settings,
                                   std::shared_ptr<OverlayCompositor> compositor)
    : settings_(settings), compositor_(std::move(compositor)) {
  if (!compositor_) {
    compositor_ = std::make_shared<OverlayCompositor>();
  }
}

auto VariantGenerator::EncodeWebP(const cv::Mat& img, int quality) -> MediaVariant {
  EASY_BLOCK("VariantGenerator::EncodeWebP");
  MediaVariant variant;
  variant.content_type_ = "image/webp";
  variant.extension_    = ".webp";
  if (!cv::imencode(".webp", img, variant.bytes_, {cv::IMWRITE_WEBP_QUALITY, quality})) {
    throw std::runtime_error("[ERROR] VariantGenerator: WebP encoding failed");
  }
  return variant;
}

auto VariantGenerator::EncodeJpeg(const cv::Mat& img, int quality, bool optimize) -> MediaVariant {
  EASY_BLOCK("VariantGenerator::EncodeJpeg");
  MediaVariant     variant;
  variant.content_type_ = "image/jpeg";
  variant.extension_    = ".jpg";
  std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
  if (optimize) {
    params.push_back(cv::IMWRITE_JPEG_OPTIMIZE);
    params.push_back(1);
    params.push_back(cv::IMWRITE_JPEG_PROGRESSIVE);
    params.push_back(1);
  }
  if (!cv::imencode(".jpg", img, variant.bytes_, params)) {
    throw std::runtime_error("[ERROR] VariantGenerator: JPEG encoding failed");
  }
  return variant;
}

auto VariantGenerator::Decode(const byte_buffer_t& bytes, const std::string& source_ext) const
    -> DecodedImage {
  return ImageDecoder::DecodeWithFallback(bytes, source_ext);
}

auto VariantGenerator::RenderPreview(const cv::Mat& upright_bgr,
                                     const std::optional<FocalPoint>&  focal,
                                     const std::optional<OverlaySpec>& overlay) const
    -> MediaVariant {
  EASY_BLOCK("VariantGenerator::RenderPreview");
  const CoverCrop crop = ComputeCoverCrop(upright_bgr.cols, upright_bgr.rows,
                                          settings_.preview_width_, settings_.preview_height_,
                                          focal);
  cv::Mat         card = ApplyCoverCrop(upright_bgr, crop);
  if (overlay) {
    compositor_->Composite(card, *overlay);
  }
  return EncodeJpeg(card, settings_.preview_quality_, /*optimize=*/true);
}

auto VariantGenerator::ProcessDecoded(const DecodedImage& decoded, const byte_buffer_t& bytes,
                                      const std::string&                source_ext,
                                      const std::optional<FocalPoint>&  focal,
                                      const std::optional<OverlaySpec>& overlay) const
    -> ProcessedImage {
  const cv::Mat& upright = decoded.image_;

  ProcessedImage result;
  result.width_       = upright.cols;
  result.height_      = upright.rows;
  result.captured_at_    = decoded.metadata_.captured_at_;
  result.metadata_error_ = decoded.metadata_.read_error_;

  result.thumb_ = EncodeWebP(ResizeToWidth(upright, settings_.thumb_width_),
                             settings_.thumb_quality_);
  result.full_  = EncodeWebP(ResizeToWidth(upright, settings_.full_width_),
                             settings_.full_quality_);

  if (IsJpegExtension(source_ext)) {
    result.original_.bytes_        = bytes;
    result.original_.content_type_ = "image/jpeg";
    result.original_.extension_    = NormalizeExtension(source_ext);
  } else {
    result.original_ = EncodeJpeg(upright, settings_.original_quality_);
  }

  result.preview_ = RenderPreview(upright, focal, overlay);
  return result;
}

auto VariantGenerator::Process(const byte_buffer_t& bytes, const std::string& source_ext,
                               const std::optional<FocalPoint>&  focal,
                               const std::optional<OverlaySpec>& overlay) const
    -> ProcessedImage {
  EASY_BLOCK("VariantGenerator::Process");
  const DecodedImage decoded = Decode(bytes, source_ext);
  return ProcessDecoded(decoded, bytes, source_ext, focal, overlay);
}

auto VariantGenerator::ProcessToPreview(const byte_buffer_t& bytes,
                                        const std::optional<FocalPoint>&  focal,
                                        const std::optional<OverlaySpec>& overlay,
                                        const std::string& source_ext) const -> MediaVariant {
  const DecodedImage decoded = Decode(bytes, source_ext);
  return RenderPreview(decoded.image_, focal, overlay);
}

auto VariantGenerator::ProcessGifThumb(const byte_buffer_t& bytes) const -> ProcessedGif {
  // imdecode yields the first frame of an animation
  const DecodedImage decoded = ImageDecoder::DecodeOriented(bytes);
  ProcessedGif       result;
  result.width_  = decoded.image_.cols;
  result.height_ = decoded.image_.rows;
  result.thumb_  = EncodeWebP(ResizeToWidth(decoded.image_, settings_.thumb_width_),
                              settings_.thumb_quality_);
  return result;
}

auto VariantGenerator::ProcessToWebP(const byte_buffer_t& bytes, const std::string& source_ext,
                                     int max_width, int quality) const -> ProcessedWebP {
  const DecodedImage decoded = Decode(bytes, source_ext);
  const cv::Mat      sized   = decoded.image_.cols > max_width
                                   ? ResizeToWidth(decoded.image_, max_width)
                                   : decoded.image_;
  ProcessedWebP      result;
  result.width_  = sized.cols;
  result.height_ = sized.rows;
  result.image_  = EncodeWebP(sized, quality);
  return result;
}
};  // namespace darkroom
