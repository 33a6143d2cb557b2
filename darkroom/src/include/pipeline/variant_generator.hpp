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
#include <opencv2/core.hpp>
#include <optional>
#include <string>

#include "decoders/image_decoder.hpp"
#include "image/image_variant.hpp"
#include "overlay/overlay_compositor.hpp"
#include "type/type.hpp"

namespace darkroom {
struct VariantSettings {
  int thumb_width_      = 600;
  int thumb_quality_    = 80;
  int full_width_       = 1600;
  int full_quality_     = 85;
  int original_quality_ = 95;
  int preview_width_    = 1200;
  int preview_height_   = 630;
  int preview_quality_  = 70;
};

/**
 * @brief Derives the store-ready variants of one source image.
 *
 * thumb/full are WebP at fixed widths, original is the source itself when it is already JPEG
 * (otherwise a high quality JPEG), preview is a cover-cropped social card with an optional
 * text overlay.
 */
class VariantGenerator {
 public:
  explicit VariantGenerator(VariantSettings                    settings   = {},
                            std::shared_ptr<OverlayCompositor> compositor = nullptr);

  /**
   * @brief Decode (with the HEIF fallback) and derive every variant
   *
   * @throws DecodeError when the bytes cannot be decoded
   */
  auto Process(const byte_buffer_t& bytes, const std::string& source_ext,
               const std::optional<FocalPoint>&  focal   = std::nullopt,
               const std::optional<OverlaySpec>& overlay = std::nullopt) const -> ProcessedImage;

  /**
   * @brief Derive variants from an image that was already decoded, e.g. for focal detection
   */
  auto ProcessDecoded(const DecodedImage& decoded, const byte_buffer_t& bytes,
                      const std::string& source_ext, const std::optional<FocalPoint>& focal,
                      const std::optional<OverlaySpec>& overlay) const -> ProcessedImage;

  auto Decode(const byte_buffer_t& bytes, const std::string& source_ext) const -> DecodedImage;

  /**
   * @brief Only the social preview, e.g. to re-render a cover with a new anchor
   */
  auto ProcessToPreview(const byte_buffer_t& bytes, const std::optional<FocalPoint>& focal,
                        const std::optional<OverlaySpec>& overlay,
                        const std::string& source_ext = ".jpg") const -> MediaVariant;

  /**
   * @brief First-frame WebP thumbnail of an animated GIF. The GIF itself is stored unchanged.
   */
  auto ProcessGifThumb(const byte_buffer_t& bytes) const -> ProcessedGif;

  /**
   * @brief Single WebP, downscaled only when wider than max_width
   */
  auto ProcessToWebP(const byte_buffer_t& bytes, const std::string& source_ext,
                     int max_width = 1600, int quality = 85) const -> ProcessedWebP;

  auto RenderPreview(const cv::Mat& upright_bgr, const std::optional<FocalPoint>& focal,
                     const std::optional<OverlaySpec>& overlay) const -> MediaVariant;

  static auto EncodeWebP(const cv::Mat& img, int quality) -> MediaVariant;
  static auto EncodeJpeg(const cv::Mat& img, int quality, bool optimize = false) -> MediaVariant;

  auto        Settings() const -> const VariantSettings& { return settings_; }

 private:
  VariantSettings                    settings_;
  std::shared_ptr<OverlayCompositor> compositor_;
};
};  // namespace darkroom
