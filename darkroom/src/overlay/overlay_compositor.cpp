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

#include "overlay/overlay_compositor.hpp"

#include <cairo.h>
#include <librsvg/rsvg.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <memory>
#include <stdexcept>

#include "utils/profiler/profiler.hpp"
#include "utils/string/sanitize.hpp"

namespace darkroom {
namespace {
struct GObjectDeleter {
  void operator()(RsvgHandle* handle) const { g_object_unref(handle); }
};
struct CairoSurfaceDeleter {
  void operator()(cairo_surface_t* surface) const { cairo_surface_destroy(surface); }
};
struct CairoContextDeleter {
  void operator()(cairo_t* cr) const { cairo_destroy(cr); }
};

// Two decimals, trailing zeros dropped: 28 -> "28", 0.4 * 1.5 -> "0.6"
auto Num(double value) -> std::string {
  return std::format("{}", std::round(value * 100.0) / 100.0);
}

constexpr const char* kMiddleDot   = "\xC2\xB7";
constexpr const char* kFontFamily  = "'Courier New', Courier, monospace";
constexpr const char* kTitleFill   = "rgba(255,255,255,0.96)";
constexpr const char* kIdFill      = "rgba(255,255,255,0.92)";
constexpr const char* kTextOutline = "rgba(0,0,0,0.35)";
}  // namespace

OverlayCompositor::OverlayCompositor(std::string brand) : brand_(std::move(brand)) {}

auto OverlayCompositor::BuildSvg(const OverlaySpec& spec, int width, int height) const
    -> std::string {
  const double k        = width / kReferenceWidth;
  const long   grad_y   = std::lround(height * kGradientStart);
  const long   grad_h   = height - grad_y;
  const double baseline = height - kBaselineFromBase * k;

  std::string  svg      = std::format(
      R"(<svg width="{0}" height="{1}" viewBox="0 0 {0} {1}" xmlns="http://www.w3.org/2000/svg">)"
            "\n"
            R"(  <defs>
    <linearGradient id="g" x1="0" y1="0" x2="0" y2="1">
      <stop offset="0%" stop-color="#000" stop-opacity="0"/>
      <stop offset="100%" stop-color="#000" stop-opacity="{2}"/>
    </linearGradient>
  </defs>
  <rect x="0" y="{3}" width="{0}" height="{4}" fill="url(#g)"/>
)",
      width, height, kGradientOpacity, grad_y, grad_h);

  svg += std::format(
      R"(  <text x="{}" y="{}" font-size="{}" font-weight="600" fill="{}" stroke="{}" stroke-width="{}" paint-order="stroke fill" font-family="{}" letter-spacing="{}">{} {} {}</text>)"
      "\n",
      Num(kTextInset * k), Num(baseline), Num(kTitleFontSize * k), kTitleFill, kTextOutline,
      Num(k), kFontFamily, Num(-0.4 * k), EscapeXml(brand_), kMiddleDot, EscapeXml(spec.title_));

  if (spec.id_ && !spec.id_->empty()) {
    svg += std::format(
        R"(  <text x="{}" y="{}" font-size="{}" font-weight="600" fill="{}" stroke="{}" stroke-width="{}" paint-order="stroke fill" font-family="{}" text-anchor="end">{}</text>)"
        "\n",
        Num(width - kTextInset * k), Num(baseline), Num(kIdFontSize * k), kIdFill, kTextOutline,
        Num(k), kFontFamily, EscapeXml(*spec.id_));
  }
  svg += "</svg>";
  return svg;
}

auto OverlayCompositor::Rasterize(const std::string& svg, int width, int height) -> cv::Mat {
  EASY_BLOCK("OverlayCompositor::Rasterize");
  GError* error = nullptr;
  std::unique_ptr<RsvgHandle, GObjectDeleter> handle(rsvg_handle_new_from_data(
      reinterpret_cast<const guint8*>(svg.data()), svg.size(), &error));
  if (error || !handle) {
    std::string message = error ? error->message : "unknown error";
    if (error) g_error_free(error);
    throw std::runtime_error(
        std::format("[ERROR] OverlayCompositor: Cannot parse overlay SVG: {}", message));
  }

  std::unique_ptr<cairo_surface_t, CairoSurfaceDeleter> surface(
      cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height));
  if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS) {
    throw std::runtime_error(std::format(
        "[ERROR] OverlayCompositor: Cannot allocate {}x{} render surface", width, height));
  }
  std::unique_ptr<cairo_t, CairoContextDeleter> cr(cairo_create(surface.get()));

  RsvgRectangle viewport = {0, 0, static_cast<double>(width), static_cast<double>(height)};
  if (!rsvg_handle_render_document(handle.get(), cr.get(), &viewport, &error)) {
    std::string message = error ? error->message : "unknown error";
    if (error) g_error_free(error);
    throw std::runtime_error(
        std::format("[ERROR] OverlayCompositor: Cannot render overlay: {}", message));
  }
  cairo_surface_flush(surface.get());

  // Cairo ARGB32 is BGRA in native byte order on little-endian hosts
  const int stride = cairo_image_surface_get_stride(surface.get());
  cv::Mat   view(height, width, CV_8UC4, cairo_image_surface_get_data(surface.get()),
                 static_cast<size_t>(stride));
  return view.clone();
}

void OverlayCompositor::AlphaBlendPremultiplied(cv::Mat& bgr, const cv::Mat& bgra_premultiplied) {
  if (bgr.type() != CV_8UC3 || bgra_premultiplied.type() != CV_8UC4 ||
      bgr.size() != bgra_premultiplied.size()) {
    throw std::invalid_argument("[ERROR] OverlayCompositor: Overlay does not match target image");
  }
  for (int y = 0; y < bgr.rows; ++y) {
    auto*       dst = bgr.ptr<cv::Vec3b>(y);
    const auto* src = bgra_premultiplied.ptr<cv::Vec4b>(y);
    for (int x = 0; x < bgr.cols; ++x) {
      const int alpha = src[x][3];
      if (alpha == 0) continue;
      const int inv = 255 - alpha;
      for (int c = 0; c < 3; ++c) {
        const int blended = src[x][c] + (dst[x][c] * inv + 127) / 255;
        dst[x][c]         = static_cast<uchar>(std::min(blended, 255));
      }
    }
  }
}

void OverlayCompositor::Composite(cv::Mat& bgr, const OverlaySpec& spec) const {
  const std::string svg     = BuildSvg(spec, bgr.cols, bgr.rows);
  const cv::Mat     overlay = Rasterize(svg, bgr.cols, bgr.rows);
  AlphaBlendPremultiplied(bgr, overlay);
}
};  // namespace darkroom
