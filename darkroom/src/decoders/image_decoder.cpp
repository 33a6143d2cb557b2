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

#include "decoders/image_decoder.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <vector>

#include "type/supported_file_type.hpp"
#include "utils/fs/atomic_file.hpp"
#include "utils/profiler/profiler.hpp"

extern char** environ;

namespace darkroom {
namespace {
std::atomic<uint64_t> heif_temp_counter{0};

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}
}  // namespace

auto ImageDecoder::RunExternalTool(const std::vector<std::string>& argv) -> bool {
  if (argv.empty()) {
    return false;
  }
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  // posix_spawn instead of fork: the lanes keep other threads busy while this runs
  posix_spawn_file_actions_t actions;
  if (posix_spawn_file_actions_init(&actions) != 0) {
    return false;
  }
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);

  pid_t     pid = 0;
  const int rc  = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  if (rc != 0) {
    std::cerr << "[WARN] ImageDecoder: Cannot run " << argv[0] << ": " << std::strerror(rc)
              << std::endl;
    return false;
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

auto ImageDecoder::ApplyOrientation(const cv::Mat& img, int orientation) -> cv::Mat {
  cv::Mat out;
  switch (orientation) {
    case 2:
      cv::flip(img, out, 1);
      break;
    case 3:
      cv::rotate(img, out, cv::ROTATE_180);
      break;
    case 4:
      cv::flip(img, out, 0);
      break;
    case 5:
      cv::transpose(img, out);
      break;
    case 6:
      cv::rotate(img, out, cv::ROTATE_90_CLOCKWISE);
      break;
    case 7: {
      cv::Mat transposed;
      cv::transpose(img, transposed);
      cv::rotate(transposed, out, cv::ROTATE_180);
      break;
    }
    case 8:
      cv::rotate(img, out, cv::ROTATE_90_COUNTERCLOCKWISE);
      break;
    default:
      out = img;
  }
  return out;
}

auto ImageDecoder::DecodeOriented(const byte_buffer_t& bytes) -> DecodedImage {
  EASY_BLOCK("ImageDecoder::DecodeOriented");
  if (bytes.empty()) {
    throw DecodeError("[ERROR] ImageDecoder: Empty input buffer");
  }

  cv::Mat raw;
  try {
    raw = cv::imdecode(bytes, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
  } catch (const cv::Exception& e) {
    throw DecodeError(std::format("[ERROR] ImageDecoder: {}", e.what()));
  }
  if (raw.empty()) {
    throw DecodeError("[ERROR] ImageDecoder: Unsupported or corrupt image data");
  }

  DecodedImage decoded;
  decoded.metadata_ = MetadataExtractor::ReadEmbeddedMetadata(bytes.data(), bytes.size());
  decoded.image_    = ApplyOrientation(raw, decoded.metadata_.orientation_);
  return decoded;
}

auto ImageDecoder::DecodeWithFallback(const byte_buffer_t& bytes, const std::string& source_ext)
    -> DecodedImage {
  try {
    return DecodeOriented(bytes);
  } catch (const DecodeError& e) {
    if (!IsHeifExtension(source_ext)) {
      throw;
    }
    std::cerr << "[WARN] ImageDecoder: " << e.what() << ", trying external HEIF conversion"
              << std::endl;
  }

  auto converted = ConvertHeifToJpeg(bytes, source_ext);
  if (!converted) {
    throw HeifDecodeError(source_ext);
  }
  try {
    return DecodeOriented(*converted);
  } catch (const DecodeError&) {
    throw HeifDecodeError(source_ext);
  }
}

auto ImageDecoder::ConvertHeifToJpeg(const byte_buffer_t& bytes, const std::string& source_ext)
    -> std::optional<byte_buffer_t> {
  EASY_BLOCK("ImageDecoder::ConvertHeifToJpeg");
  const std::string ext = source_ext.empty() ? std::string(".heic") : NormalizeExtension(source_ext);
  const auto tmp_dir  = std::filesystem::temp_directory_path();
  const auto stamp    = std::format("darkroom-heif-{}-{}", getpid(), heif_temp_counter++);
  const auto in_path  = tmp_dir / (stamp + ext);
  const auto out_path = tmp_dir / (stamp + ".jpg");

  try {
    WriteFileAtomic(in_path, bytes.data(), bytes.size());
  } catch (const std::runtime_error& e) {
    std::cerr << "[WARN] ImageDecoder: " << e.what() << std::endl;
    return std::nullopt;
  }

#if defined(__APPLE__)
  const std::vector<std::string> argv = {"sips", "-s", "format", "jpeg", in_path.string(),
                                         "--out", out_path.string()};
#else
  const std::vector<std::string> argv = {"heif-convert", "-q", "95", in_path.string(),
                                         out_path.string()};
#endif

  std::optional<byte_buffer_t> result;
  if (RunExternalTool(argv) && std::filesystem::exists(out_path)) {
    try {
      result = ReadFileBytes(out_path);
    } catch (const std::runtime_error& e) {
      std::cerr << "[WARN] ImageDecoder: " << e.what() << std::endl;
    }
  }
  RemoveQuietly(in_path);
  RemoveQuietly(out_path);
  if (result && result->empty()) {
    return std::nullopt;
  }
  return result;
}

auto ImageDecoder::HeifDecodeError(const std::string& source_ext) -> DecodeError {
#if defined(__APPLE__)
  return DecodeError(std::format(
      "[ERROR] ImageDecoder: Cannot decode {} image. The image codec lacks HEIF support and the "
      "sips conversion failed. Open the photo in Preview, re-export it as JPEG and retry.",
      source_ext));
#else
  return DecodeError(std::format(
      "[ERROR] ImageDecoder: Cannot decode {} image. Install libheif support (the heif-convert "
      "tool from libheif-examples), or convert the file to JPEG/PNG and retry.",
      source_ext));
#endif
}
}  // namespace darkroom
