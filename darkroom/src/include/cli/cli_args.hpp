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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace darkroom {
enum class CliCommand : uint8_t {
  HELP = 0,
  ALBUM,
  TRANSFER,
  MEDIA,
  FOCAL,
  PREVIEW,
  DELETE_ALBUM,
  DELETE_TRANSFER,
  LIST_ALBUMS,
  ALBUM_INFO,
  DELETE_PHOTO,
  SET_COVER,
  LIST_TRANSFERS,
  TRANSFER_INFO,
  DELETE_ALL_TRANSFERS,
  LIST_MEDIA,
  DELETE_MEDIA
};

struct CliOptions {
  CliCommand                 command_ = CliCommand::HELP;
  std::vector<std::string>   positionals_{};

  std::optional<file_path_t> config_path_{};
  bool                       force_   = false;
  bool                       compare_ = false;
  // delete-media: every file of the target
  bool                       all_     = false;
  std::optional<std::string> focal_{};
  std::optional<std::string> strategy_{};

  std::optional<std::string> title_{};
  std::optional<std::string> date_{};
  std::optional<std::string> description_{};
  std::optional<std::string> id_{};
  std::optional<std::string> expires_{};
  // media commands: the shared asset library instead of a word
  std::optional<std::string> asset_{};
};

/**
 * @brief Parse argv without the program name. Flags accept "--name value" and "--name=value".
 *
 * @throws std::invalid_argument with a message that names the offending argument
 */
auto ParseCliArgs(const std::vector<std::string>& args) -> CliOptions;

auto CliUsage() -> std::string;
};  // namespace darkroom
