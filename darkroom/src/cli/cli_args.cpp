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

#include "cli/cli_args.hpp"

#include <format>
#include <map>
#include <stdexcept>
#include <string_view>

namespace darkroom {
namespace {
struct CommandShape {
  CliCommand command_;
  size_t     min_positionals_;
  size_t     max_positionals_;
};

const std::map<std::string, CommandShape>& Commands() {
  static const std::map<std::string, CommandShape> commands = {
      {"album", {CliCommand::ALBUM, 2, 2}},
      {"transfer", {CliCommand::TRANSFER, 1, 1}},
      {"media", {CliCommand::MEDIA, 1, 2}},
      {"focal", {CliCommand::FOCAL, 1, 1}},
      {"preview", {CliCommand::PREVIEW, 2, 2}},
      {"delete-album", {CliCommand::DELETE_ALBUM, 1, 1}},
      {"delete-transfer", {CliCommand::DELETE_TRANSFER, 1, 1}},
      {"list-albums", {CliCommand::LIST_ALBUMS, 0, 0}},
      {"album-info", {CliCommand::ALBUM_INFO, 1, 1}},
      {"delete-photo", {CliCommand::DELETE_PHOTO, 2, 2}},
      {"set-cover", {CliCommand::SET_COVER, 2, 2}},
      {"list-transfers", {CliCommand::LIST_TRANSFERS, 0, 0}},
      {"transfer-info", {CliCommand::TRANSFER_INFO, 1, 1}},
      {"delete-all-transfers", {CliCommand::DELETE_ALL_TRANSFERS, 0, 0}},
      {"list-media", {CliCommand::LIST_MEDIA, 1, 1}},
      {"delete-media", {CliCommand::DELETE_MEDIA, 2, 2}},
      {"help", {CliCommand::HELP, 0, 0}}};
  return commands;
}

auto UsageError(const std::string& message) -> std::invalid_argument {
  return std::invalid_argument(std::format("[ERROR] CLI: {}\n\n{}", message, CliUsage()));
}
}  // namespace

auto CliUsage() -> std::string {
  return "usage: darkroom <command> [options]\n"
         "\n"
         "commands:\n"
         "  album <dir> <slug> --title T [--date D] [--description S] [--focal F] [--force]\n"
         "  transfer <dir> --title T [--id ID] [--expires 7d] [--force]\n"
         "  media <dir> <word-slug> [--force]\n"
         "  media <dir> --asset <id> [--force]\n"
         "  focal <image> [--strategy onnx|saliency] [--compare]\n"
         "  preview <image> <out.jpg> [--focal F] [--title T] [--id ID]\n"
         "  delete-album <slug>\n"
         "  delete-transfer <id>\n"
         "  list-albums\n"
         "  album-info <slug>\n"
         "  delete-photo <slug> <photo-id>\n"
         "  set-cover <slug> <photo-id>\n"
         "  list-transfers\n"
         "  transfer-info <id>\n"
         "  delete-all-transfers --force\n"
         "  list-media <word-slug> | --asset <id>\n"
         "  delete-media <word-slug> <filename> | --asset <id> <filename>\n"
         "  delete-media <word-slug> --all | --asset <id> --all\n"
         "\n"
         "global options:\n"
         "  --config <file>   settings file (default: $DARKROOM_CONFIG, then the built-in)\n"
         "  --strategy <name> focal strategy for album runs, or \"none\"\n"
         "\n"
         "focal values: center, top, bottom, top left, top right, bottom left, bottom right,\n"
         "their shorthands (c, t, b, tl, tr, bl, br) or \"x,y\" percentages.\n";
}

auto ParseCliArgs(const std::vector<std::string>& args) -> CliOptions {
  CliOptions options;
  if (args.empty()) {
    return options;
  }
  if (args.front() == "--help" || args.front() == "-h") {
    return options;
  }

  const auto command_it = Commands().find(args.front());
  if (command_it == Commands().end()) {
    throw UsageError(std::format("unknown command \"{}\"", args.front()));
  }
  const CommandShape shape = command_it->second;
  options.command_         = shape.command_;

  const std::map<std::string, std::optional<std::string> CliOptions::*> value_flags = {
      {"--focal", &CliOptions::focal_},       {"--strategy", &CliOptions::strategy_},
      {"--title", &CliOptions::title_},       {"--date", &CliOptions::date_},
      {"--description", &CliOptions::description_},
      {"--id", &CliOptions::id_},             {"--expires", &CliOptions::expires_},
      {"--asset", &CliOptions::asset_}};
  const std::map<std::string, bool CliOptions::*> bool_flags = {
      {"--force", &CliOptions::force_},
      {"--compare", &CliOptions::compare_},
      {"--all", &CliOptions::all_}};

  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.rfind("--", 0) != 0) {
      options.positionals_.push_back(arg);
      continue;
    }

    std::string                name = arg;
    std::optional<std::string> inline_value;
    if (const auto eq = arg.find('='); eq != std::string::npos) {
      name         = arg.substr(0, eq);
      inline_value = arg.substr(eq + 1);
    }

    const auto bool_it = bool_flags.find(name);
    if (bool_it != bool_flags.end()) {
      if (inline_value.has_value()) {
        throw UsageError(std::format("{} does not take a value", name));
      }
      options.*(bool_it->second) = true;
      continue;
    }

    auto take_value = [&]() -> std::string {
      if (inline_value.has_value()) return *inline_value;
      if (i + 1 >= args.size()) {
        throw UsageError(std::format("{} needs a value", name));
      }
      return args[++i];
    };

    if (name == "--config") {
      options.config_path_ = file_path_t(take_value());
      continue;
    }
    const auto flag_it = value_flags.find(name);
    if (flag_it == value_flags.end()) {
      throw UsageError(std::format("unknown option \"{}\"", name));
    }
    options.*(flag_it->second) = take_value();
  }

  size_t min_positionals = shape.min_positionals_;
  size_t max_positionals = shape.max_positionals_;
  if (options.command_ == CliCommand::MEDIA || options.command_ == CliCommand::LIST_MEDIA ||
      options.command_ == CliCommand::DELETE_MEDIA) {
    // --asset <id> replaces the word slug; --all replaces the filename
    size_t expected = shape.max_positionals_;
    if (options.asset_.has_value()) --expected;
    if (options.command_ == CliCommand::DELETE_MEDIA && options.all_) --expected;
    min_positionals = max_positionals = expected;
  }
  if (options.positionals_.size() < min_positionals ||
      options.positionals_.size() > max_positionals) {
    throw UsageError(std::format("\"{}\" expects {} argument(s), got {}", args.front(),
                                 min_positionals == max_positionals
                                     ? std::to_string(min_positionals)
                                     : std::format("{}-{}", min_positionals, max_positionals),
                                 options.positionals_.size()));
  }

  if ((options.command_ == CliCommand::ALBUM || options.command_ == CliCommand::TRANSFER) &&
      !options.title_.has_value()) {
    throw UsageError(std::format("\"{}\" requires --title", args.front()));
  }
  if (options.all_ && options.command_ != CliCommand::DELETE_MEDIA) {
    throw UsageError(std::format("--all is not an option of \"{}\"", args.front()));
  }
  if (options.command_ == CliCommand::DELETE_ALL_TRANSFERS && !options.force_) {
    throw UsageError("delete-all-transfers removes every transfer; pass --force to confirm");
  }
  return options;
}
};  // namespace darkroom
