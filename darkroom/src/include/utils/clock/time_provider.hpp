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

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace darkroom {
class TimeProvider {
 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;

  /**
   * @brief UTC ISO-8601 with millisecond precision, e.g. 2026-01-16T21:04:05.000Z
   */
  static auto ToIsoString(const std::chrono::system_clock::time_point& tp) -> std::string;

  /**
   * @brief Inverse of ToIsoString. Fractional seconds are optional; only UTC ("Z") is accepted.
   */
  static auto FromIsoString(const std::string& iso)
      -> std::optional<std::chrono::system_clock::time_point>;

 private:
  static std::atomic<std::chrono::system_clock::time_point> cached_sys_time_;
  static std::atomic<std::chrono::steady_clock::time_point> cached_steady_time_;
};
};  // namespace darkroom
