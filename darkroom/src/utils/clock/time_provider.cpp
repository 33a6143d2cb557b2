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

#include "utils/clock/time_provider.hpp"

#include <cctype>
#include <ctime>
#include <format>

namespace darkroom {
namespace {
auto ReadNumber(const std::string& s, size_t pos, size_t len, int& out) -> bool {
  if (pos + len > s.size()) return false;
  out = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    out = out * 10 + (s[i] - '0');
  }
  return true;
}
}  // namespace

std::atomic<std::chrono::system_clock::time_point> TimeProvider::cached_sys_time_{
    std::chrono::system_clock::now()};
std::atomic<std::chrono::steady_clock::time_point> TimeProvider::cached_steady_time_{
    std::chrono::steady_clock::now()};

void TimeProvider::Refresh() {
  cached_sys_time_    = std::chrono::system_clock::now();
  cached_steady_time_ = std::chrono::steady_clock::now();
}

auto TimeProvider::Now() -> std::chrono::system_clock::time_point {
  auto elapsed = std::chrono::steady_clock::now() - cached_steady_time_.load();
  return cached_sys_time_.load() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed);
}

auto TimeProvider::ToIsoString(const std::chrono::system_clock::time_point& tp) -> std::string {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm     tm{};
  gmtime_r(&t, &tm);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900,
                     tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                     millis < 0 ? millis + 1000 : millis);
}

auto TimeProvider::FromIsoString(const std::string& iso)
    -> std::optional<std::chrono::system_clock::time_point> {
  // YYYY-MM-DDTHH:MM:SS[.fff]Z
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!ReadNumber(iso, 0, 4, year) || iso.size() < 20 || iso[4] != '-' ||
      !ReadNumber(iso, 5, 2, month) || iso[7] != '-' || !ReadNumber(iso, 8, 2, day) ||
      iso[10] != 'T' || !ReadNumber(iso, 11, 2, hour) || iso[13] != ':' ||
      !ReadNumber(iso, 14, 2, minute) || iso[16] != ':' || !ReadNumber(iso, 17, 2, second)) {
    return std::nullopt;
  }

  size_t pos    = 19;
  int    millis = 0;
  if (iso[pos] == '.') {
    int    digits = 0;
    for (++pos; pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos])); ++pos) {
      if (digits < 3) millis = millis * 10 + (iso[pos] - '0');
      ++digits;
    }
    if (digits == 0) return std::nullopt;
    for (; digits < 3; ++digits) millis *= 10;
  }
  if (pos + 1 != iso.size() || iso[pos] != 'Z') return std::nullopt;

  const std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) return std::nullopt;

  return std::chrono::sys_days{ymd} + std::chrono::hours(hour) + std::chrono::minutes(minute) +
         std::chrono::seconds(second) + std::chrono::milliseconds(millis);
}
}  // namespace darkroom
