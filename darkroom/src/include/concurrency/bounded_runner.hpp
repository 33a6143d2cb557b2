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

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "concurrency/thread_pool.hpp"

namespace darkroom {
/**
 * @brief Run task over items with at most `limit` tasks in flight.
 *
 * Items are handed to min(limit, n) workers in input order, so uneven per-item cost balances
 * itself. results[i] always corresponds to items[i].
 *
 * The first failing task stops further dispatch; tasks already running finish, then the first
 * exception is rethrown to the caller.
 */
template <typename T, typename Task>
auto RunBounded(const std::vector<T>& items, size_t limit, Task&& task)
    -> std::vector<std::invoke_result_t<Task&, const T&>> {
  using R = std::invoke_result_t<Task&, const T&>;
  if (limit == 0) {
    throw std::invalid_argument("[ERROR] RunBounded: limit must be at least 1");
  }

  if (items.empty()) {
    return {};
  }

  std::vector<std::optional<R>> slots(items.size());
  {
    // FIFO dispatch over min(limit, n) workers keeps at most `limit` tasks in flight
    ThreadPool pool{std::min(limit, items.size())};
    for (size_t i = 0; i < items.size(); ++i) {
      pool.Submit([&, i]() { slots[i].emplace(task(items[i])); });
    }
    pool.Wait();
  }

  std::vector<R> results;
  results.reserve(slots.size());
  for (auto& slot : slots) {
    results.push_back(std::move(*slot));
  }
  return results;
}
};  // namespace darkroom
