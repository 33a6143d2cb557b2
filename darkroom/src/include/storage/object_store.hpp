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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace darkroom {
struct ObjectInfo {
  object_key_t                                         key_{};
  uint64_t                                             size_ = 0;
  std::optional<std::chrono::system_clock::time_point> last_modified_{};
};

struct ObjectHead {
  bool        exists_ = false;
  uint64_t    size_   = 0;
  std::string content_type_{};
};

/**
 * @brief Remote key-value blob store. Implementations own any retry/backoff policy; callers
 * treat a thrown exception as a final failure.
 */
class ObjectStore {
 public:
  static constexpr size_t kDeleteBatchSize = 1000;

  virtual ~ObjectStore()                   = default;

  virtual void Upload(const object_key_t& key, const byte_buffer_t& bytes,
                      const std::string& content_type)                             = 0;

  /**
   * @brief Delete keys; returns how many objects were removed
   */
  virtual auto BatchDelete(const std::vector<object_key_t>& keys) -> size_t        = 0;

  virtual auto List(const std::string& prefix) -> std::vector<ObjectInfo>          = 0;

  virtual auto Head(const object_key_t& key) -> ObjectHead                         = 0;

  /**
   * @brief Immediate "sub-directories" of prefix, each ending with '/'
   */
  virtual auto ListPrefixes(const std::string& prefix) -> std::vector<std::string> = 0;
};
};  // namespace darkroom
