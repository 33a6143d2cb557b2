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

#include "storage/object_store.hpp"

namespace darkroom {
/**
 * @brief Bucket backed by a local directory: key "a/b/c.webp" lives at <root>/a/b/c.webp.
 * The uploaded content type is kept in a hidden sidecar, <root>/a/b/.c.webp.content-type.
 * Objects uploaded without one report the type implied by their extension.
 */
class LocalObjectStore final : public ObjectStore {
 public:
  explicit LocalObjectStore(file_path_t root);

  void Upload(const object_key_t& key, const byte_buffer_t& bytes,
              const std::string& content_type) override;
  auto BatchDelete(const std::vector<object_key_t>& keys) -> size_t override;
  auto List(const std::string& prefix) -> std::vector<ObjectInfo> override;
  auto Head(const object_key_t& key) -> ObjectHead override;
  auto ListPrefixes(const std::string& prefix) -> std::vector<std::string> override;

  auto Root() const -> const file_path_t& { return root_; }

 private:
  auto PathForKey(const object_key_t& key) const -> file_path_t;
  void PruneEmptyParents(const file_path_t& removed) const;

  file_path_t root_;
};
};  // namespace darkroom
