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
#include <mutex>
#include <unordered_map>

#include "io/image/image_codec.hpp"
#include "type/type.hpp"

namespace reformat {
/**
 * @brief Supplies the bytes of in-memory items (clipboard captures) by item id.
 */
class SourceBufferStore {
 public:
  virtual ~SourceBufferStore() = default;
  // nullptr when no buffer is held for the id
  virtual auto Fetch(const item_id_t& id) const -> std::shared_ptr<const ByteBuffer> = 0;
};

class InMemoryBufferStore final : public SourceBufferStore {
 private:
  mutable std::mutex                                                mtx_;
  std::unordered_map<item_id_t, std::shared_ptr<const ByteBuffer>> buffers_;

 public:
  void Put(const item_id_t& id, ByteBuffer bytes);
  void Remove(const item_id_t& id);
  auto Size() const -> size_t;
  auto Fetch(const item_id_t& id) const -> std::shared_ptr<const ByteBuffer> override;
};
};  // namespace reformat
