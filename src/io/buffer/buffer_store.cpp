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

#include "io/buffer/buffer_store.hpp"

#include <utility>

namespace reformat {
void InMemoryBufferStore::Put(const item_id_t& id, ByteBuffer bytes) {
  auto shared = std::make_shared<const ByteBuffer>(std::move(bytes));
  std::lock_guard<std::mutex> lock(mtx_);
  buffers_[id] = std::move(shared);
}

void InMemoryBufferStore::Remove(const item_id_t& id) {
  std::lock_guard<std::mutex> lock(mtx_);
  buffers_.erase(id);
}

auto InMemoryBufferStore::Size() const -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return buffers_.size();
}

auto InMemoryBufferStore::Fetch(const item_id_t& id) const -> std::shared_ptr<const ByteBuffer> {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return nullptr;
  return it->second;
}
};  // namespace reformat
