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
#include <vector>

#include "io/image/image_codec.hpp"
#include "model/item.hpp"
#include "type/type.hpp"

namespace reformat {
class ByteBufferLoader {
 public:
  // Whole file contents; throws std::runtime_error when the file cannot be read
  static auto LoadFromPath(const image_path_t& path) -> std::shared_ptr<ByteBuffer>;
};

/**
 * @brief Build a FILE item for the given path by decoding it once to learn its pixel size,
 * format and alpha flag.
 */
auto ProbeFileItem(const item_id_t& id, const image_path_t& path, ImageCodec& codec) -> Item;
};  // namespace reformat
