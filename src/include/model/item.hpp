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
#include <string>

#include "type/image_format.hpp"
#include "type/type.hpp"

namespace reformat {
enum class ItemOrigin { FILE, MEMORY_BUFFER };

/**
 * @brief One image handed to a run. For MEMORY_BUFFER items the bytes are looked up by id_ in a
 * SourceBufferStore.
 */
struct Item {
  item_id_t    id_;
  ItemOrigin   origin_ = ItemOrigin::FILE;
  image_path_t source_path_;
  file_name_t  original_name_;
  byte_size_t  bytes_     = 0;
  int          width_     = 0;
  int          height_    = 0;
  ImageFormat  format_    = ImageFormat::UNKNOWN;
  bool         has_alpha_ = false;

  auto         IsFile() const -> bool { return origin_ == ItemOrigin::FILE; }
};
};  // namespace reformat
