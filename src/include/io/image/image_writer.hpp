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

#include <span>

#include "io/image/image_codec.hpp"
#include "type/type.hpp"

namespace reformat {
class ImageWriter {
 public:
  // Replaces any existing file. Throws std::runtime_error on failure.
  static void WriteBytesToPath(const image_path_t& path, std::span<const uint8_t> bytes);
  // Copy the modification time of source onto target. Throws std::filesystem::filesystem_error.
  static void PreserveTimestamp(const image_path_t& source, const image_path_t& target);
};
};  // namespace reformat
