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

#include "io/image/image_writer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace reformat {
void ImageWriter::WriteBytesToPath(const image_path_t& path, std::span<const uint8_t> bytes) {
  if (path.empty()) {
    throw std::runtime_error("ImageWriter: export path is empty");
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("ImageWriter: cannot open " + path.string() + " for writing");
  }
  file.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) {
    throw std::runtime_error("ImageWriter: failed to write " + path.string());
  }
}

void ImageWriter::PreserveTimestamp(const image_path_t& source, const image_path_t& target) {
  const auto time = std::filesystem::last_write_time(source);
  std::filesystem::last_write_time(target, time);
}
};  // namespace reformat
