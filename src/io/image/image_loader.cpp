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

#include "io/image/image_loader.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "geometry/pixel_ops.hpp"

namespace reformat {
auto ByteBufferLoader::LoadFromPath(const image_path_t& path) -> std::shared_ptr<ByteBuffer> {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open source file " + path.string());
  }
  const std::streamsize file_size = file.tellg();
  if (file_size < 0) {
    throw std::runtime_error("Cannot determine size of " + path.string());
  }
  file.seekg(0, std::ios::beg);
  auto buffer = std::make_shared<ByteBuffer>(static_cast<size_t>(file_size));
  if (file_size > 0 && !file.read(reinterpret_cast<char*>(buffer->data()), file_size)) {
    throw std::runtime_error("Cannot read source file " + path.string());
  }
  return buffer;
}

auto ProbeFileItem(const item_id_t& id, const image_path_t& path, ImageCodec& codec) -> Item {
  auto  bytes   = ByteBufferLoader::LoadFromPath(path);
  auto  decoded = codec.Decode(*bytes);

  Item  item;
  item.id_            = id;
  item.origin_        = ItemOrigin::FILE;
  item.source_path_   = path;
  item.original_name_ = path.filename().string();
  item.bytes_         = bytes->size();
  item.format_        = decoded.format_;
  item.has_alpha_     = HasAlphaChannel(decoded.pixels_);

  // Report the upright size, which is what the user sees
  const auto upright  = EffectiveDimensions(decoded.pixels_.cols, decoded.pixels_.rows,
                                            ExifOrientationToTransform(decoded.exif_orientation_));
  item.width_         = upright.width_;
  item.height_        = upright.height_;
  return item;
}
};  // namespace reformat
