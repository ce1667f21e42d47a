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
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "type/image_format.hpp"

namespace reformat {
using ByteBuffer = std::vector<uint8_t>;

struct DecodedImage {
  // 1-4 channels in OpenCV channel order (BGR/BGRA), any depth
  cv::Mat     pixels_;
  ImageFormat format_           = ImageFormat::UNKNOWN;
  // EXIF orientation tag, 1 when absent
  int         exif_orientation_ = 1;
};

/**
 * @brief Decode/encode backend used by the image pipeline. Implementations throw
 * std::runtime_error with a readable message on failure.
 */
class ImageCodec {
 public:
  virtual ~ImageCodec() = default;

  virtual auto Decode(std::span<const uint8_t> bytes) -> DecodedImage = 0;
  /**
   * @brief Encode 8-bit BGR or BGRA pixels
   *
   * @param quality 40-100, ignored by formats without a quality setting
   */
  virtual auto Encode(const cv::Mat& pixels, ImageFormat format, int quality) -> ByteBuffer = 0;
};
};  // namespace reformat
