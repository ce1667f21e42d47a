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

#include "io/image/image_codec.hpp"

namespace reformat {
/**
 * @brief Codec backed by OpenCV, OpenImageIO and Exiv2.
 *
 * Decoding goes through cv::imdecode and falls back to OpenImageIO for containers OpenCV does
 * not read (HEIC/HEIF). Encoding tries OpenImageIO first and falls back to cv::imencode.
 * The EXIF orientation is read with Exiv2 and left for the caller to apply.
 */
class ImageCodecImpl final : public ImageCodec {
 public:
  auto Decode(std::span<const uint8_t> bytes) -> DecodedImage override;
  auto Encode(const cv::Mat& pixels, ImageFormat format, int quality) -> ByteBuffer override;

  static auto ReadExifOrientation(std::span<const uint8_t> bytes) -> int;
};
};  // namespace reformat
