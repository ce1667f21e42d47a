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
#include <optional>
#include <string>
#include <vector>

#include "concurrency/cancellation_token.hpp"
#include "geometry/crop.hpp"
#include "geometry/transform.hpp"
#include "io/image/image_codec.hpp"
#include "sizing/resize_spec.hpp"
#include "type/image_format.hpp"
#include "type/type.hpp"

namespace reformat {
struct ProcessRequest {
  // In-memory source; when null the file at source_path_ is read
  std::shared_ptr<const ByteBuffer>  source_bytes_;
  image_path_t                       source_path_;
  image_path_t                       destination_;

  Transform                          transform_;
  CropSpec                           crop_;
  ResizeSpec                         resize_ = PixelResize{};
  OutputFormat                       output_format_ = OutputFormat::SAME;
  QualitySpec                        quality_;

  // Format and alpha recorded at import; detected from the pixels when unset
  std::optional<ImageFormat>         declared_format_;
  std::optional<bool>                declared_alpha_;
  // Output format already bound to destination_'s extension; resolved here when unset
  std::optional<FormatResolution>    resolved_format_;

  std::shared_ptr<CancellationToken> cancellation_token_;
};

struct ProcessResult {
  bool                     success_        = false;
  bool                     canceled_       = false;
  image_path_t             output_path_;
  byte_size_t              output_bytes_   = 0;
  int                      output_width_   = 0;
  int                      output_height_  = 0;
  ImageFormat              output_format_  = ImageFormat::UNKNOWN;
  bool                     alpha_switched_ = false;
  std::string              error_;
  std::vector<std::string> warnings_;
};

/**
 * @brief Turns one source image into one encoded output file.
 *
 * The order of operations is fixed: EXIF auto-orientation, the user transform, crop (mapped back
 * to source pixels and extracted before the transform is applied to the region), resize without
 * enlarging, conversion to 8-bit sRGB, encode, write. Process never throws; failures come back
 * as success_ == false with a message and the warnings gathered so far.
 */
class ImagePipeline {
 private:
  std::shared_ptr<ImageCodec> codec_;

 public:
  explicit ImagePipeline(std::shared_ptr<ImageCodec> codec);

  auto Process(const ProcessRequest& request) const -> ProcessResult;
};
};  // namespace reformat
