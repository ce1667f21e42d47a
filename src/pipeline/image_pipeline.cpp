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

#include "pipeline/image_pipeline.hpp"

#include <map>
#include <stdexcept>
#include <utility>

#include "geometry/pixel_ops.hpp"
#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "sizing/target_size.hpp"

namespace reformat {
namespace {
auto LoadSource(const ProcessRequest& request) -> std::shared_ptr<const ByteBuffer> {
  if (request.source_bytes_) return request.source_bytes_;
  if (request.source_path_.empty()) {
    throw std::runtime_error("No source available");
  }
  return ByteBufferLoader::LoadFromPath(request.source_path_);
}

// Orientation, transform and crop, producing the pixels the user saw in the viewer
auto ApplyGeometry(const DecodedImage& decoded, const Transform& transform, const CropSpec& crop)
    -> cv::Mat {
  cv::Mat upright =
      ApplyTransform(decoded.pixels_, ExifOrientationToTransform(decoded.exif_orientation_));

  if (!IsCropActive(crop)) {
    return ApplyTransform(upright, transform);
  }

  // Cropping the matching source region and then transforming it gives the same pixels as
  // transforming first and cropping in view space
  const auto view   = EffectiveDimensions(upright.cols, upright.rows, transform);
  const auto region = InvertCropToSource(crop.rect_, transform, view.width_, view.height_);
  return ApplyTransform(ExtractRegion(upright, region), transform);
}

auto EncodeToTargetSize(ImageCodec& codec, const cv::Mat& pixels, ImageFormat format, int quality,
                        double target_mib, std::vector<std::string>& warnings, cv::Mat& out_pixels)
    -> ByteBuffer {
  std::map<std::pair<int, int>, ByteBuffer> encoded;
  std::map<std::pair<int, int>, cv::Mat>    resized;

  auto encode_size = [&](int width, int height, int q) -> byte_size_t {
    const auto key = std::make_pair(width, height);
    auto       it  = encoded.find(key);
    if (it != encoded.end()) return it->second.size();
    cv::Mat scaled = ResizeArea(pixels, width, height);
    auto    bytes  = codec.Encode(scaled, format, q);
    const auto size = bytes.size();
    encoded.emplace(key, std::move(bytes));
    resized.emplace(key, std::move(scaled));
    return size;
  };

  const auto result = TargetSize::FindTargetSize(
      TargetSize::Options{.source_width_  = pixels.cols,
                          .source_height_ = pixels.rows,
                          .target_mib_    = target_mib,
                          .quality_       = quality},
      encode_size);
  if (result.warning_) warnings.push_back(*result.warning_);

  const auto key = std::make_pair(result.width_, result.height_);
  if (encoded.find(key) == encoded.end()) {
    encode_size(result.width_, result.height_, quality);
  }
  out_pixels = resized.at(key);
  return std::move(encoded.at(key));
}
}  // namespace

ImagePipeline::ImagePipeline(std::shared_ptr<ImageCodec> codec) : codec_(std::move(codec)) {
  if (!codec_) {
    throw std::runtime_error("[ERROR] ImagePipeline: codec is null");
  }
}

auto ImagePipeline::Process(const ProcessRequest& request) const -> ProcessResult {
  ProcessResult result;
  result.output_path_ = request.destination_;

  try {
    const auto   source  = LoadSource(request);
    DecodedImage decoded = codec_->Decode(*source);

    cv::Mat      working = ApplyGeometry(decoded, request.transform_, request.crop_);

    const bool   has_alpha =
        request.declared_alpha_.value_or(HasAlphaChannel(decoded.pixels_));
    const ImageFormat source_format = request.declared_format_.value_or(decoded.format_);
    const auto        resolution =
        request.resolved_format_.value_or(
            ResolveOutputFormat(request.output_format_, source_format, has_alpha));
    if (resolution.source_converted_) {
      result.warnings_.emplace_back(kGifConvertedWarning);
    }
    if (resolution.alpha_switched_) {
      result.warnings_.emplace_back(kTransparencySwitchWarning);
    }
    result.output_format_  = resolution.format_;
    result.alpha_switched_ = resolution.alpha_switched_;

    if (auto target = ComputeTargetDimensions({working.cols, working.rows}, request.resize_)) {
      working = ResizeArea(working, target->width_, target->height_);
    }

    const bool keep_alpha = FormatSupportsAlpha(resolution.format_) && HasAlphaChannel(working);
    working               = NormalizeToStandardRGB(working, keep_alpha);

    ThrowIfCancelled(request.cancellation_token_);

    const int  quality    = QualityFor(resolution.format_, request.quality_);
    ByteBuffer encoded;
    if (const auto* target_size = std::get_if<TargetSizeResize>(&request.resize_)) {
      cv::Mat final_pixels;
      encoded = EncodeToTargetSize(*codec_, working, resolution.format_, quality,
                                   target_size->target_mib_, result.warnings_, final_pixels);
      working = final_pixels;
    } else {
      encoded = codec_->Encode(working, resolution.format_, quality);
    }

    // Last point at which the run can be abandoned without leaving a file behind
    ThrowIfCancelled(request.cancellation_token_);

    ImageWriter::WriteBytesToPath(request.destination_, encoded);

    result.success_       = true;
    result.output_bytes_  = encoded.size();
    result.output_width_  = working.cols;
    result.output_height_ = working.rows;
  } catch (const CancellationError& e) {
    result.canceled_ = true;
    result.error_    = e.what();
  } catch (const std::exception& e) {
    result.error_ = e.what();
  } catch (...) {
    result.error_ = "Unknown pipeline error";
  }
  return result;
}
};  // namespace reformat
