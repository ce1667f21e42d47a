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

#include "sizing/target_size.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include "utils/bytes/bytes.hpp"

namespace reformat {
namespace TargetSize {
namespace {
auto UpperBound(byte_size_t target_bytes) -> double {
  return static_cast<double>(target_bytes) * (1.0 + kTolerance);
}

auto LowerBound(byte_size_t target_bytes) -> double {
  return static_cast<double>(target_bytes) * (1.0 - kTolerance);
}
}  // namespace

auto IsWithinTolerance(byte_size_t actual_bytes, byte_size_t target_bytes) -> bool {
  const double actual = static_cast<double>(actual_bytes);
  return actual >= LowerBound(target_bytes) && actual <= UpperBound(target_bytes);
}

auto IsAtMinDimension(int width, int height) -> bool {
  return width <= kMinDimension || height <= kMinDimension;
}

auto CalculateScaledDimensions(int source_width, int source_height, double scale) -> Dimensions {
  auto scale_side = [scale](int side) {
    const int scaled = static_cast<int>(std::lround(side * scale));
    return std::min(side, std::max(kMinDimension, scaled));
  };
  return {scale_side(source_width), scale_side(source_height)};
}

auto EstimateBytesPerPixel(int quality) -> double {
  // Roughly 0.1 bytes per pixel at quality 40 up to 0.8 at quality 100
  constexpr double min_bpp    = 0.10;
  constexpr double max_bpp    = 0.80;
  const double     normalized = (std::clamp(quality, 40, 100) - 40) / 60.0;
  return min_bpp + normalized * (max_bpp - min_bpp);
}

auto EstimateFileSize(int width, int height, int quality) -> byte_size_t {
  const double pixels = static_cast<double>(width) * static_cast<double>(height);
  return static_cast<byte_size_t>(std::llround(pixels * EstimateBytesPerPixel(quality)));
}

auto EstimateScaleForTarget(int source_width, int source_height, double target_mib, int quality)
    -> double {
  const double source_pixels = static_cast<double>(source_width) * source_height;
  if (source_pixels <= 0.0 || target_mib <= 0.0) return 1.0;
  const double target_pixels =
      static_cast<double>(Bytes::MiBToBytes(target_mib)) / EstimateBytesPerPixel(quality);
  return std::clamp(std::sqrt(target_pixels / source_pixels), kMinScale, 1.0);
}

auto FindTargetSize(const Options& options, const EncodeSizeFn& encode_size) -> Result {
  const int src_w = options.source_width_;
  const int src_h = options.source_height_;

  if (!(options.target_mib_ > 0.0)) {
    return Result{.success_    = false,
                  .width_      = src_w,
                  .height_     = src_h,
                  .bytes_      = 0,
                  .scale_      = 1.0,
                  .warning_    = "Target size must be greater than 0",
                  .iterations_ = 0};
  }

  const byte_size_t target_bytes   = Bytes::MiBToBytes(options.target_mib_);
  const byte_size_t original_bytes = encode_size(src_w, src_h, options.quality_);
  int               iterations     = 1;

  if (IsWithinTolerance(original_bytes, target_bytes)) {
    return Result{.success_    = true,
                  .width_      = src_w,
                  .height_     = src_h,
                  .bytes_      = original_bytes,
                  .scale_      = 1.0,
                  .warning_    = std::nullopt,
                  .iterations_ = iterations};
  }
  if (static_cast<double>(original_bytes) < LowerBound(target_bytes)) {
    return Result{.success_    = true,
                  .width_      = src_w,
                  .height_     = src_h,
                  .bytes_      = original_bytes,
                  .scale_      = 1.0,
                  .warning_    = std::format("Original image ({}) is smaller than target",
                                             Bytes::FormatMiB(original_bytes)),
                  .iterations_ = iterations};
  }

  double                low_scale  = kMinScale;
  double                high_scale = 1.0;
  std::optional<Result> best;

  while (iterations < kMaxIterations) {
    const double mid_scale = (low_scale + high_scale) / 2.0;
    const auto   dims      = CalculateScaledDimensions(src_w, src_h, mid_scale);
    const bool   at_min    = IsAtMinDimension(dims.width_, dims.height_);

    const auto   bytes     = encode_size(dims.width_, dims.height_, options.quality_);
    ++iterations;

    if (static_cast<double>(bytes) <= UpperBound(target_bytes) && (!best || bytes > best->bytes_)) {
      best = Result{.success_    = false,
                    .width_      = dims.width_,
                    .height_     = dims.height_,
                    .bytes_      = bytes,
                    .scale_      = mid_scale,
                    .warning_    = std::nullopt,
                    .iterations_ = 0};
    }

    if (IsWithinTolerance(bytes, target_bytes)) {
      return Result{.success_    = true,
                    .width_      = dims.width_,
                    .height_     = dims.height_,
                    .bytes_      = bytes,
                    .scale_      = mid_scale,
                    .warning_    = std::nullopt,
                    .iterations_ = iterations};
    }

    // Nothing smaller can be tried
    if (at_min && static_cast<double>(bytes) > UpperBound(target_bytes)) {
      return Result{.success_ = false,
                    .width_   = dims.width_,
                    .height_  = dims.height_,
                    .bytes_   = bytes,
                    .scale_   = mid_scale,
                    .warning_ = std::format(
                        "Closest achievable: {} at minimum size {}x{} (target {})",
                        Bytes::FormatMiB(bytes), dims.width_, dims.height_,
                        Bytes::FormatMiB(target_bytes)),
                    .iterations_ = iterations};
    }

    if (bytes > target_bytes) {
      high_scale = mid_scale;
    } else {
      low_scale = mid_scale;
    }
    if (high_scale - low_scale < kScaleEpsilon) break;
  }

  if (best) {
    best->iterations_ = iterations;
    best->success_    = IsWithinTolerance(best->bytes_, target_bytes);
    if (!best->success_) {
      best->warning_ = std::format("Closest achievable: {} (target {})",
                                   Bytes::FormatMiB(best->bytes_), Bytes::FormatMiB(target_bytes));
    }
    return *best;
  }

  return Result{.success_    = false,
                .width_      = src_w,
                .height_     = src_h,
                .bytes_      = original_bytes,
                .scale_      = 1.0,
                .warning_    = "Closest achievable: no scale produced a usable size",
                .iterations_ = iterations};
}
};  // namespace TargetSize
};  // namespace reformat
