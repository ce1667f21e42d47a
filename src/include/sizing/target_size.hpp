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

#include <functional>
#include <optional>
#include <string>

#include "geometry/transform.hpp"
#include "type/type.hpp"

namespace reformat {
namespace TargetSize {
inline constexpr int    kMinDimension   = 48;
inline constexpr double kTolerance      = 0.10;
inline constexpr double kMinScale       = 0.01;
inline constexpr int    kMaxIterations  = 20;
inline constexpr double kScaleEpsilon   = 0.001;

struct Options {
  int    source_width_  = 0;
  int    source_height_ = 0;
  double target_mib_    = 0.0;
  int    quality_       = 85;
};

struct Result {
  bool                       success_    = false;
  int                        width_      = 0;
  int                        height_     = 0;
  byte_size_t                bytes_      = 0;
  double                     scale_      = 1.0;
  std::optional<std::string> warning_;
  int                        iterations_ = 0;
};

// Encoded size in bytes for the image scaled to width x height at the given quality
using EncodeSizeFn = std::function<byte_size_t(int width, int height, int quality)>;

auto IsWithinTolerance(byte_size_t actual_bytes, byte_size_t target_bytes) -> bool;
auto IsAtMinDimension(int width, int height) -> bool;

/**
 * @brief Scaled dimensions with each side kept at or above kMinDimension, but never above the
 * source side itself.
 */
auto CalculateScaledDimensions(int source_width, int source_height, double scale) -> Dimensions;

auto EstimateBytesPerPixel(int quality) -> double;
auto EstimateFileSize(int width, int height, int quality) -> byte_size_t;
auto EstimateScaleForTarget(int source_width, int source_height, double target_mib, int quality)
    -> double;

/**
 * @brief Binary search over the scale factor until the encoded size lands within
 * kTolerance of the target.
 *
 * The oracle is called at most kMaxIterations times. When the target cannot be reached, the
 * largest result under the upper tolerance bound is returned with success_ == false and a
 * "Closest achievable" warning.
 */
auto FindTargetSize(const Options& options, const EncodeSizeFn& encode_size) -> Result;
};  // namespace TargetSize
};  // namespace reformat
