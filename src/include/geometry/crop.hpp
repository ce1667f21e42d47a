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

#include <optional>
#include <string>
#include <string_view>

#include "geometry/transform.hpp"

namespace reformat {
inline constexpr float kMinCropExtent = 0.01f;
inline constexpr float kFullCropEpsilon = 0.001f;

// Crop rectangle in [0, 1] relative to the transformed image the user sees
struct NormalizedCropRect {
  float x_ = 0.0f;
  float y_ = 0.0f;
  float w_ = 1.0f;
  float h_ = 1.0f;

  bool  operator==(const NormalizedCropRect&) const = default;
};

struct PixelRect {
  int  left_   = 0;
  int  top_    = 0;
  int  width_  = 0;
  int  height_ = 0;

  bool operator==(const PixelRect&) const = default;
};

enum class CropRatioPreset {
  ORIGINAL,
  FREE,
  RATIO_1_1,
  RATIO_4_5,
  RATIO_3_4,
  RATIO_9_16,
  RATIO_16_9,
  RATIO_2_3,
  RATIO_3_2
};

enum class CropAnchor { CENTER, TOP_LEFT, TOP_RIGHT, BOTTOM_LEFT, BOTTOM_RIGHT };

struct CropSpec {
  bool               active_ = false;
  CropRatioPreset    preset_ = CropRatioPreset::ORIGINAL;
  NormalizedCropRect rect_;
};

auto ClampCropRect(NormalizedCropRect rect) -> NormalizedCropRect;
auto IsFullCropRect(const NormalizedCropRect& rect) -> bool;
auto IsCropActive(const CropSpec& crop) -> bool;
auto CropRectsEqual(const NormalizedCropRect& a, const NormalizedCropRect& b,
                    float epsilon = 0.0001f) -> bool;

/**
 * @brief Pixel rectangle for a normalized rect on an untransformed image of the given size.
 */
auto NormalizedToPixelCrop(const NormalizedCropRect& rect, int width, int height) -> PixelRect;

/**
 * @brief Map a crop drawn on the transformed view back onto the untransformed source.
 *
 * Flips are undone first, then each clockwise quarter turn is undone in turn. The result is
 * rounded and clamped to the source bounds, so the full unit rect maps to the full source under
 * every transform.
 *
 * @param rect crop relative to the transformed view
 * @param transform transform that produced the view
 * @param eff_width view width in pixels
 * @param eff_height view height in pixels
 * @return PixelRect in source coordinates
 */
auto InvertCropToSource(const NormalizedCropRect& rect, const Transform& transform, int eff_width,
                        int eff_height) -> PixelRect;

// Same as InvertCropToSource, starting from the source dimensions
auto MapCropToSource(const NormalizedCropRect& rect, const Transform& transform, int src_width,
                     int src_height) -> PixelRect;

auto AspectRatioForPreset(CropRatioPreset preset, int original_width = 0,
                          int original_height = 0) -> std::optional<double>;
auto CreateCenteredCropRect(std::optional<double> target_ratio, int image_width,
                            int image_height) -> NormalizedCropRect;
auto AdjustCropToRatio(const NormalizedCropRect& rect, double target_ratio, int image_width,
                       int image_height, CropAnchor anchor = CropAnchor::CENTER)
    -> NormalizedCropRect;

auto CropPresetToString(CropRatioPreset preset) -> std::string;
auto CropPresetFromString(std::string_view name) -> std::optional<CropRatioPreset>;
};  // namespace reformat
