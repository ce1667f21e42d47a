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

#include "geometry/crop.hpp"

#include <algorithm>
#include <cmath>

namespace reformat {
namespace {
struct RectD {
  double left_;
  double top_;
  double width_;
  double height_;
};

auto RoundAndClamp(const RectD& rect, int src_width, int src_height) -> PixelRect {
  PixelRect out;
  out.left_   = std::clamp(static_cast<int>(std::lround(rect.left_)), 0, std::max(src_width - 1, 0));
  out.top_    = std::clamp(static_cast<int>(std::lround(rect.top_)), 0, std::max(src_height - 1, 0));
  out.width_  = std::clamp(static_cast<int>(std::lround(rect.width_)), 1,
                           std::max(src_width - out.left_, 1));
  out.height_ = std::clamp(static_cast<int>(std::lround(rect.height_)), 1,
                           std::max(src_height - out.top_, 1));
  return out;
}
}  // namespace

auto ClampCropRect(NormalizedCropRect rect) -> NormalizedCropRect {
  if (!std::isfinite(rect.x_)) rect.x_ = 0.0f;
  if (!std::isfinite(rect.y_)) rect.y_ = 0.0f;
  if (!std::isfinite(rect.w_)) rect.w_ = 1.0f;
  if (!std::isfinite(rect.h_)) rect.h_ = 1.0f;
  rect.w_ = std::clamp(rect.w_, kMinCropExtent, 1.0f);
  rect.h_ = std::clamp(rect.h_, kMinCropExtent, 1.0f);
  rect.x_ = std::clamp(rect.x_, 0.0f, 1.0f - rect.w_);
  rect.y_ = std::clamp(rect.y_, 0.0f, 1.0f - rect.h_);
  return rect;
}

auto IsFullCropRect(const NormalizedCropRect& rect) -> bool {
  return std::abs(rect.x_) < kFullCropEpsilon && std::abs(rect.y_) < kFullCropEpsilon &&
         std::abs(rect.w_ - 1.0f) < kFullCropEpsilon &&
         std::abs(rect.h_ - 1.0f) < kFullCropEpsilon;
}

auto IsCropActive(const CropSpec& crop) -> bool {
  return crop.active_ && !IsFullCropRect(crop.rect_);
}

auto CropRectsEqual(const NormalizedCropRect& a, const NormalizedCropRect& b, float epsilon)
    -> bool {
  return std::abs(a.x_ - b.x_) < epsilon && std::abs(a.y_ - b.y_) < epsilon &&
         std::abs(a.w_ - b.w_) < epsilon && std::abs(a.h_ - b.h_) < epsilon;
}

auto NormalizedToPixelCrop(const NormalizedCropRect& rect, int width, int height) -> PixelRect {
  const auto clamped = ClampCropRect(rect);
  return RoundAndClamp({static_cast<double>(clamped.x_) * width,
                        static_cast<double>(clamped.y_) * height,
                        static_cast<double>(clamped.w_) * width,
                        static_cast<double>(clamped.h_) * height},
                       width, height);
}

auto InvertCropToSource(const NormalizedCropRect& rect, const Transform& transform, int eff_width,
                        int eff_height) -> PixelRect {
  const auto clamped = ClampCropRect(rect);
  RectD      r{static_cast<double>(clamped.x_) * eff_width,
          static_cast<double>(clamped.y_) * eff_height, static_cast<double>(clamped.w_) * eff_width,
          static_cast<double>(clamped.h_) * eff_height};

  // Flips were applied after rotation, so they are undone first
  if (transform.flip_h_) r.left_ = eff_width - r.left_ - r.width_;
  if (transform.flip_v_) r.top_ = eff_height - r.top_ - r.height_;

  // Each step undoes one clockwise quarter turn; the space shrinks from (cur_w, cur_h) to
  // (cur_h, cur_w)
  double cur_w = eff_width;
  double cur_h = eff_height;
  for (int i = 0; i < transform.Steps(); ++i) {
    r = RectD{r.top_, cur_w - r.left_ - r.width_, r.height_, r.width_};
    std::swap(cur_w, cur_h);
  }

  const auto source = EffectiveDimensions(eff_width, eff_height, transform);
  return RoundAndClamp(r, source.width_, source.height_);
}

auto MapCropToSource(const NormalizedCropRect& rect, const Transform& transform, int src_width,
                     int src_height) -> PixelRect {
  const auto view = EffectiveDimensions(src_width, src_height, transform);
  return InvertCropToSource(rect, transform, view.width_, view.height_);
}

auto AspectRatioForPreset(CropRatioPreset preset, int original_width, int original_height)
    -> std::optional<double> {
  switch (preset) {
    case CropRatioPreset::ORIGINAL:
      if (original_width > 0 && original_height > 0) {
        return static_cast<double>(original_width) / original_height;
      }
      return std::nullopt;
    case CropRatioPreset::FREE:
      return std::nullopt;
    case CropRatioPreset::RATIO_1_1:
      return 1.0;
    case CropRatioPreset::RATIO_4_5:
      return 4.0 / 5.0;
    case CropRatioPreset::RATIO_3_4:
      return 3.0 / 4.0;
    case CropRatioPreset::RATIO_9_16:
      return 9.0 / 16.0;
    case CropRatioPreset::RATIO_16_9:
      return 16.0 / 9.0;
    case CropRatioPreset::RATIO_2_3:
      return 2.0 / 3.0;
    case CropRatioPreset::RATIO_3_2:
      return 3.0 / 2.0;
  }
  return std::nullopt;
}

auto CreateCenteredCropRect(std::optional<double> target_ratio, int image_width,
                            int image_height) -> NormalizedCropRect {
  if (!target_ratio || *target_ratio <= 0.0 || image_width <= 0 || image_height <= 0) {
    return {};
  }
  const double image_ratio = static_cast<double>(image_width) / image_height;
  double       w           = 1.0;
  double       h           = 1.0;
  if (*target_ratio > image_ratio) {
    h = image_ratio / *target_ratio;
  } else {
    w = *target_ratio / image_ratio;
  }
  return {static_cast<float>((1.0 - w) / 2.0), static_cast<float>((1.0 - h) / 2.0),
          static_cast<float>(w), static_cast<float>(h)};
}

auto AdjustCropToRatio(const NormalizedCropRect& rect, double target_ratio, int image_width,
                       int image_height, CropAnchor anchor) -> NormalizedCropRect {
  if (target_ratio <= 0.0 || image_width <= 0 || image_height <= 0 || rect.h_ <= 0.0f) {
    return rect;
  }
  const double image_ratio   = static_cast<double>(image_width) / image_height;
  const double current_ratio = (static_cast<double>(rect.w_) * image_width) /
                               (static_cast<double>(rect.h_) * image_height);

  double       new_w         = rect.w_;
  double       new_h         = rect.h_;
  if (current_ratio > target_ratio) {
    new_w = (target_ratio / image_ratio) * rect.h_;
  } else {
    new_h = (image_ratio / target_ratio) * rect.w_;
  }

  double new_x = rect.x_;
  double new_y = rect.y_;
  switch (anchor) {
    case CropAnchor::CENTER:
      new_x = rect.x_ + (rect.w_ - new_w) / 2.0;
      new_y = rect.y_ + (rect.h_ - new_h) / 2.0;
      break;
    case CropAnchor::TOP_LEFT:
      break;
    case CropAnchor::TOP_RIGHT:
      new_x = rect.x_ + rect.w_ - new_w;
      break;
    case CropAnchor::BOTTOM_LEFT:
      new_y = rect.y_ + rect.h_ - new_h;
      break;
    case CropAnchor::BOTTOM_RIGHT:
      new_x = rect.x_ + rect.w_ - new_w;
      new_y = rect.y_ + rect.h_ - new_h;
      break;
  }
  return ClampCropRect({static_cast<float>(new_x), static_cast<float>(new_y),
                        static_cast<float>(new_w), static_cast<float>(new_h)});
}

auto CropPresetToString(CropRatioPreset preset) -> std::string {
  switch (preset) {
    case CropRatioPreset::ORIGINAL:
      return "original";
    case CropRatioPreset::FREE:
      return "free";
    case CropRatioPreset::RATIO_1_1:
      return "1:1";
    case CropRatioPreset::RATIO_4_5:
      return "4:5";
    case CropRatioPreset::RATIO_3_4:
      return "3:4";
    case CropRatioPreset::RATIO_9_16:
      return "9:16";
    case CropRatioPreset::RATIO_16_9:
      return "16:9";
    case CropRatioPreset::RATIO_2_3:
      return "2:3";
    case CropRatioPreset::RATIO_3_2:
      return "3:2";
  }
  return "original";
}

auto CropPresetFromString(std::string_view name) -> std::optional<CropRatioPreset> {
  static constexpr CropRatioPreset all[] = {
      CropRatioPreset::ORIGINAL,  CropRatioPreset::FREE,      CropRatioPreset::RATIO_1_1,
      CropRatioPreset::RATIO_4_5, CropRatioPreset::RATIO_3_4, CropRatioPreset::RATIO_9_16,
      CropRatioPreset::RATIO_16_9, CropRatioPreset::RATIO_2_3, CropRatioPreset::RATIO_3_2};
  for (const auto preset : all) {
    if (CropPresetToString(preset) == name) return preset;
  }
  return std::nullopt;
}
};  // namespace reformat
