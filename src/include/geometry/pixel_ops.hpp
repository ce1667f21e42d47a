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

#include <opencv2/core.hpp>

#include "geometry/crop.hpp"
#include "geometry/transform.hpp"

namespace reformat {
/**
 * @brief Transform that brings an image stored with the given EXIF orientation (1-8) upright.
 * Unknown values map to identity.
 */
auto ExifOrientationToTransform(int orientation) -> Transform;

// Rotate clockwise by the transform's quarter turns, then apply its flips
auto ApplyTransform(const cv::Mat& image, const Transform& transform) -> cv::Mat;

// Deep copy of the region, clipped to the image bounds
auto ExtractRegion(const cv::Mat& image, const PixelRect& region) -> cv::Mat;

auto ResizeArea(const cv::Mat& image, int width, int height) -> cv::Mat;

/**
 * @brief Convert any decoded buffer to 8-bit BGR, or BGRA when keep_alpha is set and the input
 * has an alpha channel.
 */
auto NormalizeToStandardRGB(const cv::Mat& image, bool keep_alpha) -> cv::Mat;

auto HasAlphaChannel(const cv::Mat& image) -> bool;
};  // namespace reformat
