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

#include <array>

namespace reformat {
struct Dimensions {
  int  width_  = 0;
  int  height_ = 0;

  bool operator==(const Dimensions&) const = default;
};

/**
 * @brief Rotation in clockwise quarter turns followed by optional flips, in that order.
 * rotate_steps_ is interpreted modulo 4.
 */
struct Transform {
  int  rotate_steps_ = 0;
  bool flip_h_       = false;
  bool flip_v_       = false;

  static auto Identity() -> Transform { return {}; }

  // Rotation normalized to 0..3
  auto        Steps() const -> int;
  auto        IsIdentity() const -> bool;
  auto        SwapsAxes() const -> bool { return Steps() % 2 == 1; }
  auto        Degrees() const -> int { return Steps() * 90; }

  auto        RotatedCW() const -> Transform;
  auto        RotatedCCW() const -> Transform;
  auto        FlippedH() const -> Transform;
  auto        FlippedV() const -> Transform;
  auto        Normalized() const -> Transform;

  // Field-wise comparison after normalizing the rotation
  bool        operator==(const Transform& other) const;
};

/**
 * @brief Width and height of an image once the transform has been applied. Only odd quarter
 * turns swap the axes.
 */
auto EffectiveDimensions(int width, int height, const Transform& transform) -> Dimensions;

/**
 * @brief Single transform equivalent to applying first, then second.
 */
auto CombineTransforms(const Transform& first, const Transform& second) -> Transform;

// True when both transforms move every pixel to the same place
auto TransformsEquivalent(const Transform& a, const Transform& b) -> bool;

// Integer 2x2 matrix acting on pixel offsets from the image center, y pointing down
auto TransformMatrix(const Transform& transform) -> std::array<int, 4>;
};  // namespace reformat
