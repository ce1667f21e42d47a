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

#include "geometry/transform.hpp"

namespace reformat {
namespace {
using Mat2 = std::array<int, 4>;  // row-major {a, b, c, d}

auto Multiply(const Mat2& l, const Mat2& r) -> Mat2 {
  return {l[0] * r[0] + l[1] * r[2], l[0] * r[1] + l[1] * r[3], l[2] * r[0] + l[3] * r[2],
          l[2] * r[1] + l[3] * r[3]};
}

constexpr Mat2 kIdentity = {1, 0, 0, 1};
// Quarter turn clockwise on screen: (x, y) -> (-y, x)
constexpr Mat2 kRotateCW = {0, -1, 1, 0};
constexpr Mat2 kFlipH    = {-1, 0, 0, 1};
constexpr Mat2 kFlipV    = {1, 0, 0, -1};
}  // namespace

auto Transform::Steps() const -> int { return ((rotate_steps_ % 4) + 4) % 4; }

auto Transform::IsIdentity() const -> bool { return Steps() == 0 && !flip_h_ && !flip_v_; }

auto Transform::RotatedCW() const -> Transform {
  return {(Steps() + 1) % 4, flip_h_, flip_v_};
}

auto Transform::RotatedCCW() const -> Transform {
  return {(Steps() + 3) % 4, flip_h_, flip_v_};
}

auto Transform::FlippedH() const -> Transform { return {Steps(), !flip_h_, flip_v_}; }

auto Transform::FlippedV() const -> Transform { return {Steps(), flip_h_, !flip_v_}; }

auto Transform::Normalized() const -> Transform { return {Steps(), flip_h_, flip_v_}; }

bool Transform::operator==(const Transform& other) const {
  return Steps() == other.Steps() && flip_h_ == other.flip_h_ && flip_v_ == other.flip_v_;
}

auto EffectiveDimensions(int width, int height, const Transform& transform) -> Dimensions {
  if (transform.SwapsAxes()) {
    return {height, width};
  }
  return {width, height};
}

auto TransformMatrix(const Transform& transform) -> std::array<int, 4> {
  Mat2 m = kIdentity;
  for (int i = 0; i < transform.Steps(); ++i) {
    m = Multiply(kRotateCW, m);
  }
  if (transform.flip_h_) m = Multiply(kFlipH, m);
  if (transform.flip_v_) m = Multiply(kFlipV, m);
  return m;
}

auto CombineTransforms(const Transform& first, const Transform& second) -> Transform {
  const Mat2 target = Multiply(TransformMatrix(second), TransformMatrix(first));

  // Prefer the representation with the fewest flips
  static constexpr std::array<std::array<bool, 2>, 4> flip_orders = {
      {{false, false}, {true, false}, {false, true}, {true, true}}};
  for (const auto& flips : flip_orders) {
    for (int steps = 0; steps < 4; ++steps) {
      const Transform candidate{steps, flips[0], flips[1]};
      if (TransformMatrix(candidate) == target) return candidate;
    }
  }
  // The eight rotation/flip matrices are closed under multiplication
  return Transform::Identity();
}

auto TransformsEquivalent(const Transform& a, const Transform& b) -> bool {
  return TransformMatrix(a) == TransformMatrix(b);
}
};  // namespace reformat
