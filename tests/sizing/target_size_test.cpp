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

#include <gtest/gtest.h>

#include <cmath>

#include "sizing/target_size.hpp"
#include "utils/bytes/bytes.hpp"

namespace reformat {
namespace {
// One byte per pixel plus a fixed header
auto LinearEncoder(byte_size_t overhead, int* calls = nullptr) -> TargetSize::EncodeSizeFn {
  return [overhead, calls](int width, int height, int) -> byte_size_t {
    if (calls) ++*calls;
    return static_cast<byte_size_t>(width) * static_cast<byte_size_t>(height) + overhead;
  };
}
}  // namespace

TEST(TargetSizeTests, ToleranceBand) {
  EXPECT_TRUE(TargetSize::IsWithinTolerance(100, 100));
  EXPECT_TRUE(TargetSize::IsWithinTolerance(109, 100));
  EXPECT_TRUE(TargetSize::IsWithinTolerance(91, 100));
  EXPECT_FALSE(TargetSize::IsWithinTolerance(111, 100));
  EXPECT_FALSE(TargetSize::IsWithinTolerance(89, 100));
}

TEST(TargetSizeTests, ScaledDimensionsRespectFloorWithoutEnlarging) {
  EXPECT_EQ(TargetSize::CalculateScaledDimensions(4000, 3000, 0.5), (Dimensions{2000, 1500}));
  EXPECT_EQ(TargetSize::CalculateScaledDimensions(4000, 3000, 0.001), (Dimensions{48, 48}));
  // A side already under the floor is kept as is
  EXPECT_EQ(TargetSize::CalculateScaledDimensions(100, 40, 0.5), (Dimensions{50, 40}));
  EXPECT_TRUE(TargetSize::IsAtMinDimension(48, 500));
  EXPECT_FALSE(TargetSize::IsAtMinDimension(49, 500));
}

TEST(TargetSizeTests, Estimates) {
  EXPECT_DOUBLE_EQ(TargetSize::EstimateBytesPerPixel(40), 0.1);
  EXPECT_DOUBLE_EQ(TargetSize::EstimateBytesPerPixel(100), 0.8);
  EXPECT_EQ(TargetSize::EstimateFileSize(100, 100, 100), 8000u);
  EXPECT_DOUBLE_EQ(TargetSize::EstimateScaleForTarget(1000, 1000, 100.0, 85), 1.0);
  const double scale = TargetSize::EstimateScaleForTarget(4000, 3000, 1.0, 100);
  EXPECT_GT(scale, TargetSize::kMinScale);
  EXPECT_LT(scale, 1.0);
}

TEST(TargetSizeTests, RejectsNonPositiveTarget) {
  int        calls  = 0;
  const auto result = TargetSize::FindTargetSize({4000, 3000, 0.0, 85}, LinearEncoder(0, &calls));
  EXPECT_FALSE(result.success_);
  EXPECT_EQ(result.iterations_, 0);
  EXPECT_EQ(calls, 0);
  ASSERT_TRUE(result.warning_.has_value());
}

TEST(TargetSizeTests, OriginalAlreadyWithinTolerance) {
  // 1448 * 1448 bytes is within 10% of 2 MiB
  const auto result = TargetSize::FindTargetSize({1448, 1448, 2.0, 85}, LinearEncoder(0));
  EXPECT_TRUE(result.success_);
  EXPECT_EQ(result.iterations_, 1);
  EXPECT_DOUBLE_EQ(result.scale_, 1.0);
  EXPECT_EQ(result.width_, 1448);
  EXPECT_FALSE(result.warning_.has_value());
}

TEST(TargetSizeTests, OriginalSmallerThanTargetIsKept) {
  const auto result = TargetSize::FindTargetSize({100, 100, 2.0, 85}, LinearEncoder(0));
  EXPECT_TRUE(result.success_);
  EXPECT_EQ(result.width_, 100);
  EXPECT_EQ(result.height_, 100);
  ASSERT_TRUE(result.warning_.has_value());
  EXPECT_NE(result.warning_->find("smaller than target"), std::string::npos);
}

TEST(TargetSizeTests, SearchConvergesWithinTolerance) {
  int        calls  = 0;
  const auto result = TargetSize::FindTargetSize({4000, 3000, 2.0, 85}, LinearEncoder(0, &calls));
  const byte_size_t target = Bytes::MiBToBytes(2.0);

  EXPECT_TRUE(result.success_);
  EXPECT_TRUE(TargetSize::IsWithinTolerance(result.bytes_, target));
  EXPECT_LE(result.iterations_, TargetSize::kMaxIterations);
  EXPECT_EQ(calls, result.iterations_);
  EXPECT_LT(result.width_, 4000);
  EXPECT_NEAR(static_cast<double>(result.width_) / result.height_, 4.0 / 3.0, 0.01);
  EXPECT_FALSE(result.warning_.has_value());
}

TEST(TargetSizeTests, UnreachableTargetReportsMinimumSize) {
  // The header alone is bigger than the target
  const auto result = TargetSize::FindTargetSize(
      {4000, 3000, 1.0, 85}, LinearEncoder(5 * Bytes::kBytesPerMiB));

  EXPECT_FALSE(result.success_);
  EXPECT_TRUE(TargetSize::IsAtMinDimension(result.width_, result.height_));
  EXPECT_EQ(result.height_, TargetSize::kMinDimension);
  ASSERT_TRUE(result.warning_.has_value());
  EXPECT_NE(result.warning_->find("Closest achievable"), std::string::npos);
  EXPECT_NE(result.warning_->find("minimum size"), std::string::npos);
  EXPECT_LE(result.iterations_, TargetSize::kMaxIterations);
}

TEST(TargetSizeTests, StepwiseEncoderFallsBackToClosestResult) {
  // Sizes jump in 1 MiB steps so no scale lands inside the band around 1.5 MiB
  auto       stepped = [](int width, int height, int) -> byte_size_t {
    const double mib = static_cast<double>(width) * height / Bytes::kBytesPerMiB;
    return static_cast<byte_size_t>(std::ceil(mib)) * Bytes::kBytesPerMiB;
  };
  const auto result = TargetSize::FindTargetSize({4000, 3000, 1.5, 85}, stepped);

  EXPECT_FALSE(result.success_);
  EXPECT_EQ(result.bytes_, Bytes::kBytesPerMiB);
  ASSERT_TRUE(result.warning_.has_value());
  EXPECT_NE(result.warning_->find("Closest achievable"), std::string::npos);
}

TEST(BytesTests, Conversions) {
  EXPECT_EQ(Bytes::MiBToBytes(2.0), 2097152u);
  EXPECT_EQ(Bytes::MiBToBytes(-1.0), 0u);
  EXPECT_DOUBLE_EQ(Bytes::BytesToMiB(1572864), 1.5);
  EXPECT_EQ(Bytes::FormatMiB(1572864), "1.5 MiB");
}
};  // namespace reformat
