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

#include "sizing/resize_spec.hpp"

namespace reformat {
namespace {
auto Pixels(DrivingDimension driving, std::optional<int> width, std::optional<int> height,
            std::optional<int> max_side, bool keep_ratio = true) -> PixelResize {
  PixelResize spec;
  spec.keep_ratio_ = keep_ratio;
  spec.driving_    = driving;
  spec.width_      = width;
  spec.height_     = height;
  spec.max_side_   = max_side;
  return spec;
}
}  // namespace

TEST(ResizeSpecTests, PercentScalesBothAxes) {
  const auto dims = ComputeTargetDimensions({4000, 3000}, PercentResize{50.0});
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(*dims, (Dimensions{2000, 1500}));
}

TEST(ResizeSpecTests, PercentNeverEnlarges) {
  EXPECT_FALSE(ComputeTargetDimensions({4000, 3000}, PercentResize{100.0}).has_value());
  EXPECT_FALSE(ComputeTargetDimensions({4000, 3000}, PercentResize{150.0}).has_value());
  EXPECT_FALSE(ComputeTargetDimensions({4000, 3000}, PercentResize{0.0}).has_value());
}

TEST(ResizeSpecTests, PercentKeepsAtLeastOnePixel) {
  const auto dims = ComputeTargetDimensions({100, 3}, PercentResize{1.0});
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(*dims, (Dimensions{1, 1}));
}

TEST(ResizeSpecTests, MaxSideDrivesLongestEdge) {
  const auto spec = Pixels(DrivingDimension::MAX_SIDE, std::nullopt, std::nullopt, 2000);
  EXPECT_EQ(ComputeTargetDimensions({4000, 3000}, spec), (Dimensions{2000, 1500}));
  EXPECT_EQ(ComputeTargetDimensions({3000, 4000}, spec), (Dimensions{1500, 2000}));
  EXPECT_FALSE(ComputeTargetDimensions({1000, 800}, spec).has_value());
}

TEST(ResizeSpecTests, WidthAndHeightDriveProportionally) {
  EXPECT_EQ(ComputeTargetDimensions(
                {4000, 3000}, Pixels(DrivingDimension::WIDTH, 1000, std::nullopt, std::nullopt)),
            (Dimensions{1000, 750}));
  EXPECT_EQ(ComputeTargetDimensions(
                {4000, 3000}, Pixels(DrivingDimension::HEIGHT, std::nullopt, 300, std::nullopt)),
            (Dimensions{400, 300}));
  // The driving value is missing
  EXPECT_FALSE(ComputeTargetDimensions(
                   {4000, 3000}, Pixels(DrivingDimension::WIDTH, std::nullopt, 300, std::nullopt))
                   .has_value());
  // Equal to the current size
  EXPECT_FALSE(ComputeTargetDimensions(
                   {4000, 3000}, Pixels(DrivingDimension::WIDTH, 4000, std::nullopt, std::nullopt))
                   .has_value());
}

TEST(ResizeSpecTests, FreeAspectClampsEachAxis) {
  EXPECT_EQ(ComputeTargetDimensions(
                {4000, 3000}, Pixels(DrivingDimension::WIDTH, 1000, 5000, std::nullopt, false)),
            (Dimensions{1000, 3000}));
  EXPECT_EQ(ComputeTargetDimensions(
                {4000, 3000}, Pixels(DrivingDimension::WIDTH, 800, 600, std::nullopt, false)),
            (Dimensions{800, 600}));
  EXPECT_FALSE(ComputeTargetDimensions(
                   {4000, 3000},
                   Pixels(DrivingDimension::WIDTH, 5000, std::nullopt, std::nullopt, false))
                   .has_value());
}

TEST(ResizeSpecTests, DefaultPixelSpecLeavesImageAlone) {
  EXPECT_FALSE(ComputeTargetDimensions({4000, 3000}, PixelResize{}).has_value());
}

TEST(ResizeSpecTests, TargetSizeModeHasNoFixedDimensions) {
  const ResizeSpec spec = TargetSizeResize{1.5};
  EXPECT_TRUE(IsTargetSizeMode(spec));
  EXPECT_FALSE(ComputeTargetDimensions({4000, 3000}, spec).has_value());
  EXPECT_FALSE(IsTargetSizeMode(PercentResize{}));
}

TEST(ResizeSpecTests, InvalidCurrentDimensions) {
  EXPECT_FALSE(ComputeTargetDimensions({0, 3000}, PercentResize{50.0}).has_value());
}

TEST(ResizeSpecTests, DrivingDimensionNames) {
  EXPECT_EQ(DrivingDimensionToString(DrivingDimension::MAX_SIDE), "max_side");
  EXPECT_EQ(DrivingDimensionFromString("width"), DrivingDimension::WIDTH);
  EXPECT_EQ(DrivingDimensionFromString("maxSide"), DrivingDimension::MAX_SIDE);
  EXPECT_FALSE(DrivingDimensionFromString("diagonal").has_value());
}
};  // namespace reformat
