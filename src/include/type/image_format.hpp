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

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace reformat {
// Encoded container formats the codec can detect
enum class ImageFormat { UNKNOWN, JPEG, PNG, WEBP, TIFF, HEIC, BMP, GIF };

// Output format requested for a run. SAME keeps the detected source format.
enum class OutputFormat { SAME, JPEG, PNG, WEBP, TIFF, HEIC, BMP };

struct QualitySpec {
  static constexpr int kMinQuality     = 40;
  static constexpr int kMaxQuality     = 100;
  static constexpr int kDefaultQuality = 85;

  int                  jpeg_           = kDefaultQuality;
  int                  webp_           = kDefaultQuality;
  int                  heic_           = kDefaultQuality;

  bool                 operator==(const QualitySpec&) const = default;
};

/**
 * @brief Outcome of mapping a requested output format onto one item
 */
struct FormatResolution {
  ImageFormat format_            = ImageFormat::PNG;
  // The requested format could not hold the source's alpha channel
  bool        alpha_switched_    = false;
  // SAME was requested for a source format we cannot encode
  bool        source_converted_  = false;
};

inline constexpr std::string_view kTransparencySwitchWarning =
    "auto-switched to preserve transparency";
inline constexpr std::string_view kGifConvertedWarning =
    "GIF output is not supported; saved as PNG";

auto DetectImageFormat(std::span<const uint8_t> bytes) -> ImageFormat;
auto ImageFormatFromString(std::string_view name) -> ImageFormat;
auto ImageFormatToString(ImageFormat format) -> std::string;
auto OutputFormatFromString(std::string_view name) -> std::optional<OutputFormat>;
auto OutputFormatToString(OutputFormat format) -> std::string;

auto ExtensionFor(ImageFormat format) -> std::string;
auto FormatSupportsAlpha(ImageFormat format) -> bool;
auto FormatUsesQuality(ImageFormat format) -> bool;
auto QualityFor(ImageFormat format, const QualitySpec& quality) -> int;

/**
 * @brief Decide which format an item is actually written in. Formats that cannot carry
 * transparency are upgraded to PNG when the source has an alpha channel.
 *
 * @param requested format selected for the run
 * @param source detected format of the item
 * @param has_alpha whether the item carries an alpha channel
 * @return FormatResolution
 */
auto ResolveOutputFormat(OutputFormat requested, ImageFormat source, bool has_alpha)
    -> FormatResolution;
};  // namespace reformat
