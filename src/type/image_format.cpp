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

#include "type/image_format.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <string>

namespace reformat {
namespace {
auto ToLower(std::string_view text) -> std::string {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto StartsWith(std::span<const uint8_t> bytes, size_t offset, std::string_view magic) -> bool {
  if (bytes.size() < offset + magic.size()) return false;
  return std::memcmp(bytes.data() + offset, magic.data(), magic.size()) == 0;
}

auto IsHeifBrand(std::span<const uint8_t> bytes) -> bool {
  if (!StartsWith(bytes, 4, "ftyp")) return false;
  static constexpr std::array<std::string_view, 6> brands = {"heic", "heix", "hevc",
                                                              "hevx", "mif1", "msf1"};
  return std::any_of(brands.begin(), brands.end(),
                     [&](std::string_view brand) { return StartsWith(bytes, 8, brand); });
}
}  // namespace

auto DetectImageFormat(std::span<const uint8_t> bytes) -> ImageFormat {
  if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
    return ImageFormat::JPEG;
  }
  if (StartsWith(bytes, 0, "\x89PNG")) return ImageFormat::PNG;
  if (StartsWith(bytes, 0, "GIF8")) return ImageFormat::GIF;
  if (StartsWith(bytes, 0, "BM")) return ImageFormat::BMP;
  if (StartsWith(bytes, 0, std::string_view("II*\0", 4)) ||
      StartsWith(bytes, 0, std::string_view("MM\0*", 4))) {
    return ImageFormat::TIFF;
  }
  if (StartsWith(bytes, 0, "RIFF") && StartsWith(bytes, 8, "WEBP")) return ImageFormat::WEBP;
  if (IsHeifBrand(bytes)) return ImageFormat::HEIC;
  return ImageFormat::UNKNOWN;
}

auto ImageFormatFromString(std::string_view name) -> ImageFormat {
  const auto lower = ToLower(name);
  if (lower == "jpeg" || lower == "jpg") return ImageFormat::JPEG;
  if (lower == "png") return ImageFormat::PNG;
  if (lower == "webp") return ImageFormat::WEBP;
  if (lower == "tiff" || lower == "tif") return ImageFormat::TIFF;
  if (lower == "heic" || lower == "heif") return ImageFormat::HEIC;
  if (lower == "bmp") return ImageFormat::BMP;
  if (lower == "gif") return ImageFormat::GIF;
  return ImageFormat::UNKNOWN;
}

auto ImageFormatToString(ImageFormat format) -> std::string {
  switch (format) {
    case ImageFormat::JPEG:
      return "jpeg";
    case ImageFormat::PNG:
      return "png";
    case ImageFormat::WEBP:
      return "webp";
    case ImageFormat::TIFF:
      return "tiff";
    case ImageFormat::HEIC:
      return "heic";
    case ImageFormat::BMP:
      return "bmp";
    case ImageFormat::GIF:
      return "gif";
    case ImageFormat::UNKNOWN:
      break;
  }
  return "unknown";
}

auto OutputFormatFromString(std::string_view name) -> std::optional<OutputFormat> {
  const auto lower = ToLower(name);
  if (lower == "same") return OutputFormat::SAME;
  if (lower == "jpg" || lower == "jpeg") return OutputFormat::JPEG;
  if (lower == "png") return OutputFormat::PNG;
  if (lower == "webp") return OutputFormat::WEBP;
  if (lower == "tiff") return OutputFormat::TIFF;
  if (lower == "heic") return OutputFormat::HEIC;
  if (lower == "bmp") return OutputFormat::BMP;
  return std::nullopt;
}

auto OutputFormatToString(OutputFormat format) -> std::string {
  switch (format) {
    case OutputFormat::SAME:
      return "same";
    case OutputFormat::JPEG:
      return "jpg";
    case OutputFormat::PNG:
      return "png";
    case OutputFormat::WEBP:
      return "webp";
    case OutputFormat::TIFF:
      return "tiff";
    case OutputFormat::HEIC:
      return "heic";
    case OutputFormat::BMP:
      return "bmp";
  }
  return "same";
}

auto ExtensionFor(ImageFormat format) -> std::string {
  switch (format) {
    case ImageFormat::JPEG:
      return ".jpg";
    case ImageFormat::WEBP:
      return ".webp";
    case ImageFormat::TIFF:
      return ".tiff";
    case ImageFormat::HEIC:
      return ".heic";
    case ImageFormat::BMP:
      return ".bmp";
    case ImageFormat::GIF:
      return ".gif";
    default:
      return ".png";
  }
}

auto FormatSupportsAlpha(ImageFormat format) -> bool {
  switch (format) {
    case ImageFormat::PNG:
    case ImageFormat::WEBP:
    case ImageFormat::TIFF:
    case ImageFormat::HEIC:
    case ImageFormat::GIF:
      return true;
    default:
      return false;
  }
}

auto FormatUsesQuality(ImageFormat format) -> bool {
  return format == ImageFormat::JPEG || format == ImageFormat::WEBP ||
         format == ImageFormat::HEIC;
}

auto QualityFor(ImageFormat format, const QualitySpec& quality) -> int {
  int value = QualitySpec::kDefaultQuality;
  switch (format) {
    case ImageFormat::JPEG:
      value = quality.jpeg_;
      break;
    case ImageFormat::WEBP:
      value = quality.webp_;
      break;
    case ImageFormat::HEIC:
      value = quality.heic_;
      break;
    default:
      break;
  }
  return std::clamp(value, QualitySpec::kMinQuality, QualitySpec::kMaxQuality);
}

auto ResolveOutputFormat(OutputFormat requested, ImageFormat source, bool has_alpha)
    -> FormatResolution {
  FormatResolution resolution;
  switch (requested) {
    case OutputFormat::SAME:
      if (source == ImageFormat::GIF) {
        resolution.format_           = ImageFormat::PNG;
        resolution.source_converted_ = true;
      } else if (source == ImageFormat::UNKNOWN) {
        resolution.format_ = ImageFormat::PNG;
      } else {
        resolution.format_ = source;
      }
      break;
    case OutputFormat::JPEG:
      resolution.format_ = ImageFormat::JPEG;
      break;
    case OutputFormat::PNG:
      resolution.format_ = ImageFormat::PNG;
      break;
    case OutputFormat::WEBP:
      resolution.format_ = ImageFormat::WEBP;
      break;
    case OutputFormat::TIFF:
      resolution.format_ = ImageFormat::TIFF;
      break;
    case OutputFormat::HEIC:
      resolution.format_ = ImageFormat::HEIC;
      break;
    case OutputFormat::BMP:
      resolution.format_ = ImageFormat::BMP;
      break;
  }

  if (has_alpha && !FormatSupportsAlpha(resolution.format_)) {
    resolution.format_         = ImageFormat::PNG;
    resolution.alpha_switched_ = true;
  }
  return resolution;
}
};  // namespace reformat
