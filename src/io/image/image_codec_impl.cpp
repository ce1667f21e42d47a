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

#include "io/image/image_codec_impl.hpp"

#include <OpenImageIO/filesystem.h>
#include <OpenImageIO/imageio.h>
#include <exiv2/exiv2.hpp>

#include <algorithm>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace reformat {
namespace {
OIIO_NAMESPACE_USING

auto ProxyFileName(ImageFormat format) -> std::string {
  return "memory" + ExtensionFor(format);
}

auto TryDecodeWithOpenCV(std::span<const uint8_t> bytes, std::string& out_error) -> cv::Mat {
  try {
    const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                      const_cast<uint8_t*>(bytes.data()));
    cv::Mat decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) out_error = "OpenCV: imdecode returned an empty image";
    return decoded;
  } catch (const cv::Exception& e) {
    out_error = std::string("OpenCV: ") + e.what();
    return {};
  }
}

auto TryDecodeWithOpenImageIO(std::span<const uint8_t> bytes, ImageFormat format,
                              std::string& out_error) -> cv::Mat {
  Filesystem::IOMemReader reader(const_cast<uint8_t*>(bytes.data()), bytes.size());
  const std::string       name   = ProxyFileName(format);
  ImageSpec               config;
  // Keep straight alpha; the rest of the pipeline never premultiplies
  config.attribute("oiio:UnassociatedAlpha", 1);
  auto                    in     = ImageInput::open(name, &config, &reader);
  if (!in) {
    out_error = "OpenImageIO: failed to open input: " + OIIO::geterror();
    return {};
  }

  const ImageSpec& spec     = in->spec();
  const int        channels = std::min(spec.nchannels, 4);
  cv::Mat          pixels(spec.height, spec.width, CV_MAKETYPE(CV_8U, channels));
  if (!in->read_image(0, 0, 0, channels, TypeDesc::UINT8, pixels.data)) {
    out_error = "OpenImageIO: failed to read image: " + in->geterror();
    in->close();
    return {};
  }
  in->close();

  if (channels == 3) {
    cv::cvtColor(pixels, pixels, cv::COLOR_RGB2BGR);
  } else if (channels == 4) {
    cv::cvtColor(pixels, pixels, cv::COLOR_RGBA2BGRA);
  }
  return pixels;
}

void ApplyOIIOFormatOptions(ImageSpec& spec, ImageFormat format, int quality) {
  switch (format) {
    case ImageFormat::JPEG:
    case ImageFormat::WEBP:
    case ImageFormat::HEIC:
      spec.attribute("CompressionQuality", quality);
      break;
    case ImageFormat::PNG:
      spec.attribute("png:compressionLevel", 9);
      break;
    case ImageFormat::TIFF:
      spec.attribute("compression", "lzw");
      break;
    default:
      break;
  }
  if (spec.nchannels == 4) {
    spec.alpha_channel = 3;
    spec.attribute("oiio:UnassociatedAlpha", 1);
  }
  // Pixels are already upright
  spec.attribute("Orientation", 1);
  spec.attribute("oiio:ColorSpace", "sRGB");
}

auto TryEncodeWithOpenImageIO(const cv::Mat& pixels, ImageFormat format, int quality,
                              ByteBuffer& out, std::string& out_error) -> bool {
  const std::string name = ProxyFileName(format);
  const int         channels = pixels.channels();

  cv::Mat           rgb;
  if (channels == 4) {
    cv::cvtColor(pixels, rgb, cv::COLOR_BGRA2RGBA);
  } else {
    cv::cvtColor(pixels, rgb, cv::COLOR_BGR2RGB);
  }

  ImageSpec spec(rgb.cols, rgb.rows, channels, TypeDesc::UINT8);
  if (channels == 3) spec.channelnames = {"R", "G", "B"};
  if (channels == 4) spec.channelnames = {"R", "G", "B", "A"};
  ApplyOIIOFormatOptions(spec, format, quality);

  ByteBuffer              buffer;
  Filesystem::IOVecOutput writer(buffer);
  std::unique_ptr<ImageOutput> output = ImageOutput::create(name, &writer);
  if (!output) {
    out_error = "OpenImageIO: failed to create ImageOutput: " + OIIO::geterror();
    return false;
  }
  if (!output->supports("ioproxy")) {
    out_error = "OpenImageIO: writer has no memory output support";
    return false;
  }
  if (!output->open(name, spec)) {
    out_error = "OpenImageIO: failed to open output: " + output->geterror();
    return false;
  }
  const stride_t xstride = static_cast<stride_t>(rgb.elemSize());
  const stride_t ystride = static_cast<stride_t>(rgb.step);
  if (!output->write_image(TypeDesc::UINT8, rgb.data, xstride, ystride, AutoStride)) {
    out_error = "OpenImageIO: failed to write image: " + output->geterror();
    output->close();
    return false;
  }
  if (!output->close()) {
    out_error = "OpenImageIO: failed to finish output: " + output->geterror();
    return false;
  }
  if (buffer.empty()) {
    out_error = "OpenImageIO: encoder produced no data";
    return false;
  }
  out = std::move(buffer);
  return true;
}

auto TryEncodeWithOpenCV(const cv::Mat& pixels, ImageFormat format, int quality, ByteBuffer& out,
                         std::string& out_error) -> bool {
  std::vector<int> params;
  switch (format) {
    case ImageFormat::JPEG:
      params = {cv::IMWRITE_JPEG_QUALITY, quality};
      break;
    case ImageFormat::WEBP:
      params = {cv::IMWRITE_WEBP_QUALITY, quality};
      break;
    case ImageFormat::PNG:
      params = {cv::IMWRITE_PNG_COMPRESSION, 9};
      break;
    case ImageFormat::TIFF:
      // libtiff COMPRESSION_LZW
      params = {cv::IMWRITE_TIFF_COMPRESSION, 5};
      break;
    default:
      break;
  }

  try {
    std::vector<uchar> encoded;
    if (!cv::imencode(ExtensionFor(format), pixels, encoded, params)) {
      out_error = "OpenCV: imencode returned false";
      return false;
    }
    out.assign(encoded.begin(), encoded.end());
    return true;
  } catch (const cv::Exception& e) {
    out_error = std::string("OpenCV: ") + e.what();
    return false;
  }
}
}  // namespace

auto ImageCodecImpl::ReadExifOrientation(std::span<const uint8_t> bytes) -> int {
  if (bytes.empty()) return 1;
  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(bytes.data()), bytes.size());
    if (!image) return 1;
    image->readMetadata();
    auto& exif = image->exifData();
    auto  it   = exif.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
    if (it == exif.end()) return 1;
    const int orientation = std::stoi(it->toString());
    return (orientation >= 1 && orientation <= 8) ? orientation : 1;
  } catch (const std::exception&) {
    // No readable EXIF block; treat the image as upright
    return 1;
  }
}

auto ImageCodecImpl::Decode(std::span<const uint8_t> bytes) -> DecodedImage {
  if (bytes.empty()) {
    throw std::runtime_error("ImageCodec: source is empty");
  }

  DecodedImage result;
  result.format_           = DetectImageFormat(bytes);
  result.exif_orientation_ = ReadExifOrientation(bytes);

  std::string cv_err;
  result.pixels_ = TryDecodeWithOpenCV(bytes, cv_err);
  if (!result.pixels_.empty()) return result;

  std::string oiio_err;
  try {
    result.pixels_ = TryDecodeWithOpenImageIO(bytes, result.format_, oiio_err);
  } catch (const std::exception& e) {
    oiio_err = e.what();
  }
  if (!result.pixels_.empty()) return result;

  throw std::runtime_error("ImageCodec: cannot decode image. " + cv_err + " | " + oiio_err);
}

auto ImageCodecImpl::Encode(const cv::Mat& pixels, ImageFormat format, int quality) -> ByteBuffer {
  if (pixels.empty()) {
    throw std::runtime_error("ImageCodec: nothing to encode");
  }
  if (pixels.depth() != CV_8U || (pixels.channels() != 3 && pixels.channels() != 4)) {
    throw std::runtime_error("ImageCodec: expected 8-bit BGR or BGRA pixels");
  }

  ByteBuffer  out;
  std::string oiio_err;
  try {
    if (TryEncodeWithOpenImageIO(pixels, format, quality, out, oiio_err)) return out;
  } catch (const std::exception& e) {
    oiio_err = e.what();
  }

  std::string cv_err;
  if (TryEncodeWithOpenCV(pixels, format, quality, out, cv_err)) return out;

  throw std::runtime_error("ImageCodec: encode to " + ImageFormatToString(format) +
                           " failed. " + oiio_err + " | " + cv_err);
}
};  // namespace reformat
