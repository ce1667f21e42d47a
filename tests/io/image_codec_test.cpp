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

#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "fixtures/scratch_dir_fixation.hpp"
#include "io/buffer/buffer_store.hpp"
#include "io/image/image_codec_impl.hpp"
#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "pipeline/image_pipeline.hpp"

namespace reformat {
namespace {
auto EncodeWithOpenCV(const cv::Mat& pixels, const std::string& ext) -> ByteBuffer {
  std::vector<uchar> encoded;
  if (!cv::imencode(ext, pixels, encoded)) {
    throw std::runtime_error("test image could not be encoded");
  }
  return ByteBuffer(encoded.begin(), encoded.end());
}

auto Gradient(int width, int height) -> cv::Mat {
  cv::Mat image(height, width, CV_8UC3);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 4), static_cast<uchar>(y * 4),
                                            static_cast<uchar>((x + y) * 2));
    }
  }
  return image;
}

auto SameImage(const cv::Mat& a, const cv::Mat& b) -> bool {
  if (a.size() != b.size() || a.type() != b.type()) return false;
  return cv::norm(a, b, cv::NORM_INF) == 0.0;
}
}  // namespace

class ImageCodecTests : public ScratchDirTests {
 protected:
  ImageCodecImpl codec_;
};

TEST_F(ImageCodecTests, DecodesPngLosslessly) {
  const cv::Mat source = Gradient(40, 30);
  const auto    bytes  = EncodeWithOpenCV(source, ".png");

  const auto    decoded = codec_.Decode(bytes);
  EXPECT_EQ(decoded.format_, ImageFormat::PNG);
  EXPECT_EQ(decoded.exif_orientation_, 1);
  EXPECT_TRUE(SameImage(decoded.pixels_, source));
}

TEST_F(ImageCodecTests, PngKeepsAlphaChannel) {
  cv::Mat source(10, 12, CV_8UC4, cv::Scalar(10, 20, 30, 40));
  const auto decoded = codec_.Decode(EncodeWithOpenCV(source, ".png"));
  ASSERT_EQ(decoded.pixels_.channels(), 4);
  EXPECT_EQ(decoded.pixels_.at<cv::Vec4b>(0, 0), cv::Vec4b(10, 20, 30, 40));
}

TEST_F(ImageCodecTests, PngEncodeRoundTrips) {
  const cv::Mat source  = Gradient(33, 17);
  const auto    encoded = codec_.Encode(source, ImageFormat::PNG, 85);
  EXPECT_EQ(DetectImageFormat(encoded), ImageFormat::PNG);
  EXPECT_TRUE(SameImage(codec_.Decode(encoded).pixels_, source));
}

TEST_F(ImageCodecTests, PngEncodeKeepsAlpha) {
  cv::Mat source(8, 8, CV_8UC4, cv::Scalar(200, 100, 50, 128));
  const auto decoded = codec_.Decode(codec_.Encode(source, ImageFormat::PNG, 85));
  ASSERT_EQ(decoded.pixels_.channels(), 4);
  EXPECT_EQ(decoded.pixels_.at<cv::Vec4b>(3, 3), cv::Vec4b(200, 100, 50, 128));
}

TEST_F(ImageCodecTests, JpegQualityAffectsSize) {
  cv::Mat noise(128, 128, CV_8UC3);
  cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(255));

  const auto low  = codec_.Encode(noise, ImageFormat::JPEG, 40);
  const auto high = codec_.Encode(noise, ImageFormat::JPEG, 100);
  EXPECT_EQ(DetectImageFormat(low), ImageFormat::JPEG);
  EXPECT_LT(low.size(), high.size());

  const auto decoded = codec_.Decode(high);
  EXPECT_EQ(decoded.format_, ImageFormat::JPEG);
  EXPECT_EQ(decoded.pixels_.cols, 128);
  EXPECT_EQ(decoded.pixels_.rows, 128);
}

TEST_F(ImageCodecTests, RejectsGarbageAndBadInput) {
  const ByteBuffer garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
  EXPECT_THROW(codec_.Decode(garbage), std::runtime_error);
  EXPECT_THROW(codec_.Decode(ByteBuffer{}), std::runtime_error);
  EXPECT_EQ(ImageCodecImpl::ReadExifOrientation(garbage), 1);

  EXPECT_THROW(codec_.Encode(cv::Mat(), ImageFormat::PNG, 85), std::runtime_error);
  EXPECT_THROW(codec_.Encode(cv::Mat(4, 4, CV_16UC3), ImageFormat::PNG, 85), std::runtime_error);
  EXPECT_THROW(codec_.Encode(cv::Mat(4, 4, CV_8UC1), ImageFormat::PNG, 85), std::runtime_error);
}

TEST_F(ImageCodecTests, ProbeFileItemReportsFormatAndSize) {
  cv::Mat    rgba(24, 48, CV_8UC4, cv::Scalar(1, 2, 3, 4));
  const auto bytes = EncodeWithOpenCV(rgba, ".png");
  const auto path  = scratch_dir_ / "probe.png";
  ImageWriter::WriteBytesToPath(path, bytes);

  const auto item = ProbeFileItem("p1", path, codec_);
  EXPECT_EQ(item.id_, "p1");
  EXPECT_TRUE(item.IsFile());
  EXPECT_EQ(item.original_name_, "probe.png");
  EXPECT_EQ(item.width_, 48);
  EXPECT_EQ(item.height_, 24);
  EXPECT_EQ(item.bytes_, bytes.size());
  EXPECT_EQ(item.format_, ImageFormat::PNG);
  EXPECT_TRUE(item.has_alpha_);

  EXPECT_THROW(ProbeFileItem("p2", scratch_dir_ / "absent.png", codec_), std::runtime_error);
}

TEST_F(ImageCodecTests, WriterAndLoaderRoundTripBytes) {
  const ByteBuffer bytes = {0, 1, 2, 250, 251, 252};
  const auto       path  = scratch_dir_ / "raw.bin";
  ImageWriter::WriteBytesToPath(path, bytes);
  EXPECT_EQ(*ByteBufferLoader::LoadFromPath(path), bytes);

  EXPECT_THROW(ImageWriter::WriteBytesToPath({}, bytes), std::runtime_error);
  EXPECT_THROW(ImageWriter::WriteBytesToPath(scratch_dir_ / "no_dir" / "x.bin", bytes),
               std::runtime_error);
  EXPECT_THROW(ByteBufferLoader::LoadFromPath(scratch_dir_ / "absent.bin"), std::runtime_error);
}

TEST_F(ImageCodecTests, PipelineCropsRealPngUnderRotation) {
  // Red top-left block on a blue 1000x800 image
  cv::Mat source(800, 1000, CV_8UC3, cv::Scalar(255, 0, 0));
  source(cv::Rect(0, 0, 200, 200)).setTo(cv::Scalar(0, 0, 255));

  ProcessRequest request;
  request.source_bytes_  = std::make_shared<const ByteBuffer>(EncodeWithOpenCV(source, ".png"));
  request.destination_   = scratch_dir_ / "red.png";
  request.transform_     = {1, false, false};
  request.crop_.active_  = true;
  request.crop_.rect_    = {0.75f, 0.0f, 0.25f, 0.2f};
  request.output_format_ = OutputFormat::PNG;

  ImagePipeline pipeline(std::make_shared<ImageCodecImpl>());
  const auto    result = pipeline.Process(request);
  ASSERT_TRUE(result.success_) << result.error_;

  const cv::Mat written = cv::imread(request.destination_.string(), cv::IMREAD_UNCHANGED);
  ASSERT_EQ(written.cols, 200);
  ASSERT_EQ(written.rows, 200);
  cv::Mat red_mask;
  cv::inRange(written, cv::Scalar(0, 0, 255), cv::Scalar(0, 0, 255), red_mask);
  EXPECT_EQ(cv::countNonZero(red_mask), 200 * 200);
}

TEST(InMemoryBufferStoreTests, PutFetchRemove) {
  InMemoryBufferStore store;
  EXPECT_EQ(store.Fetch("clip"), nullptr);

  store.Put("clip", ByteBuffer{9, 8, 7});
  EXPECT_EQ(store.Size(), 1u);
  const auto held = store.Fetch("clip");
  ASSERT_NE(held, nullptr);
  EXPECT_EQ(*held, (ByteBuffer{9, 8, 7}));

  store.Remove("clip");
  EXPECT_EQ(store.Fetch("clip"), nullptr);
  EXPECT_EQ(store.Size(), 0u);
  // A buffer handed out earlier stays valid
  EXPECT_EQ(held->size(), 3u);
}
};  // namespace reformat
