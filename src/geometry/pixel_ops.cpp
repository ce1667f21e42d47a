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

#include "geometry/pixel_ops.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <vector>

namespace reformat {
auto ExifOrientationToTransform(int orientation) -> Transform {
  switch (orientation) {
    case 2:
      return {0, true, false};
    case 3:
      return {2, false, false};
    case 4:
      return {0, false, true};
    case 5:
      return {1, true, false};
    case 6:
      return {1, false, false};
    case 7:
      return {1, false, true};
    case 8:
      return {3, false, false};
    default:
      return Transform::Identity();
  }
}

auto ApplyTransform(const cv::Mat& image, const Transform& transform) -> cv::Mat {
  cv::Mat rotated;
  switch (transform.Steps()) {
    case 1:
      cv::rotate(image, rotated, cv::ROTATE_90_CLOCKWISE);
      break;
    case 2:
      cv::rotate(image, rotated, cv::ROTATE_180);
      break;
    case 3:
      cv::rotate(image, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);
      break;
    default:
      rotated = image;
      break;
  }

  if (!transform.flip_h_ && !transform.flip_v_) return rotated;

  const int flip_code = (transform.flip_h_ && transform.flip_v_) ? -1 : (transform.flip_h_ ? 1 : 0);
  cv::Mat   flipped;
  cv::flip(rotated, flipped, flip_code);
  return flipped;
}

auto ExtractRegion(const cv::Mat& image, const PixelRect& region) -> cv::Mat {
  const cv::Rect bounds(0, 0, image.cols, image.rows);
  const cv::Rect roi = cv::Rect(region.left_, region.top_, region.width_, region.height_) & bounds;
  if (roi.width <= 0 || roi.height <= 0) {
    throw std::runtime_error("Crop region lies outside the image");
  }
  return image(roi).clone();
}

auto ResizeArea(const cv::Mat& image, int width, int height) -> cv::Mat {
  if (width <= 0 || height <= 0) {
    throw std::runtime_error("Resize target must be positive");
  }
  if (width == image.cols && height == image.rows) return image;
  cv::Mat resized;
  cv::resize(image, resized, cv::Size(width, height), 0.0, 0.0, cv::INTER_AREA);
  return resized;
}

auto HasAlphaChannel(const cv::Mat& image) -> bool {
  return image.channels() == 4 || image.channels() == 2;
}

auto NormalizeToStandardRGB(const cv::Mat& image, bool keep_alpha) -> cv::Mat {
  if (image.empty()) {
    throw std::runtime_error("Cannot normalize an empty image");
  }

  cv::Mat u8;
  switch (image.depth()) {
    case CV_8U:
      u8 = image;
      break;
    case CV_16U:
      image.convertTo(u8, CV_MAKETYPE(CV_8U, image.channels()), 1.0 / 257.0);
      break;
    case CV_32F:
    case CV_64F:
      image.convertTo(u8, CV_MAKETYPE(CV_8U, image.channels()), 255.0);
      break;
    default:
      image.convertTo(u8, CV_MAKETYPE(CV_8U, image.channels()));
      break;
  }

  cv::Mat out;
  switch (u8.channels()) {
    case 1:
      cv::cvtColor(u8, out, cv::COLOR_GRAY2BGR);
      break;
    case 2: {
      // Gray plus alpha
      std::vector<cv::Mat> planes;
      cv::split(u8, planes);
      std::vector<cv::Mat> bgra = {planes[0], planes[0], planes[0], planes[1]};
      cv::merge(bgra, out);
      if (!keep_alpha) cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
      break;
    }
    case 3:
      out = u8;
      break;
    case 4:
      if (keep_alpha) {
        out = u8;
      } else {
        cv::cvtColor(u8, out, cv::COLOR_BGRA2BGR);
      }
      break;
    default:
      throw std::runtime_error("Unsupported channel count");
  }
  return out;
}
};  // namespace reformat
