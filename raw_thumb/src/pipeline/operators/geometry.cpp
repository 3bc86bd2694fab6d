//  Copyright 2025 Yurun Zi
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

#include "pipeline/operators/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/imgproc.hpp>
#include <utility>

#include "error/error.hpp"

namespace rawthumb {
namespace CPU {
namespace {
auto Scaled(int length, double scale) -> double { return std::max(1.0, std::round(length * scale)); }

// Enlarged outputs must stay inside the service limits. Sizes are compared in double so that
// requests near INT_MAX cannot wrap.
void CheckEnlargedSize(const cv::Size& source, double width, double height,
                       const OutputLimits& limits) {
  if (width <= source.width && height <= source.height) {
    return;
  }
  if (width > limits.max_dimension_ || height > limits.max_dimension_ ||
      width * height > static_cast<double>(limits.max_pixels_)) {
    throw ConversionError(
        ErrorKind::InvalidOptions,
        std::format("ComputeTargetSize: {:.0f}x{:.0f} exceeds the output limit of {} px per side "
                    "and {} px in total",
                    width, height, limits.max_dimension_, limits.max_pixels_));
  }
}
}  // namespace

void ApplyOrientation(cv::Mat& img, int orientation) {
  switch (orientation) {
    case 2:
      cv::flip(img, img, 1);
      break;
    case 3:
      cv::rotate(img, img, cv::ROTATE_180);
      break;
    case 4:
      cv::flip(img, img, 0);
      break;
    case 5:
      cv::transpose(img, img);
      break;
    case 6:
      cv::rotate(img, img, cv::ROTATE_90_CLOCKWISE);
      break;
    case 7:
      cv::transpose(img, img);
      cv::flip(img, img, -1);
      break;
    case 8:
      cv::rotate(img, img, cv::ROTATE_90_COUNTERCLOCKWISE);
      break;
    default:
      break;
  }
}

auto ComputeTargetSize(const cv::Size& source, const ConversionOptions& options,
                       const OutputLimits& limits) -> cv::Size {
  if (!options.HasTarget() || source.width <= 0 || source.height <= 0) {
    return source;
  }
  const double sx = options.target_width_
                        ? static_cast<double>(*options.target_width_) / source.width
                        : static_cast<double>(*options.target_height_) / source.height;
  const double sy = options.target_height_
                        ? static_cast<double>(*options.target_height_) / source.height
                        : sx;

  double       width  = 0.0;
  double       height = 0.0;
  if (options.fit_ == FitMode::EXACT && options.target_width_ && options.target_height_) {
    width  = *options.target_width_;
    height = *options.target_height_;
    if (!options.allow_upscale_) {
      width  = std::min<double>(width, source.width);
      height = std::min<double>(height, source.height);
    }
  } else {
    double scale = std::min(sx, sy);
    if (!options.allow_upscale_) {
      scale = std::min(scale, 1.0);
    }
    width  = Scaled(source.width, scale);
    height = Scaled(source.height, scale);
  }

  CheckEnlargedSize(source, width, height, limits);
  return {static_cast<int>(width), static_cast<int>(height)};
}

void ResizeTo(cv::Mat& img, const cv::Size& target) {
  if (img.empty() || target == img.size()) {
    return;
  }
  const bool shrinking = target.width <= img.cols && target.height <= img.rows;
  cv::Mat    resized;
  cv::resize(img, resized, target, 0.0, 0.0, shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4);
  img = std::move(resized);
}
};  // namespace CPU
};  // namespace rawthumb
