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

#include "pipeline/operators/color_space_conv.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace rawthumb {
namespace CPU {
namespace {
constexpr int kLutSize = 65536;

auto          SRGBTransfer(double linear) -> double {
  if (linear <= 0.0031308) {
    return 12.92 * linear;
  }
  return 1.055 * std::pow(linear, 1.0 / 2.4) - 0.055;
}

template <typename T, int MaxValue>
auto BuildLut() -> std::array<T, kLutSize> {
  std::array<T, kLutSize> lut{};
  for (int i = 0; i < kLutSize; ++i) {
    const double encoded = SRGBTransfer(static_cast<double>(i) / (kLutSize - 1));
    lut[i] =
        static_cast<T>(std::clamp(std::lround(encoded * MaxValue), 0L, static_cast<long>(MaxValue)));
  }
  return lut;
}

auto Lut8() -> const std::array<uint8_t, kLutSize>& {
  static const auto lut = BuildLut<uint8_t, 255>();
  return lut;
}

auto Lut16() -> const std::array<uint16_t, kLutSize>& {
  static const auto lut = BuildLut<uint16_t, 65535>();
  return lut;
}

inline auto LutIndex(float value) -> int {
  if (!(value > 0.0f)) return 0;
  if (value >= 1.0f) return kLutSize - 1;
  return static_cast<int>(value * static_cast<float>(kLutSize - 1) + 0.5f);
}

template <typename T>
auto ApplyLut(const cv::Mat& linear, const std::array<T, kLutSize>& lut, int cv_depth) -> cv::Mat {
  const int channels = linear.channels();
  cv::Mat   out(linear.rows, linear.cols, CV_MAKETYPE(cv_depth, channels));
  for (int y = 0; y < linear.rows; ++y) {
    const float* src = linear.ptr<float>(y);
    T*           dst = out.ptr<T>(y);
    for (int x = 0; x < linear.cols * channels; ++x) {
      dst[x] = lut[LutIndex(src[x])];
    }
  }
  return out;
}
}  // namespace

auto ToNormalizedFloat(const cv::Mat& src) -> cv::Mat {
  double scale = 1.0;
  switch (src.depth()) {
    case CV_8U:
      scale = 1.0 / 255.0;
      break;
    case CV_16U:
      scale = 1.0 / 65535.0;
      break;
    case CV_32F:
      return src.clone();
    default:
      throw std::invalid_argument("ColorSpaceConv: unsupported pixel depth");
  }
  cv::Mat out;
  src.convertTo(out, CV_MAKETYPE(CV_32F, src.channels()), scale);
  return out;
}

void ApplyCameraToSRGB(cv::Mat& img, const cv::Matx33f& camera_to_srgb) {
  if (img.depth() != CV_32F) {
    throw std::invalid_argument("ColorSpaceConv: expected a float image");
  }
  if (img.channels() == 3) {
    cv::transform(img, img, camera_to_srgb);
  }
  cv::threshold(img, img, 1.0, 1.0, cv::THRESH_TRUNC);
  cv::max(img, 0.0, img);
}

auto EncodeSRGB(const cv::Mat& linear, int bit_depth) -> cv::Mat {
  if (linear.depth() != CV_32F) {
    throw std::invalid_argument("ColorSpaceConv: expected a float image");
  }
  if (bit_depth == 8) {
    return ApplyLut(linear, Lut8(), CV_8U);
  }
  if (bit_depth == 16) {
    return ApplyLut(linear, Lut16(), CV_16U);
  }
  throw std::invalid_argument("ColorSpaceConv: bit depth must be 8 or 16");
}
};  // namespace CPU
};  // namespace rawthumb
