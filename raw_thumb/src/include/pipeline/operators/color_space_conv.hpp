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

#pragma once

#include <opencv2/core.hpp>

namespace rawthumb {
namespace CPU {
/**
 * @brief Convert an integer pixel buffer (8 or 16 bit) into normalized float [0, 1].
 */
auto ToNormalizedFloat(const cv::Mat& src) -> cv::Mat;

/**
 * @brief Apply the camera to linear sRGB matrix in place and clamp to [0, 1]. Single channel
 * images are only clamped.
 */
void ApplyCameraToSRGB(cv::Mat& img, const cv::Matx33f& camera_to_srgb);

/**
 * @brief Apply the sRGB transfer curve to linear float data and quantize to 8 or 16 bit.
 *
 * Goes through a fixed 16-bit indexed lookup table so the result does not depend on the
 * platform's pow().
 */
auto EncodeSRGB(const cv::Mat& linear, int bit_depth) -> cv::Mat;
};  // namespace CPU
};  // namespace rawthumb
