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

#include "pipeline/conversion_options.hpp"

namespace rawthumb {
namespace CPU {
/**
 * @brief Rotate and mirror the image in place so that EXIF orientation `orientation` (1..8)
 * becomes 1. Values outside 1..8 are treated as 1.
 */
void ApplyOrientation(cv::Mat& img, int orientation);

/**
 * @brief Output size for a source of `source` pixels under the target box and fit mode of
 * `options`. Returns `source` when no target is set.
 *
 * A missing side is derived from the source aspect ratio. Without upscale permission the result
 * never exceeds the source on either side.
 *
 * @throws ConversionError InvalidOptions when an enlarged result would exceed `limits`
 */
auto ComputeTargetSize(const cv::Size& source, const ConversionOptions& options,
                       const OutputLimits& limits = {}) -> cv::Size;

/**
 * @brief Resize in place. Area interpolation when shrinking, Lanczos when enlarging.
 */
void ResizeTo(cv::Mat& img, const cv::Size& target);
};  // namespace CPU
};  // namespace rawthumb
