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

#include <cstdint>
#include <opencv2/core.hpp>
#include <vector>

#include "pipeline/conversion_options.hpp"

namespace rawthumb {
class ImageWriter {
 public:
  ImageWriter() = delete;

  /**
   * @brief Reject format / depth combinations the encoder cannot produce, before any pixel work.
   *
   * @throws ConversionError EncodeFailed (e.g. 16-bit JPEG)
   */
  static void CheckSupported(const ConversionOptions& options);

  /**
   * @brief Encode an RGB (or gray) 8/16-bit buffer into JPEG or PNG bytes.
   *
   * @throws ConversionError EncodeFailed
   */
  static auto EncodeToMemory(const cv::Mat& rgb, const ConversionOptions& options)
      -> std::vector<uint8_t>;
};
};  // namespace rawthumb
