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
class ImageBuffer {
 private:
  cv::Mat _cpu_data;

 public:
  bool _cpu_data_valid = false;

  ImageBuffer()        = default;
  ImageBuffer(cv::Mat&& data);
  ImageBuffer(ImageBuffer&& other) noexcept;

  ImageBuffer(const ImageBuffer&)            = delete;
  ImageBuffer& operator=(const ImageBuffer&) = delete;
  ImageBuffer& operator=(ImageBuffer&& other) noexcept;

  auto         GetCPUData() -> cv::Mat&;
  auto         GetCPUData() const -> const cv::Mat&;

  /**
   * @brief Move the pixel data out, leaving the buffer invalid. Used by pipeline stages that
   * supersede their input.
   */
  auto         TakeCPUData() -> cv::Mat;

  void         ReleaseCPUData();
};
};  // namespace rawthumb
