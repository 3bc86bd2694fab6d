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

#include "image/image_buffer.hpp"

#include <stdexcept>
#include <utility>

namespace rawthumb {
ImageBuffer::ImageBuffer(cv::Mat&& data) : _cpu_data(std::move(data)), _cpu_data_valid(true) {}

ImageBuffer::ImageBuffer(ImageBuffer&& other) noexcept
    : _cpu_data(std::move(other._cpu_data)), _cpu_data_valid(other._cpu_data_valid) {
  other._cpu_data_valid = false;
}

ImageBuffer& ImageBuffer::operator=(ImageBuffer&& other) noexcept {
  if (this != &other) {
    _cpu_data             = std::move(other._cpu_data);
    _cpu_data_valid       = other._cpu_data_valid;
    other._cpu_data_valid = false;
  }
  return *this;
}

auto ImageBuffer::GetCPUData() -> cv::Mat& {
  if (!_cpu_data_valid) {
    throw std::runtime_error("Image Buffer: No valid image data to be returned");
  }
  return _cpu_data;
}

auto ImageBuffer::GetCPUData() const -> const cv::Mat& {
  if (!_cpu_data_valid) {
    throw std::runtime_error("Image Buffer: No valid image data to be returned");
  }
  return _cpu_data;
}

auto ImageBuffer::TakeCPUData() -> cv::Mat {
  if (!_cpu_data_valid) {
    throw std::runtime_error("Image Buffer: No valid image data to be taken");
  }
  cv::Mat out     = std::move(_cpu_data);
  _cpu_data       = cv::Mat();
  _cpu_data_valid = false;
  return out;
}

void ImageBuffer::ReleaseCPUData() {
  _cpu_data.release();
  _cpu_data_valid = false;
}
};  // namespace rawthumb
