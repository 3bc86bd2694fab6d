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

#include "image/decoded_image.hpp"

#include <format>
#include <utility>

#include "error/error.hpp"

namespace rawthumb {
DecodedImage::DecodedImage(cv::Mat&& pixels, int bit_depth, ColorProfile profile,
                           int orientation, CaptureMetadata metadata, RawContainer container)
    : profile_(std::move(profile)),
      metadata_(std::move(metadata)),
      container_(container) {
  if (pixels.empty() || pixels.cols <= 0 || pixels.rows <= 0) {
    throw DecodeError(ErrorKind::CorruptData, "DecodedImage: empty pixel buffer");
  }
  if (bit_depth != 8 && bit_depth != 16) {
    throw DecodeError(ErrorKind::CorruptData,
                      std::format("DecodedImage: unsupported bit depth {}", bit_depth));
  }
  const int expected_depth = bit_depth == 8 ? CV_8U : CV_16U;
  if (pixels.depth() != expected_depth) {
    throw DecodeError(ErrorKind::CorruptData,
                      "DecodedImage: pixel buffer depth does not match the declared bit depth");
  }
  const int channels = pixels.channels();
  if (channels != 1 && channels != 3) {
    throw DecodeError(ErrorKind::CorruptData,
                      std::format("DecodedImage: unsupported channel count {}", channels));
  }

  const size_t expected_bytes = static_cast<size_t>(pixels.cols) *
                                static_cast<size_t>(pixels.rows) * static_cast<size_t>(channels) *
                                static_cast<size_t>(bit_depth / 8);
  const size_t actual_bytes   = pixels.total() * pixels.elemSize();
  if (!pixels.isContinuous() || actual_bytes != expected_bytes) {
    throw DecodeError(ErrorKind::CorruptData,
                      std::format("DecodedImage: buffer holds {} bytes, {}x{}x{}@{}bit needs {}",
                                  actual_bytes, pixels.cols, pixels.rows, channels, bit_depth,
                                  expected_bytes));
  }

  width_       = pixels.cols;
  height_      = pixels.rows;
  channels_    = channels;
  bit_depth_   = bit_depth;
  orientation_ = (orientation >= 1 && orientation <= 8) ? orientation : 1;
  pixels_      = ImageBuffer{std::move(pixels)};
}
};  // namespace rawthumb
