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

#include "io/image/image_writer.hpp"

#include <format>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

#include "error/error.hpp"

namespace rawthumb {
namespace {
auto ExtensionForFormat(OutputFormat format) -> std::string {
  switch (format) {
    case OutputFormat::PNG:
      return ".png";
    case OutputFormat::JPEG:
    default:
      return ".jpg";
  }
}

auto EncodeParams(const ConversionOptions& options) -> std::vector<int> {
  switch (options.format_) {
    case OutputFormat::JPEG:
      return {cv::IMWRITE_JPEG_QUALITY,     options.quality_,
              cv::IMWRITE_JPEG_PROGRESSIVE, options.progressive_ ? 1 : 0,
              cv::IMWRITE_JPEG_OPTIMIZE,    options.optimize_ ? 1 : 0};
    case OutputFormat::PNG:
      return {cv::IMWRITE_PNG_COMPRESSION, options.compression_level_};
    default:
      return {};
  }
}
}  // namespace

void ImageWriter::CheckSupported(const ConversionOptions& options) {
  if (options.format_ == OutputFormat::JPEG && options.bit_depth_ != 8) {
    throw ConversionError(ErrorKind::EncodeFailed,
                          std::format("ImageWriter: JPEG cannot hold {}-bit samples",
                                      options.bit_depth_));
  }
}

auto ImageWriter::EncodeToMemory(const cv::Mat& rgb, const ConversionOptions& options)
    -> std::vector<uint8_t> {
  CheckSupported(options);
  if (rgb.empty()) {
    throw ConversionError(ErrorKind::EncodeFailed, "ImageWriter: nothing to encode");
  }
  const int expected_depth = options.bit_depth_ == 16 ? CV_16U : CV_8U;
  if (rgb.depth() != expected_depth || (rgb.channels() != 1 && rgb.channels() != 3)) {
    throw ConversionError(ErrorKind::EncodeFailed,
                          "ImageWriter: pixel layout does not match the requested output");
  }

  std::vector<uint8_t> encoded;
  try {
    cv::Mat bgr;
    if (rgb.channels() == 3) {
      cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    } else {
      bgr = rgb;
    }
    if (!cv::imencode(ExtensionForFormat(options.format_), bgr, encoded, EncodeParams(options))) {
      throw ConversionError(ErrorKind::EncodeFailed, "ImageWriter: imencode returned false");
    }
  } catch (const cv::Exception& e) {
    throw ConversionError(ErrorKind::EncodeFailed, std::format("ImageWriter: OpenCV: {}", e.what()));
  }
  if (encoded.empty()) {
    throw ConversionError(ErrorKind::EncodeFailed, "ImageWriter: encoder produced no bytes");
  }
  return encoded;
}
};  // namespace rawthumb
