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

/*
 * @file        raw_thumb/src/include/image/decoded_image.hpp
 * @brief       Output of the RAW decoder: a demosaiced pixel buffer plus what the pipeline
 *              needs to turn it into a display image
 */

#pragma once

#include <exiv2/exif.hpp>
#include <opencv2/core.hpp>
#include <optional>
#include <string>

#include "image/image_buffer.hpp"
#include "image/metadata.hpp"
#include "type/supported_file_type.hpp"

namespace rawthumb {
struct ColorProfile {
  // "camera-linear": linear, white balanced camera RGB; camera_to_srgb_ maps it to linear sRGB
  std::string id_             = "camera-linear";
  cv::Matx33f camera_to_srgb_ = cv::Matx33f::eye();
};

/**
 * @brief A decoded image owned by exactly one request. Move-only; the pixel buffer is released
 * with the object or earlier through ReleasePixels().
 *
 * Construction enforces that the buffer is non-empty, continuous, and exactly
 * width x height x channels x (bit_depth / 8) bytes. A violation throws
 * DecodeError{CorruptData}.
 */
class DecodedImage {
 private:
  ImageBuffer                    pixels_;
  int                            width_       = 0;
  int                            height_      = 0;
  int                            channels_    = 0;
  int                            bit_depth_   = 0;
  int                            orientation_ = 1;
  ColorProfile                   profile_;
  CaptureMetadata                metadata_;
  RawContainer                   container_ = RawContainer::Unknown;
  std::optional<Exiv2::ExifData> exif_;

 public:
  DecodedImage(cv::Mat&& pixels, int bit_depth, ColorProfile profile, int orientation,
               CaptureMetadata metadata, RawContainer container);

  DecodedImage(DecodedImage&&) noexcept            = default;
  DecodedImage& operator=(DecodedImage&&) noexcept = default;
  DecodedImage(const DecodedImage&)                = delete;
  DecodedImage& operator=(const DecodedImage&)     = delete;

  auto          Width() const -> int { return width_; }
  auto          Height() const -> int { return height_; }
  auto          Channels() const -> int { return channels_; }
  auto          BitDepth() const -> int { return bit_depth_; }
  auto          Orientation() const -> int { return orientation_; }
  auto          Profile() const -> const ColorProfile& { return profile_; }
  auto          Metadata() const -> const CaptureMetadata& { return metadata_; }
  auto          Container() const -> RawContainer { return container_; }

  auto          Pixels() const -> const cv::Mat& { return pixels_.GetCPUData(); }
  auto          HasPixels() const -> bool { return pixels_._cpu_data_valid; }

  /**
   * @brief Hand the pixel buffer to the caller. Afterwards HasPixels() is false.
   */
  auto          ReleasePixels() -> cv::Mat { return pixels_.TakeCPUData(); }

  void          SetExif(Exiv2::ExifData exif) { exif_ = std::move(exif); }
  auto          Exif() const -> const std::optional<Exiv2::ExifData>& { return exif_; }
};
};  // namespace rawthumb
