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
 * @file        raw_thumb/src/include/decoders/raw_decoder.hpp
 * @brief       A decoder used to decode raw files held in memory, e.g. .ARW, .DNG
 */

#pragma once

#include <libraw/libraw.h>

#include <cstddef>
#include <cstdint>
#include <opencv2/core.hpp>

#include "concurrency/cancel_token.hpp"
#include "image/decoded_image.hpp"
#include "image/metadata.hpp"

namespace rawthumb {
enum class WhiteBalanceMode : int { CAMERA = 0, AUTO = 1, DAYLIGHT = 2 };

struct RawDecodeParams {
  bool             half_size_         = false;
  WhiteBalanceMode white_balance_     = WhiteBalanceMode::CAMERA;
  bool             auto_bright_       = true;
  // Keep the container's EXIF block on the decoded image so it can be written into the output
  bool             read_exif_         = false;
  unsigned         max_raw_memory_mb_ = 2048;
};

/**
 * @brief Stateless adapter around LibRaw. Every call owns a fresh LibRaw instance, so one
 * decoder can be shared by any number of threads.
 */
class RawDecoder {
 public:
  RawDecoder() = default;

  /**
   * @brief Decode a RAW file into 16-bit linear camera RGB.
   *
   * Demosaicing and white balance are done by LibRaw. Orientation is NOT applied; the EXIF
   * orientation and the camera to sRGB matrix travel with the DecodedImage.
   *
   * @throws DecodeError EmptyInput, UnsupportedFormat, CorruptData, PayloadTooLarge (LibRaw
   * memory limit), Cancelled, InternalError
   */
  auto Decode(const uint8_t* data, size_t size, const RawDecodeParams& params,
              const CancelToken* cancel = nullptr) const -> DecodedImage;

  /**
   * @brief Parse the container only and report its capture metadata. No pixel data is touched.
   */
  auto ReadMetadata(const uint8_t* data, size_t size, const RawDecodeParams& params) const
      -> CaptureMetadata;

  /**
   * @brief Copy a LibRaw memory image into an owned 16-bit Mat with 1 or 3 channels.
   *
   * @throws DecodeError UnsupportedFormat for four-colour sensor output, CorruptData for any
   * other layout
   */
  static auto CopyProcessedImage(const libraw_processed_image_t& img) -> cv::Mat;
};

};  // namespace rawthumb
