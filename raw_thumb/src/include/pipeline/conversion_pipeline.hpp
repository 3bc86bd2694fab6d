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
 * @file        raw_thumb/src/include/pipeline/conversion_pipeline.hpp
 * @brief       Turns a decoded RAW image into encoded JPEG/PNG bytes
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "concurrency/cancel_token.hpp"
#include "image/decoded_image.hpp"
#include "pipeline/conversion_options.hpp"

namespace rawthumb {
struct ConversionResult {
  std::vector<uint8_t> bytes_;
  std::string          content_type_;
  int                  width_  = 0;
  int                  height_ = 0;
  uint64_t             hash_   = 0;

  auto                 Size() const -> size_t { return bytes_.size(); }
  // Quoted strong validator built from the xxHash64 of the encoded bytes
  auto                 ETag() const -> std::string;
};

/**
 * @brief Stateless post-decode pipeline.
 *
 * Stages: validate -> orient -> camera to linear sRGB -> resize -> sRGB curve + quantize ->
 * encode -> EXIF transfer. Each stage drops its input once its output exists, and the cancel
 * token is checked between stages. Same image and options always give byte-identical output.
 */
class ConversionPipeline {
 private:
  OutputLimits limits_;

 public:
  explicit ConversionPipeline(OutputLimits limits = {}) : limits_(limits) {}

  /**
   * @throws ConversionError InvalidOptions, EncodeFailed, Cancelled, InternalError
   */
  auto Convert(DecodedImage&& image, const ConversionOptions& options,
               const CancelToken* cancel = nullptr) const -> ConversionResult;

  /**
   * @brief Option checks that need no pixels. Run first by Convert.
   *
   * An upscaling request whose explicit target already exceeds the output limits is rejected
   * here, before anything is decoded.
   *
   * @throws ConversionError InvalidOptions, EncodeFailed
   */
  void ValidateOptions(const ConversionOptions& options) const;

  auto Limits() const -> const OutputLimits& { return limits_; }
};
};  // namespace rawthumb
