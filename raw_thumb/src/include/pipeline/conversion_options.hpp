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
#include <optional>
#include <string>
#include <string_view>

#include "decoders/raw_decoder.hpp"

namespace rawthumb {
enum class OutputFormat : int { JPEG = 0, PNG = 1 };

enum class FitMode : int { CONTAIN = 0, EXACT = 1 };

/**
 * @brief Everything a client can ask of one conversion. Built once per request from its
 * parameters and not modified afterwards.
 */
struct ConversionOptions {
  OutputFormat       format_            = OutputFormat::JPEG;
  int                quality_           = 92;
  int                compression_level_ = 6;
  int                bit_depth_         = 8;

  // Either side may be left empty; it is then derived from the aspect ratio
  std::optional<int> target_width_;
  std::optional<int> target_height_;
  FitMode            fit_               = FitMode::CONTAIN;
  bool               allow_upscale_     = false;

  bool               progressive_       = false;
  bool               optimize_          = false;
  bool               auto_orient_       = true;
  bool               keep_exif_         = false;

  RawDecodeParams    decode_;

  auto               HasTarget() const -> bool {
    return target_width_.has_value() || target_height_.has_value();
  }
};

/**
 * @brief Service-side ceiling on the rendered image. Not settable per request.
 */
struct OutputLimits {
  int      max_dimension_ = 20000;
  uint64_t max_pixels_    = 160ull * 1000 * 1000;
};

auto FormatFromName(std::string_view name) -> std::optional<OutputFormat>;
auto FormatName(OutputFormat format) -> std::string_view;
auto ContentTypeForFormat(OutputFormat format) -> std::string_view;
auto FitModeFromName(std::string_view name) -> std::optional<FitMode>;
auto WhiteBalanceFromName(std::string_view name) -> std::optional<WhiteBalanceMode>;
};  // namespace rawthumb
