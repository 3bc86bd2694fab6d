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

#include "pipeline/conversion_options.hpp"

#include <algorithm>
#include <cctype>

namespace rawthumb {
namespace {
auto ToLower(std::string_view value) -> std::string {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}
}  // namespace

auto FormatFromName(std::string_view name) -> std::optional<OutputFormat> {
  const std::string lower = ToLower(name);
  if (lower == "jpeg" || lower == "jpg") {
    return OutputFormat::JPEG;
  }
  if (lower == "png") {
    return OutputFormat::PNG;
  }
  return std::nullopt;
}

auto FormatName(OutputFormat format) -> std::string_view {
  switch (format) {
    case OutputFormat::PNG:
      return "png";
    case OutputFormat::JPEG:
    default:
      return "jpeg";
  }
}

auto ContentTypeForFormat(OutputFormat format) -> std::string_view {
  switch (format) {
    case OutputFormat::PNG:
      return "image/png";
    case OutputFormat::JPEG:
    default:
      return "image/jpeg";
  }
}

auto FitModeFromName(std::string_view name) -> std::optional<FitMode> {
  const std::string lower = ToLower(name);
  if (lower == "contain") {
    return FitMode::CONTAIN;
  }
  if (lower == "exact") {
    return FitMode::EXACT;
  }
  return std::nullopt;
}

auto WhiteBalanceFromName(std::string_view name) -> std::optional<WhiteBalanceMode> {
  const std::string lower = ToLower(name);
  if (lower == "camera") {
    return WhiteBalanceMode::CAMERA;
  }
  if (lower == "auto") {
    return WhiteBalanceMode::AUTO;
  }
  if (lower == "daylight") {
    return WhiteBalanceMode::DAYLIGHT;
  }
  return std::nullopt;
}
};  // namespace rawthumb
