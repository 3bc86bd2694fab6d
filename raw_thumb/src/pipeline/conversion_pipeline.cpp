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

#include "pipeline/conversion_pipeline.hpp"

#include <easy/profiler.h>
#include <xxhash.h>

#include <exiv2/error.hpp>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <iostream>
#include <new>
#include <optional>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <utility>

#include "error/error.hpp"
#include "image/metadata_extractor.hpp"
#include "io/image/image_writer.hpp"
#include "pipeline/operators/color_space_conv.hpp"
#include "pipeline/operators/geometry.hpp"

namespace rawthumb {
namespace {
void CheckCancelled(const CancelToken* cancel, const char* stage) {
  if (cancel != nullptr && cancel->IsCancelled()) {
    throw ConversionError(ErrorKind::Cancelled,
                          std::format("ConversionPipeline: cancelled after {}", stage));
  }
}

void CheckDimension(const std::optional<int>& value, const char* name) {
  if (value.has_value() && *value <= 0) {
    throw ConversionError(ErrorKind::InvalidOptions,
                          std::format("ConversionPipeline: {} must be positive, got {}", name,
                                      *value));
  }
}

void CheckUpscaleTarget(const ConversionOptions& options, const OutputLimits& limits) {
  for (const auto& side : {options.target_width_, options.target_height_}) {
    if (side.has_value() && *side > limits.max_dimension_) {
      throw ConversionError(
          ErrorKind::InvalidOptions,
          std::format("ConversionPipeline: target side {} exceeds the limit of {} px", *side,
                      limits.max_dimension_));
    }
  }
  if (options.fit_ == FitMode::EXACT && options.target_width_ && options.target_height_) {
    const uint64_t pixels = static_cast<uint64_t>(*options.target_width_) *
                            static_cast<uint64_t>(*options.target_height_);
    if (pixels > limits.max_pixels_) {
      throw ConversionError(
          ErrorKind::InvalidOptions,
          std::format("ConversionPipeline: target of {} px exceeds the limit of {} px", pixels,
                      limits.max_pixels_));
    }
  }
}

auto TransferExif(std::vector<uint8_t>&& encoded, const DecodedImage& image, int width,
                  int height) -> std::vector<uint8_t> {
  const auto& exif = image.Exif();
  if (!exif.has_value()) {
    return std::move(encoded);
  }
  try {
    return MetadataExtractor::EmbedEXIF(encoded, *exif, width, height);
  } catch (const Exiv2::Error& e) {
    std::cout << std::format("[WARN] ConversionPipeline: EXIF not written: {}\n", e.what());
  } catch (const std::runtime_error& e) {
    std::cout << std::format("[WARN] ConversionPipeline: EXIF not written: {}\n", e.what());
  }
  return std::move(encoded);
}
}  // namespace

auto ConversionResult::ETag() const -> std::string { return std::format("\"{:016x}\"", hash_); }

void ConversionPipeline::ValidateOptions(const ConversionOptions& options) const {
  CheckDimension(options.target_width_, "width");
  CheckDimension(options.target_height_, "height");
  if (options.allow_upscale_) {
    CheckUpscaleTarget(options, limits_);
  }
  if (options.fit_ == FitMode::EXACT && options.HasTarget() &&
      !(options.target_width_ && options.target_height_)) {
    throw ConversionError(ErrorKind::InvalidOptions,
                          "ConversionPipeline: exact fit needs both width and height");
  }
  if (options.quality_ < 1 || options.quality_ > 100) {
    throw ConversionError(ErrorKind::InvalidOptions,
                          std::format("ConversionPipeline: quality must be within 1..100, got {}",
                                      options.quality_));
  }
  if (options.compression_level_ < 0 || options.compression_level_ > 9) {
    throw ConversionError(
        ErrorKind::InvalidOptions,
        std::format("ConversionPipeline: compression must be within 0..9, got {}",
                    options.compression_level_));
  }
  if (options.bit_depth_ != 8 && options.bit_depth_ != 16) {
    throw ConversionError(ErrorKind::InvalidOptions,
                          std::format("ConversionPipeline: bit depth must be 8 or 16, got {}",
                                      options.bit_depth_));
  }
  ImageWriter::CheckSupported(options);
}

auto ConversionPipeline::Convert(DecodedImage&& image, const ConversionOptions& options,
                                 const CancelToken* cancel) const -> ConversionResult {
  ValidateOptions(options);
  if (!image.HasPixels()) {
    throw ConversionError(ErrorKind::InternalError, "ConversionPipeline: image has no pixels");
  }
  CheckCancelled(cancel, "validation");

  cv::Mat working;
  try {
    EASY_BLOCK("Orientation");
    cv::Mat pixels = image.ReleasePixels();
    if (options.auto_orient_) {
      CPU::ApplyOrientation(pixels, image.Orientation());
    }
    EASY_END_BLOCK;
    CheckCancelled(cancel, "orientation");

    EASY_BLOCK("Color normalization");
    working = CPU::ToNormalizedFloat(pixels);
    pixels.release();
    CPU::ApplyCameraToSRGB(working, image.Profile().camera_to_srgb_);
    EASY_END_BLOCK;
    CheckCancelled(cancel, "color normalization");

    EASY_BLOCK("Resize");
    CPU::ResizeTo(working, CPU::ComputeTargetSize(working.size(), options, limits_));
    EASY_END_BLOCK;
    CheckCancelled(cancel, "resize");

    EASY_BLOCK("Quantize");
    working = CPU::EncodeSRGB(working, options.bit_depth_);
    EASY_END_BLOCK;
    CheckCancelled(cancel, "quantization");
  } catch (const cv::Exception& e) {
    throw ConversionError(ErrorKind::InternalError,
                          std::format("ConversionPipeline: OpenCV: {}", e.what()));
  } catch (const std::invalid_argument& e) {
    throw ConversionError(ErrorKind::InternalError, e.what());
  } catch (const std::bad_alloc&) {
    throw ConversionError(ErrorKind::InternalError, "ConversionPipeline: out of memory");
  }

  ConversionResult result;
  result.width_  = working.cols;
  result.height_ = working.rows;

  EASY_BLOCK("Encode");
  std::vector<uint8_t> encoded = ImageWriter::EncodeToMemory(working, options);
  working.release();
  EASY_END_BLOCK;
  CheckCancelled(cancel, "encoding");

  if (options.keep_exif_) {
    encoded = TransferExif(std::move(encoded), image, result.width_, result.height_);
  }

  result.hash_         = XXH3_64bits(encoded.data(), encoded.size());
  result.bytes_        = std::move(encoded);
  result.content_type_ = std::string(ContentTypeForFormat(options.format_));
  return result;
}
};  // namespace rawthumb
