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

#include <libraw/libraw.h>

#include <cstddef>
#include <cstdint>
#include <exiv2/exif.hpp>
#include <optional>
#include <vector>

#include "image/metadata.hpp"
#include "type/supported_file_type.hpp"

namespace rawthumb {
class MetadataExtractor {
 public:
  /**
   * @brief One-time process setup for Exiv2. Must run before any worker thread touches EXIF.
   */
  static void InitializeLibraries();

  /**
   * @brief Populate capture metadata from libraw's opened-but-not-processed state. Only
   * open_datastream has to have succeeded.
   */
  static auto FromLibRaw(const LibRaw& raw_processor, RawContainer container) -> CaptureMetadata;

  /**
   * @brief Map libraw's flip code (0, 3, 5, 6) onto the EXIF orientation tag (1..8).
   */
  static auto FlipToExifOrientation(int flip) -> int;

  /**
   * @brief Read the EXIF block of a container held in memory.
   *
   * @return std::nullopt when Exiv2 does not understand the container or it carries no EXIF
   */
  static auto ExtractEXIFFromBuffer(const uint8_t* buffer, size_t size)
      -> std::optional<Exiv2::ExifData>;

  /**
   * @brief Write the descriptive part of a source EXIF block into an encoded JPEG/PNG.
   *
   * Structural tags of the RAW container, maker notes and the embedded preview are not copied.
   * Orientation is reset to 1 because pixel data is already upright.
   *
   * @throws Exiv2::Error or std::runtime_error when the encoded image cannot be rewritten
   */
  static auto EmbedEXIF(const std::vector<uint8_t>& encoded, const Exiv2::ExifData& source,
                        int width, int height) -> std::vector<uint8_t>;
};
};  // namespace rawthumb
