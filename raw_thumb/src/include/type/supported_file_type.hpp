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

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rawthumb {
/**
 * @brief RAW container families that can be told apart by their leading bytes.
 *
 * Most vendor formats (DNG, CR2, NEF, ARW, PEF, 3FR, ...) are TIFF containers and share one
 * signature; LibRaw decides whether a TIFF actually carries sensor data.
 */
enum class RawContainer : int {
  Unknown      = 0,
  Tiff         = 1,
  OlympusOrf   = 2,
  PanasonicRw2 = 3,
  FujiRaf      = 4,
  CanonCr3     = 5,
  CanonCrw     = 6,
  SigmaX3f     = 7,
  MinoltaMrw   = 8
};

// Enough leading bytes to tell every family above apart.
static constexpr size_t kMinSignatureBytes = 16;

auto DetectRawContainer(const uint8_t* data, size_t size) -> RawContainer;

auto RawContainerName(RawContainer container) -> std::string_view;
};  // namespace rawthumb
