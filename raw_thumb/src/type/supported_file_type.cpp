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

#include "type/supported_file_type.hpp"

#include <cstring>

namespace rawthumb {
namespace {
auto HasPrefix(const uint8_t* data, size_t size, size_t offset, const char* magic, size_t len)
    -> bool {
  if (size < offset + len) return false;
  return std::memcmp(data + offset, magic, len) == 0;
}
}  // namespace

auto DetectRawContainer(const uint8_t* data, size_t size) -> RawContainer {
  if (!data || size < 4) {
    return RawContainer::Unknown;
  }

  // Checked before plain TIFF: CRW also starts with "II".
  if (HasPrefix(data, size, 0, "II", 2) && HasPrefix(data, size, 6, "HEAPCCDR", 8)) {
    return RawContainer::CanonCrw;
  }
  if (HasPrefix(data, size, 0, "II*\0", 4) || HasPrefix(data, size, 0, "MM\0*", 4)) {
    return RawContainer::Tiff;
  }
  if (HasPrefix(data, size, 0, "IIRO", 4) || HasPrefix(data, size, 0, "IIRS", 4) ||
      HasPrefix(data, size, 0, "MMOR", 4)) {
    return RawContainer::OlympusOrf;
  }
  if (HasPrefix(data, size, 0, "IIU\0", 4)) {
    return RawContainer::PanasonicRw2;
  }
  if (HasPrefix(data, size, 0, "FUJIFILMCCD-RAW", 15)) {
    return RawContainer::FujiRaf;
  }
  // ISO base media file with the Canon "crx " brand
  if (HasPrefix(data, size, 4, "ftypcrx ", 8)) {
    return RawContainer::CanonCr3;
  }
  if (HasPrefix(data, size, 0, "FOVb", 4)) {
    return RawContainer::SigmaX3f;
  }
  if (HasPrefix(data, size, 0, "\0MRM", 4)) {
    return RawContainer::MinoltaMrw;
  }
  return RawContainer::Unknown;
}

auto RawContainerName(RawContainer container) -> std::string_view {
  switch (container) {
    case RawContainer::Tiff:
      return "tiff";
    case RawContainer::OlympusOrf:
      return "orf";
    case RawContainer::PanasonicRw2:
      return "rw2";
    case RawContainer::FujiRaf:
      return "raf";
    case RawContainer::CanonCr3:
      return "cr3";
    case RawContainer::CanonCrw:
      return "crw";
    case RawContainer::SigmaX3f:
      return "x3f";
    case RawContainer::MinoltaMrw:
      return "mrw";
    default:
      return "unknown";
  }
}
};  // namespace rawthumb
