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

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace rawthumb::test {
/**
 * @brief Builds a minimal uncompressed little-endian DNG (16-bit RGGB CFA) in memory.
 *
 * The color matrix is XYZ -> linear sRGB, so the "camera" space of the file is sRGB and
 * LibRaw's camera to sRGB matrix comes out close to identity.
 */
struct DngSpec {
  uint32_t    width_       = 96;
  uint32_t    height_      = 64;
  uint16_t    orientation_ = 1;
  uint32_t    seed_        = 1;
  std::string make_        = "RawThumb";
  std::string model_       = "Synthetic Sensor";
};

class DngBuilder {
 private:
  struct Entry {
    uint16_t             tag_;
    uint16_t             type_;
    uint32_t             count_;
    std::vector<uint8_t> payload_;
  };

  static constexpr uint16_t kByte      = 1;
  static constexpr uint16_t kAscii     = 2;
  static constexpr uint16_t kShort     = 3;
  static constexpr uint16_t kLong      = 4;
  static constexpr uint16_t kRational  = 5;
  static constexpr uint16_t kSRational = 10;

  static void               Put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>(v >> 8));
  }

  static void Put32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
  }

  static auto Shorts(std::initializer_list<uint16_t> values) -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    for (auto v : values) Put16(out, v);
    return out;
  }

  static auto Longs(std::initializer_list<uint32_t> values) -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    for (auto v : values) Put32(out, v);
    return out;
  }

  static auto Ascii(const std::string& s) -> std::vector<uint8_t> {
    std::vector<uint8_t> out(s.begin(), s.end());
    out.push_back(0);
    return out;
  }

  static auto SRationals(std::initializer_list<int32_t> numerators, int32_t denominator)
      -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    for (auto n : numerators) {
      Put32(out, static_cast<uint32_t>(n));
      Put32(out, static_cast<uint32_t>(denominator));
    }
    return out;
  }

  // Deterministic mosaic: smooth gradient plus a seed dependent ripple
  static auto Sample(const DngSpec& spec, uint32_t x, uint32_t y) -> uint16_t {
    const uint32_t base = 4000 + (x * 40000) / std::max<uint32_t>(spec.width_, 1) +
                          (y * 12000) / std::max<uint32_t>(spec.height_, 1);
    uint32_t state = spec.seed_ * 2654435761u + x * 40503u + y * 9973u;
    state ^= state >> 13;
    state *= 0x5bd1e995u;
    state ^= state >> 15;
    return static_cast<uint16_t>(std::min<uint32_t>(base + (state % 2048), 65535));
  }

 public:
  static auto Build(const DngSpec& spec) -> std::vector<uint8_t> {
    const uint32_t     pixel_bytes = spec.width_ * spec.height_ * 2;

    std::vector<Entry> entries     = {
        {254, kLong, 1, Longs({0})},
        {256, kLong, 1, Longs({spec.width_})},
        {257, kLong, 1, Longs({spec.height_})},
        {258, kShort, 1, Shorts({16})},
        {259, kShort, 1, Shorts({1})},
        {262, kShort, 1, Shorts({32803})},
        {271, kAscii, static_cast<uint32_t>(spec.make_.size() + 1), Ascii(spec.make_)},
        {272, kAscii, static_cast<uint32_t>(spec.model_.size() + 1), Ascii(spec.model_)},
        {273, kLong, 1, Longs({0})},  // patched below
        {274, kShort, 1, Shorts({spec.orientation_})},
        {277, kShort, 1, Shorts({1})},
        {278, kLong, 1, Longs({spec.height_})},
        {279, kLong, 1, Longs({pixel_bytes})},
        {284, kShort, 1, Shorts({1})},
        {33421, kShort, 2, Shorts({2, 2})},
        {33422, kByte, 4, {0, 1, 1, 2}},
        {50706, kByte, 4, {1, 4, 0, 0}},
        {50707, kByte, 4, {1, 1, 0, 0}},
        {50708, kAscii, static_cast<uint32_t>(spec.model_.size() + 1), Ascii(spec.model_)},
        {50717, kLong, 1, Longs({65535})},
        {50721, kSRational, 9,
         SRationals({32406, -15372, -4986, -9689, 18758, 415, 557, -2040, 10570}, 10000)},
        {50728, kRational, 3, Longs({1, 1, 1, 1, 1, 1})},
        {50778, kShort, 1, Shorts({21})},
    };

    const uint32_t ifd_offset  = 8;
    const uint32_t ifd_size    = 2 + static_cast<uint32_t>(entries.size()) * 12 + 4;
    uint32_t       data_offset = ifd_offset + ifd_size;

    // Out-of-line payloads, then pixel data
    std::vector<uint8_t>  extra;
    std::vector<uint32_t> offsets(entries.size(), 0);
    for (size_t i = 0; i < entries.size(); ++i) {
      if (entries[i].payload_.size() > 4) {
        offsets[i] = data_offset + static_cast<uint32_t>(extra.size());
        extra.insert(extra.end(), entries[i].payload_.begin(), entries[i].payload_.end());
        if (extra.size() % 2 != 0) extra.push_back(0);
      }
    }
    const uint32_t strip_offset = data_offset + static_cast<uint32_t>(extra.size());
    for (auto& entry : entries) {
      if (entry.tag_ == 273) entry.payload_ = Longs({strip_offset});
    }

    std::vector<uint8_t> out = {'I', 'I', 42, 0};
    Put32(out, ifd_offset);
    Put16(out, static_cast<uint16_t>(entries.size()));
    for (size_t i = 0; i < entries.size(); ++i) {
      const auto& entry = entries[i];
      Put16(out, entry.tag_);
      Put16(out, entry.type_);
      Put32(out, entry.count_);
      if (entry.payload_.size() > 4) {
        Put32(out, offsets[i]);
      } else {
        std::vector<uint8_t> inline_value = entry.payload_;
        inline_value.resize(4, 0);
        out.insert(out.end(), inline_value.begin(), inline_value.end());
      }
    }
    Put32(out, 0);
    out.insert(out.end(), extra.begin(), extra.end());

    out.reserve(out.size() + pixel_bytes);
    for (uint32_t y = 0; y < spec.height_; ++y) {
      for (uint32_t x = 0; x < spec.width_; ++x) {
        Put16(out, Sample(spec, x, y));
      }
    }
    return out;
  }
};
};  // namespace rawthumb::test
