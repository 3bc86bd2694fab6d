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

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "raw/dng_fixture.hpp"

namespace rawthumb {
namespace {
auto Bytes(const std::string& s, size_t pad_to = kMinSignatureBytes) -> std::vector<uint8_t> {
  std::vector<uint8_t> out(s.begin(), s.end());
  if (out.size() < pad_to) out.resize(pad_to, 0);
  return out;
}

auto Detect(const std::vector<uint8_t>& bytes) -> RawContainer {
  return DetectRawContainer(bytes.data(), bytes.size());
}
}  // namespace

TEST(SupportedFileType, DetectsTiffFamilies) {
  EXPECT_EQ(Detect(Bytes(std::string("II*\0", 4))), RawContainer::Tiff);
  EXPECT_EQ(Detect(Bytes(std::string("MM\0*", 4))), RawContainer::Tiff);
  EXPECT_EQ(Detect(test::DngBuilder::Build({})), RawContainer::Tiff);
}

TEST(SupportedFileType, DetectsVendorContainers) {
  EXPECT_EQ(Detect(Bytes("IIRO")), RawContainer::OlympusOrf);
  EXPECT_EQ(Detect(Bytes(std::string("IIU\0", 4))), RawContainer::PanasonicRw2);
  EXPECT_EQ(Detect(Bytes("FUJIFILMCCD-RAW 0201")), RawContainer::FujiRaf);
  EXPECT_EQ(Detect(Bytes(std::string("\0\0\0\x18" "ftypcrx ", 12))), RawContainer::CanonCr3);
  EXPECT_EQ(Detect(Bytes(std::string("II\x1a\0\0\0HEAPCCDR", 14))), RawContainer::CanonCrw);
  EXPECT_EQ(Detect(Bytes("FOVb")), RawContainer::SigmaX3f);
  EXPECT_EQ(Detect(Bytes(std::string("\0MRM", 4))), RawContainer::MinoltaMrw);
}

TEST(SupportedFileType, RejectsOtherFormats) {
  EXPECT_EQ(Detect(Bytes("\xff\xd8\xff\xe0")), RawContainer::Unknown);
  EXPECT_EQ(Detect(Bytes("\x89PNG\r\n\x1a\n")), RawContainer::Unknown);
  EXPECT_EQ(Detect(Bytes("hello, world")), RawContainer::Unknown);
}

TEST(SupportedFileType, ShortInputsAreUnknown) {
  EXPECT_EQ(DetectRawContainer(nullptr, 0), RawContainer::Unknown);
  const std::vector<uint8_t> three = {'I', 'I', '*'};
  EXPECT_EQ(Detect(three), RawContainer::Unknown);
  const std::vector<uint8_t> fuji_prefix = {'F', 'U', 'J', 'I', 'F', 'I', 'L', 'M'};
  EXPECT_EQ(Detect(fuji_prefix), RawContainer::Unknown);
}

TEST(SupportedFileType, ContainerNames) {
  EXPECT_EQ(RawContainerName(RawContainer::Tiff), "tiff");
  EXPECT_EQ(RawContainerName(RawContainer::CanonCr3), "cr3");
  EXPECT_EQ(RawContainerName(RawContainer::Unknown), "unknown");
}
};  // namespace rawthumb
