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

#include "decoders/raw_decoder.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

#include "decoders/raw_datastream.hpp"
#include "error/error.hpp"
#include "raw/dng_fixture.hpp"

namespace rawthumb {
namespace {
void ExpectDecodeKind(const std::vector<uint8_t>& bytes, ErrorKind expected) {
  RawDecoder decoder;
  try {
    decoder.Decode(bytes.data(), bytes.size(), RawDecodeParams{});
    ADD_FAILURE() << "decode unexpectedly succeeded";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.Kind(), expected) << e.what();
  }
}

// Little-endian TIFF: value of a LONG tag in IFD0
auto FindLongTag(const std::vector<uint8_t>& bytes, uint16_t tag) -> uint32_t {
  auto u16 = [&](size_t at) { return static_cast<uint32_t>(bytes[at] | (bytes[at + 1] << 8)); };
  auto u32 = [&](size_t at) { return u16(at) | (u16(at + 2) << 16); };
  const uint32_t ifd   = u32(4);
  const uint32_t count = u16(ifd);
  for (uint32_t i = 0; i < count; ++i) {
    const size_t entry = ifd + 2 + i * 12;
    if (u16(entry) == tag) return u32(entry + 8);
  }
  return 0;
}

using ProcessedImage = std::unique_ptr<libraw_processed_image_t, decltype(&std::free)>;

auto MakeProcessedImage(uint16_t width, uint16_t height, uint16_t colors, uint16_t bits)
    -> ProcessedImage {
  const size_t bytes = static_cast<size_t>(width) * height * colors * (bits / 8);
  auto*        img   = static_cast<libraw_processed_image_t*>(
      std::calloc(1, sizeof(libraw_processed_image_t) + bytes));
  img->type      = LIBRAW_IMAGE_BITMAP;
  img->width     = width;
  img->height    = height;
  img->colors    = colors;
  img->bits      = bits;
  img->data_size = static_cast<unsigned>(bytes);
  return ProcessedImage(img, &std::free);
}
}  // namespace

TEST(RawDecoder, DecodesSyntheticDng) {
  const auto   bytes = test::DngBuilder::Build({});
  RawDecoder   decoder;
  DecodedImage image = decoder.Decode(bytes.data(), bytes.size(), RawDecodeParams{});

  EXPECT_EQ(image.Width(), 96);
  EXPECT_EQ(image.Height(), 64);
  EXPECT_EQ(image.Channels(), 3);
  EXPECT_EQ(image.BitDepth(), 16);
  EXPECT_EQ(image.Pixels().type(), CV_16UC3);
  EXPECT_EQ(image.Orientation(), 1);
  EXPECT_EQ(image.Container(), RawContainer::Tiff);
  EXPECT_EQ(image.Metadata().make_, "RawThumb");
  EXPECT_EQ(image.Profile().id_, "camera-linear");

  // Synthetic data is never black
  EXPECT_GT(cv::norm(image.Pixels(), cv::NORM_L1), 0.0);
}

TEST(RawDecoder, HalfSizeHalvesDimensions) {
  const auto      bytes = test::DngBuilder::Build({});
  RawDecodeParams params;
  params.half_size_ = true;
  DecodedImage image = RawDecoder{}.Decode(bytes.data(), bytes.size(), params);
  EXPECT_EQ(image.Width(), 48);
  EXPECT_EQ(image.Height(), 32);
}

TEST(RawDecoder, ReportsOrientationWithoutApplyingIt) {
  test::DngSpec spec;
  spec.orientation_  = 6;
  const auto   bytes = test::DngBuilder::Build(spec);
  DecodedImage image = RawDecoder{}.Decode(bytes.data(), bytes.size(), RawDecodeParams{});
  EXPECT_EQ(image.Orientation(), 6);
  EXPECT_EQ(image.Width(), 96);
  EXPECT_EQ(image.Height(), 64);
}

TEST(RawDecoder, IsDeterministic) {
  const auto   bytes = test::DngBuilder::Build({});
  DecodedImage a     = RawDecoder{}.Decode(bytes.data(), bytes.size(), RawDecodeParams{});
  DecodedImage b     = RawDecoder{}.Decode(bytes.data(), bytes.size(), RawDecodeParams{});
  EXPECT_EQ(cv::norm(a.Pixels(), b.Pixels(), cv::NORM_INF), 0.0);
}

TEST(RawDecoder, EmptyInput) {
  ExpectDecodeKind({}, ErrorKind::EmptyInput);
  RawDecoder decoder;
  try {
    decoder.Decode(nullptr, 0, RawDecodeParams{});
    ADD_FAILURE() << "decode unexpectedly succeeded";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::EmptyInput);
  }
}

TEST(RawDecoder, InputShorterThanAnySignature) {
  ExpectDecodeKind({'I', 'I'}, ErrorKind::UnsupportedFormat);
  ExpectDecodeKind({0x00}, ErrorKind::UnsupportedFormat);
}

TEST(RawDecoder, ForeignFormatIsUnsupported) {
  std::vector<uint8_t> jpeg = {0xff, 0xd8, 0xff, 0xe0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00};
  jpeg.resize(4096, 0);
  ExpectDecodeKind(jpeg, ErrorKind::UnsupportedFormat);
}

TEST(RawDecoder, TruncatedFileIsCorrupt) {
  auto bytes = test::DngBuilder::Build({});
  bytes.resize(bytes.size() / 2);
  ExpectDecodeKind(bytes, ErrorKind::CorruptData);
}

TEST(RawDecoder, StripEndingAtEndOfFileDecodes) {
  const auto bytes = test::DngBuilder::Build({});
  const uint32_t strip_offset = FindLongTag(bytes, 273);
  const uint32_t strip_bytes  = FindLongTag(bytes, 279);
  ASSERT_GT(strip_offset, 0u);
  ASSERT_EQ(static_cast<size_t>(strip_offset) + strip_bytes, bytes.size());

  DecodedImage image = RawDecoder{}.Decode(bytes.data(), bytes.size(), RawDecodeParams{});
  EXPECT_EQ(image.Pixels().cols, 96);
  EXPECT_EQ(image.Pixels().rows, 64);
}

TEST(RawDatastream, CountsBytesReadPastTheEnd) {
  std::vector<uint8_t>    buffer(100, 7);
  CheckedBufferDatastream stream(buffer.data(), buffer.size());
  std::vector<uint8_t>    sink(0x4000);

  // Container parsing counts short reads
  stream.seek(96, SEEK_SET);
  EXPECT_EQ(stream.read(sink.data(), 1, 8), 4);
  EXPECT_EQ(stream.ParseShortReads(), 1u);
  EXPECT_EQ(stream.UnpackOverrunBytes(), 0u);

  // Block read-ahead during unpacking counts the missing bytes
  stream.Arm();
  stream.seek(90, SEEK_SET);
  EXPECT_EQ(stream.read(sink.data(), 1, sink.size()), 10);
  EXPECT_EQ(stream.UnpackOverrunBytes(), sink.size() - 10);
  EXPECT_LT(stream.get_char(), 0);
  EXPECT_EQ(stream.UnpackOverrunBytes(), sink.size() - 9);
  EXPECT_EQ(stream.ParseShortReads(), 1u);
  EXPECT_EQ(stream.DataErrors(), 0u);
}

TEST(RawDecoder, CopyProcessedImageLayouts) {
  auto rgb = MakeProcessedImage(2, 2, 3, 16);
  std::memset(rgb->data, 0xff, rgb->data_size);
  cv::Mat pixels = RawDecoder::CopyProcessedImage(*rgb);
  EXPECT_EQ(pixels.type(), CV_16UC3);
  EXPECT_EQ(pixels.at<cv::Vec3w>(1, 1)[2], 0xffff);

  auto four_colour = MakeProcessedImage(2, 2, 4, 16);
  try {
    RawDecoder::CopyProcessedImage(*four_colour);
    ADD_FAILURE() << "four-colour output was accepted";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::UnsupportedFormat);
  }

  auto eight_bit = MakeProcessedImage(2, 2, 3, 8);
  try {
    RawDecoder::CopyProcessedImage(*eight_bit);
    ADD_FAILURE() << "8-bit output was accepted";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::CorruptData);
  }
}

TEST(RawDecoder, LiveCancelTokenLetsDecodeFinish) {
  const auto  bytes = test::DngBuilder::Build({});
  CancelToken cancel;
  DecodedImage image = RawDecoder{}.Decode(bytes.data(), bytes.size(), RawDecodeParams{}, &cancel);
  EXPECT_EQ(image.Pixels().cols, 96);
  EXPECT_FALSE(cancel.IsCancelled());
}

TEST(RawDecoder, CancelledBeforeStart) {
  const auto  bytes = test::DngBuilder::Build({});
  CancelToken cancel;
  cancel.Cancel();
  try {
    RawDecoder{}.Decode(bytes.data(), bytes.size(), RawDecodeParams{}, &cancel);
    ADD_FAILURE() << "decode unexpectedly succeeded";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::Cancelled);
  }
}

TEST(RawDecoder, ReadMetadataOnly) {
  test::DngSpec spec;
  spec.make_            = "Metadata Make";
  spec.orientation_     = 8;
  const auto      bytes = test::DngBuilder::Build(spec);
  CaptureMetadata meta  = RawDecoder{}.ReadMetadata(bytes.data(), bytes.size(), RawDecodeParams{});
  EXPECT_EQ(meta.make_, "Metadata Make");
  EXPECT_EQ(meta.orientation_, 8);
  EXPECT_EQ(meta.container_, "tiff");
  EXPECT_EQ(meta.ToJson()["Make"], "Metadata Make");
}

TEST(RawDecoder, RealSampleIfAvailable) {
  const std::filesystem::path dir = TEST_IMG_PATH;
  if (dir.empty() || !std::filesystem::exists(dir / "raw")) {
    GTEST_SKIP() << "TEST_IMG_PATH/raw not available";
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir / "raw")) {
    if (!entry.is_regular_file()) continue;
    std::ifstream        in(entry.path(), std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (DetectRawContainer(bytes.data(), bytes.size()) == RawContainer::Unknown) continue;

    RawDecodeParams params;
    params.half_size_ = true;
    DecodedImage image = RawDecoder{}.Decode(bytes.data(), bytes.size(), params);
    EXPECT_GT(image.Width(), 0) << entry.path();
    EXPECT_GT(image.Height(), 0) << entry.path();
    return;
  }
  GTEST_SKIP() << "no RAW sample found";
}
};  // namespace rawthumb
