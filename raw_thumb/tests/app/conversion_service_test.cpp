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

#include "app/conversion_service.hpp"

#include <gtest/gtest.h>

#include <exiv2/exiv2.hpp>
#include <future>
#include <opencv2/imgcodecs.hpp>
#include <vector>

#include "error/error.hpp"
#include "image/metadata_extractor.hpp"
#include "raw/dng_fixture.hpp"

namespace rawthumb {
namespace {
constexpr size_t kLimit = 1024 * 1024;

auto DngAsset(const test::DngSpec& spec = {}) -> UploadedAsset {
  UploadedAsset asset;
  asset.bytes_         = test::DngBuilder::Build(spec);
  asset.declared_type_ = "image/x-adobe-dng";
  asset.file_name_     = "synthetic.dng";
  return asset;
}

auto HandleError(const ConversionService& service, const UploadedAsset& asset,
                 const ConversionOptions& options = {}) -> ServiceError {
  try {
    service.Handle(asset, options);
  } catch (const ServiceError& e) {
    return e;
  }
  ADD_FAILURE() << "request unexpectedly succeeded";
  return ServiceError(ErrorKind::InternalError, "test", "no error");
}

class ConversionServiceTests : public ::testing::Test {
 protected:
  static void SetUpTestSuite() { MetadataExtractor::InitializeLibraries(); }

  ConversionService service_{kLimit, 512};
};
}  // namespace

TEST_F(ConversionServiceTests, ConvertsDngToJpegOfSameSize) {
  ConversionResult result = service_.Handle(DngAsset(), ConversionOptions{});
  EXPECT_EQ(result.content_type_, "image/jpeg");

  cv::Mat decoded = cv::imdecode(result.bytes_, cv::IMREAD_COLOR);
  ASSERT_FALSE(decoded.empty());
  EXPECT_EQ(decoded.cols, 96);
  EXPECT_EQ(decoded.rows, 64);
}

TEST_F(ConversionServiceTests, DecodeAndConvertIsByteIdentical) {
  ConversionOptions options;
  options.target_width_ = 50;
  ConversionResult a    = service_.Handle(DngAsset(), options);
  ConversionResult b    = service_.Handle(DngAsset(), options);
  EXPECT_EQ(a.bytes_, b.bytes_);
}

TEST_F(ConversionServiceTests, OversizeUploadIsRejectedBeforeDecoding) {
  UploadedAsset asset;
  // Not a RAW file at all: a decoder run would report UnsupportedFormat instead
  asset.bytes_.assign(kLimit + 1, 0x42);
  ServiceError error = HandleError(service_, asset);
  EXPECT_EQ(error.Kind(), ErrorKind::PayloadTooLarge);
  EXPECT_EQ(error.Component(), "handler");
}

TEST_F(ConversionServiceTests, EmptyUpload) {
  ServiceError error = HandleError(service_, UploadedAsset{});
  EXPECT_EQ(error.Kind(), ErrorKind::EmptyInput);
}

TEST_F(ConversionServiceTests, KeepsKindAndNamesComponent) {
  UploadedAsset junk;
  junk.bytes_.assign(256, 0x11);
  ServiceError unsupported = HandleError(service_, junk);
  EXPECT_EQ(unsupported.Kind(), ErrorKind::UnsupportedFormat);
  EXPECT_EQ(unsupported.Component(), "decoder");

  UploadedAsset truncated = DngAsset();
  truncated.bytes_.resize(truncated.bytes_.size() / 2);
  ServiceError corrupt = HandleError(service_, truncated);
  EXPECT_EQ(corrupt.Kind(), ErrorKind::CorruptData);
  EXPECT_EQ(corrupt.Component(), "decoder");

  ConversionOptions bad;
  bad.target_width_    = -1;
  ServiceError invalid = HandleError(service_, DngAsset(), bad);
  EXPECT_EQ(invalid.Kind(), ErrorKind::InvalidOptions);
  EXPECT_EQ(invalid.Component(), "pipeline");

  ConversionOptions jpeg16;
  jpeg16.bit_depth_   = 16;
  ServiceError encode = HandleError(service_, DngAsset(), jpeg16);
  EXPECT_EQ(encode.Kind(), ErrorKind::EncodeFailed);
}

TEST_F(ConversionServiceTests, ConcurrentRequestsAreIndependent) {
  test::DngSpec first;
  first.seed_ = 7;
  test::DngSpec second;
  second.seed_   = 99;
  second.width_  = 128;
  second.height_ = 80;

  const auto expected_a = service_.Handle(DngAsset(first), ConversionOptions{});
  const auto expected_b = service_.Handle(DngAsset(second), ConversionOptions{});

  auto       a = std::async(std::launch::async,
                            [&] { return service_.Handle(DngAsset(first), ConversionOptions{}); });
  auto       b = std::async(std::launch::async,
                            [&] { return service_.Handle(DngAsset(second), ConversionOptions{}); });
  const auto result_a = a.get();
  const auto result_b = b.get();

  EXPECT_EQ(result_a.bytes_, expected_a.bytes_);
  EXPECT_EQ(result_b.bytes_, expected_b.bytes_);
  EXPECT_EQ(result_b.width_, 128);
  EXPECT_EQ(result_b.height_, 80);
}

TEST_F(ConversionServiceTests, KeepExifCarriesCameraTags) {
  ConversionOptions options;
  options.keep_exif_      = true;
  ConversionResult result = service_.Handle(DngAsset(), options);

  Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(
      reinterpret_cast<const Exiv2::byte*>(result.bytes_.data()), result.bytes_.size());
  image->readMetadata();
  const auto& exif = image->exifData();
  auto        make = exif.findKey(Exiv2::ExifKey("Exif.Image.Make"));
  ASSERT_NE(make, exif.end());
  EXPECT_EQ(make->toString(), "RawThumb");
  auto orientation = exif.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
  ASSERT_NE(orientation, exif.end());
  EXPECT_EQ(orientation->toInt64(), 1);
}

TEST_F(ConversionServiceTests, InspectReturnsCaptureMetadata) {
  test::DngSpec spec;
  spec.model_          = "Inspect Model";
  CaptureMetadata meta = service_.Inspect(DngAsset(spec));
  EXPECT_EQ(meta.make_, "RawThumb");
  EXPECT_EQ(meta.model_, "Inspect Model");
  EXPECT_EQ(meta.width_, 96u);
  EXPECT_EQ(meta.height_, 64u);
}
};  // namespace rawthumb
