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

#include <gtest/gtest.h>

#include <cstdint>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <utility>
#include <vector>

#include "error/error.hpp"

namespace rawthumb {
namespace {
auto MakeImage(int width = 96, int height = 64, int orientation = 1) -> DecodedImage {
  cv::Mat pixels(height, width, CV_16UC3);
  for (int y = 0; y < height; ++y) {
    auto* row = pixels.ptr<cv::Vec3w>(y);
    for (int x = 0; x < width; ++x) {
      row[x] = cv::Vec3w(static_cast<uint16_t>(x * 65535 / width),
                         static_cast<uint16_t>(y * 65535 / height),
                         static_cast<uint16_t>((x + y) * 300 % 65536));
    }
  }
  return DecodedImage(std::move(pixels), 16, ColorProfile{}, orientation, CaptureMetadata{},
                      RawContainer::Tiff);
}

auto Decode(const ConversionResult& result) -> cv::Mat {
  return cv::imdecode(result.bytes_, cv::IMREAD_UNCHANGED);
}

void ExpectConversionKind(const ConversionOptions& options, ErrorKind expected) {
  ConversionPipeline pipeline;
  DecodedImage       image = MakeImage();
  try {
    pipeline.Convert(std::move(image), options);
    ADD_FAILURE() << "conversion unexpectedly succeeded";
  } catch (const ConversionError& e) {
    EXPECT_EQ(e.Kind(), expected) << e.what();
  }
}
}  // namespace

TEST(DecodedImage, RejectsInconsistentBuffers) {
  auto expect_corrupt = [](cv::Mat pixels, int depth) {
    try {
      DecodedImage image(std::move(pixels), depth, ColorProfile{}, 1, CaptureMetadata{},
                         RawContainer::Tiff);
      ADD_FAILURE() << "construction unexpectedly succeeded";
    } catch (const DecodeError& e) {
      EXPECT_EQ(e.Kind(), ErrorKind::CorruptData);
    }
  };
  expect_corrupt(cv::Mat(), 16);
  expect_corrupt(cv::Mat(4, 4, CV_8UC3), 16);
  expect_corrupt(cv::Mat(4, 4, CV_16UC4), 16);
  expect_corrupt(cv::Mat(4, 4, CV_16UC3), 12);
  cv::Mat big(8, 8, CV_16UC3);
  expect_corrupt(big(cv::Rect(0, 0, 4, 4)), 16);
}

TEST(DecodedImage, ClampsUnknownOrientation) {
  cv::Mat      pixels(4, 4, CV_16UC3, cv::Scalar::all(0));
  DecodedImage image(std::move(pixels), 16, ColorProfile{}, 42, CaptureMetadata{},
                     RawContainer::Tiff);
  EXPECT_EQ(image.Orientation(), 1);
}

TEST(ConversionPipeline, EncodesJpegAtSourceSize) {
  ConversionResult result = ConversionPipeline{}.Convert(MakeImage(), ConversionOptions{});
  EXPECT_EQ(result.content_type_, "image/jpeg");
  EXPECT_EQ(result.width_, 96);
  EXPECT_EQ(result.height_, 64);
  EXPECT_EQ(result.Size(), result.bytes_.size());
  ASSERT_GE(result.bytes_.size(), 2u);
  EXPECT_EQ(result.bytes_[0], 0xff);
  EXPECT_EQ(result.bytes_[1], 0xd8);

  cv::Mat decoded = Decode(result);
  EXPECT_EQ(decoded.cols, 96);
  EXPECT_EQ(decoded.rows, 64);
  EXPECT_EQ(result.ETag().size(), 18u);
}

TEST(ConversionPipeline, OutputIsDeterministic) {
  ConversionOptions options;
  options.target_width_ = 40;
  options.progressive_  = true;
  ConversionResult a    = ConversionPipeline{}.Convert(MakeImage(), options);
  ConversionResult b    = ConversionPipeline{}.Convert(MakeImage(), options);
  EXPECT_EQ(a.bytes_, b.bytes_);
  EXPECT_EQ(a.hash_, b.hash_);
  EXPECT_EQ(a.ETag(), b.ETag());
}

TEST(ConversionPipeline, AppliesOrientation) {
  ConversionResult rotated = ConversionPipeline{}.Convert(MakeImage(96, 64, 6), ConversionOptions{});
  EXPECT_EQ(rotated.width_, 64);
  EXPECT_EQ(rotated.height_, 96);

  ConversionOptions keep;
  keep.auto_orient_          = false;
  ConversionResult unrotated = ConversionPipeline{}.Convert(MakeImage(96, 64, 6), keep);
  EXPECT_EQ(unrotated.width_, 96);
  EXPECT_EQ(unrotated.height_, 64);
}

TEST(ConversionPipeline, ResizeContainKeepsAspect) {
  ConversionOptions options;
  options.target_width_  = 48;
  options.target_height_ = 48;
  ConversionResult result = ConversionPipeline{}.Convert(MakeImage(), options);
  EXPECT_EQ(result.width_, 48);
  EXPECT_EQ(result.height_, 32);

  cv::Mat decoded = Decode(result);
  EXPECT_EQ(decoded.cols, 48);
  EXPECT_EQ(decoded.rows, 32);
}

TEST(ConversionPipeline, ResizeDerivesMissingSide) {
  ConversionOptions options;
  options.target_height_  = 16;
  ConversionResult result = ConversionPipeline{}.Convert(MakeImage(), options);
  EXPECT_EQ(result.width_, 24);
  EXPECT_EQ(result.height_, 16);
}

TEST(ConversionPipeline, UpscaleOnlyWhenAllowed) {
  ConversionOptions options;
  options.target_width_   = 192;
  ConversionResult capped = ConversionPipeline{}.Convert(MakeImage(), options);
  EXPECT_EQ(capped.width_, 96);
  EXPECT_EQ(capped.height_, 64);

  options.allow_upscale_ = true;
  ConversionResult grown = ConversionPipeline{}.Convert(MakeImage(), options);
  EXPECT_EQ(grown.width_, 192);
  EXPECT_EQ(grown.height_, 128);
}

TEST(ConversionPipeline, ExactFitStretches) {
  ConversionOptions options;
  options.target_width_   = 50;
  options.target_height_  = 50;
  options.fit_            = FitMode::EXACT;
  ConversionResult result = ConversionPipeline{}.Convert(MakeImage(), options);
  EXPECT_EQ(result.width_, 50);
  EXPECT_EQ(result.height_, 50);
}

TEST(ConversionPipeline, SixteenBitPng) {
  ConversionOptions options;
  options.format_            = OutputFormat::PNG;
  options.bit_depth_         = 16;
  options.compression_level_ = 9;
  ConversionResult result    = ConversionPipeline{}.Convert(MakeImage(), options);
  EXPECT_EQ(result.content_type_, "image/png");

  cv::Mat decoded = Decode(result);
  EXPECT_EQ(decoded.type(), CV_16UC3);
  EXPECT_EQ(decoded.cols, 96);
  EXPECT_EQ(decoded.rows, 64);
}

TEST(ConversionPipeline, InvalidTargetDimensions) {
  ConversionOptions zero_width;
  zero_width.target_width_ = 0;
  ExpectConversionKind(zero_width, ErrorKind::InvalidOptions);

  ConversionOptions negative_height;
  negative_height.target_width_  = 10;
  negative_height.target_height_ = -5;
  ExpectConversionKind(negative_height, ErrorKind::InvalidOptions);

  ConversionOptions exact_without_height;
  exact_without_height.target_width_ = 10;
  exact_without_height.fit_          = FitMode::EXACT;
  ExpectConversionKind(exact_without_height, ErrorKind::InvalidOptions);
}

TEST(ConversionPipeline, UpscaleBeyondOutputLimits) {
  ConversionOptions huge_exact;
  huge_exact.target_width_  = 30000;
  huge_exact.target_height_ = 30000;
  huge_exact.fit_           = FitMode::EXACT;
  huge_exact.allow_upscale_ = true;
  ExpectConversionKind(huge_exact, ErrorKind::InvalidOptions);

  // Each side is allowed on its own but the area is not
  OutputLimits limits;
  limits.max_dimension_ = 1000;
  limits.max_pixels_    = 100 * 1000;
  ConversionOptions wide;
  wide.target_width_  = 1000;
  wide.target_height_ = 1000;
  wide.fit_           = FitMode::EXACT;
  wide.allow_upscale_ = true;
  try {
    ConversionPipeline(limits).ValidateOptions(wide);
    ADD_FAILURE() << "validation unexpectedly succeeded";
  } catch (const ConversionError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidOptions);
  }

  // The derived side of a portrait source is only known after decoding
  ConversionOptions derived;
  derived.target_width_  = 900;
  derived.allow_upscale_ = true;
  try {
    ConversionPipeline(limits).Convert(MakeImage(64, 96), derived);
    ADD_FAILURE() << "conversion unexpectedly succeeded";
  } catch (const ConversionError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidOptions);
  }

  // Without upscale the same request is clamped to the source
  ConversionOptions clamped = huge_exact;
  clamped.allow_upscale_    = false;
  ConversionResult result   = ConversionPipeline{}.Convert(MakeImage(), clamped);
  EXPECT_EQ(result.width_, 96);
  EXPECT_EQ(result.height_, 64);
}

TEST(ConversionPipeline, InvalidEncoderSettings) {
  ConversionOptions quality;
  quality.quality_ = 0;
  ExpectConversionKind(quality, ErrorKind::InvalidOptions);

  ConversionOptions compression;
  compression.format_            = OutputFormat::PNG;
  compression.compression_level_ = 10;
  ExpectConversionKind(compression, ErrorKind::InvalidOptions);

  ConversionOptions depth;
  depth.bit_depth_ = 12;
  ExpectConversionKind(depth, ErrorKind::InvalidOptions);
}

TEST(ConversionPipeline, InvalidOptionsLeavePixelsUntouched) {
  DecodedImage      image = MakeImage();
  ConversionOptions options;
  options.target_height_ = 0;
  EXPECT_THROW(ConversionPipeline{}.Convert(std::move(image), options), ConversionError);
  EXPECT_TRUE(image.HasPixels());
}

TEST(ConversionPipeline, SixteenBitJpegFailsToEncode) {
  ConversionOptions options;
  options.bit_depth_ = 16;
  ExpectConversionKind(options, ErrorKind::EncodeFailed);
}

TEST(ConversionPipeline, HonoursCancellation) {
  CancelToken cancel;
  cancel.Cancel();
  try {
    ConversionPipeline{}.Convert(MakeImage(), ConversionOptions{}, &cancel);
    ADD_FAILURE() << "conversion unexpectedly succeeded";
  } catch (const ConversionError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::Cancelled);
  }
}
};  // namespace rawthumb
