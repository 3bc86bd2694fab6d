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

#include "image/metadata_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <ctime>
#include <exiv2/exiv2.hpp>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace rawthumb {
namespace {
auto IsFinitePositive(float value) -> bool { return std::isfinite(value) && value > 0.0f; }

auto TrimTrailingZeroPadded(const char* s, size_t max_len = 256) -> std::string {
  if (!s) return {};
  size_t len = strnlen(s, max_len);
  while (len > 0 && (s[len - 1] == '\0' || std::isspace(static_cast<unsigned char>(s[len - 1])))) {
    --len;
  }
  return {s, len};
}

auto TrimAscii(const std::string& value) -> std::string {
  std::string out = value;
  while (!out.empty() &&
         (out.back() == '\0' || std::isspace(static_cast<unsigned char>(out.back())))) {
    out.pop_back();
  }
  size_t begin = 0;
  while (begin < out.size() &&
         (out[begin] == '\0' || std::isspace(static_cast<unsigned char>(out[begin])))) {
    ++begin;
  }
  if (begin > 0) {
    out.erase(0, begin);
  }
  return out;
}

auto FormatTimestamp(time_t ts) -> std::string {
  if (ts <= 0) return {};
  struct tm t {};
  gmtime_r(&ts, &t);
  char buf[64] = {};
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &t);
  return buf;
}

// Descriptive IFD0 tags worth carrying into a rendered image; the rest of IFD0 describes the
// RAW container layout.
const std::unordered_set<std::string> kImageTagsToCopy = {
    "Make", "Model", "Software", "DateTime", "Artist", "Copyright", "ImageDescription"};

const std::unordered_set<std::string> kPhotoTagsToSkip = {"MakerNote", "PixelXDimension",
                                                          "PixelYDimension"};
}  // namespace

void MetadataExtractor::InitializeLibraries() {
  Exiv2::XmpParser::initialize();
  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::error);
}

auto MetadataExtractor::FlipToExifOrientation(int flip) -> int {
  switch (flip) {
    case 3:
      return 3;
    case 5:
      return 8;
    case 6:
      return 6;
    default:
      return 1;
  }
}

auto MetadataExtractor::FromLibRaw(const LibRaw& raw_processor, RawContainer container)
    -> CaptureMetadata {
  const auto&     imgdata = raw_processor.imgdata;
  CaptureMetadata metadata;

  metadata.make_          = TrimAscii(TrimTrailingZeroPadded(imgdata.idata.make, 64));
  metadata.model_         = TrimAscii(TrimTrailingZeroPadded(imgdata.idata.model, 64));

  metadata.lens_make_     = TrimTrailingZeroPadded(imgdata.lens.LensMake, 128);
  metadata.lens_          = TrimTrailingZeroPadded(imgdata.lens.Lens, 128);
  if (metadata.lens_.empty()) {
    metadata.lens_ = TrimTrailingZeroPadded(imgdata.lens.makernotes.Lens, 128);
  }

  metadata.focal_ = imgdata.other.focal_len;
  if (!IsFinitePositive(metadata.focal_)) {
    metadata.focal_ = IsFinitePositive(imgdata.lens.makernotes.CurFocal)
                          ? imgdata.lens.makernotes.CurFocal
                          : 0.0f;
  }
  metadata.aperture_ = imgdata.other.aperture;
  if (!IsFinitePositive(metadata.aperture_)) {
    metadata.aperture_ =
        IsFinitePositive(imgdata.lens.makernotes.CurAp) ? imgdata.lens.makernotes.CurAp : 0.0f;
  }

  if (IsFinitePositive(imgdata.other.iso_speed)) {
    metadata.iso_ = static_cast<uint64_t>(std::lround(imgdata.other.iso_speed));
  }

  const float shutter_sec = imgdata.other.shutter;
  if (IsFinitePositive(shutter_sec)) {
    if (shutter_sec >= 1.0f) {
      metadata.shutter_speed_ = {static_cast<int>(shutter_sec), 1};
    } else {
      metadata.shutter_speed_ = {1, static_cast<int>(1.0f / shutter_sec + 0.5f)};
    }
  }

  metadata.width_         = static_cast<uint32_t>(imgdata.sizes.width);
  metadata.height_        = static_cast<uint32_t>(imgdata.sizes.height);
  metadata.orientation_   = FlipToExifOrientation(imgdata.sizes.flip);
  metadata.date_time_str_ = FormatTimestamp(imgdata.other.timestamp);
  metadata.container_     = std::string(RawContainerName(container));
  return metadata;
}

auto MetadataExtractor::ExtractEXIFFromBuffer(const uint8_t* buffer, size_t size)
    -> std::optional<Exiv2::ExifData> {
  if (!buffer || size == 0) {
    return std::nullopt;
  }
  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(buffer), size);
    image->readMetadata();
    if (image->exifData().empty()) {
      return std::nullopt;
    }
    return image->exifData();
  } catch (const Exiv2::Error& e) {
    std::cout << std::format("[WARN] MetadataExtractor: EXIF not readable: {}\n", e.what());
    return std::nullopt;
  }
}

auto MetadataExtractor::EmbedEXIF(const std::vector<uint8_t>& encoded,
                                  const Exiv2::ExifData& source, int width, int height)
    -> std::vector<uint8_t> {
  if (encoded.empty()) {
    throw std::runtime_error("MetadataExtractor: empty encoded image");
  }

  Exiv2::ExifData out;
  for (const auto& datum : source) {
    const std::string group = datum.groupName();
    const std::string tag   = datum.tagName();
    if (group == "Photo" && kPhotoTagsToSkip.count(tag) == 0) {
      out.add(datum);
    } else if (group == "GPSInfo") {
      out.add(datum);
    } else if (group == "Image" && kImageTagsToCopy.count(tag) > 0) {
      out.add(datum);
    }
  }
  out["Exif.Image.Orientation"]     = static_cast<uint16_t>(1);
  out["Exif.Photo.PixelXDimension"] = static_cast<uint32_t>(width);
  out["Exif.Photo.PixelYDimension"] = static_cast<uint32_t>(height);

  Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(
      reinterpret_cast<const Exiv2::byte*>(encoded.data()), encoded.size());
  image->readMetadata();
  image->setExifData(out);
  image->writeMetadata();

  Exiv2::BasicIo& io = image->io();
  if (io.open() != 0) {
    throw std::runtime_error("MetadataExtractor: unable to reopen rewritten image");
  }
  Exiv2::IoCloser closer(io);
  Exiv2::DataBuf  rewritten = io.read(io.size());
  if (rewritten.empty()) {
    throw std::runtime_error("MetadataExtractor: rewritten image is empty");
  }
  return {rewritten.c_data(), rewritten.c_data() + rewritten.size()};
}
};  // namespace rawthumb
