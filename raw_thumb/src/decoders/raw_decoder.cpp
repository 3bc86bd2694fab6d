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

/*
 * @file        raw_thumb/src/decoders/raw_decoder.cpp
 * @brief       LibRaw adapter: RAW bytes in, 16-bit linear camera RGB out
 */

#include "decoders/raw_decoder.hpp"

#include <easy/profiler.h>
#include <libraw/libraw.h>
#include <libraw/libraw_const.h>

#include <algorithm>
#include <format>
#include <memory>
#include <new>
#include <opencv2/core.hpp>
#include <string_view>

#include "decoders/raw_datastream.hpp"
#include "error/error.hpp"
#include "image/metadata_extractor.hpp"

namespace rawthumb {
namespace {
// Unpackers may read a block or a few bytes past the last sample
constexpr size_t kMaxUnpackReadAhead = 64 * 1024;

struct ProgressContext {
  const CancelToken* cancel_ = nullptr;
};

int CancelProgressCallback(void* data, enum LibRaw_progress, int, int) {
  const auto* cancel = static_cast<const ProgressContext*>(data)->cancel_;
  return (cancel != nullptr && cancel->IsCancelled()) ? 1 : 0;
}

void DataErrorCallback(void* data, const char*, const int) {
  static_cast<CheckedBufferDatastream*>(data)->RecordDataError();
}

// Exposes the sensor data range LibRaw recorded while parsing the container
class RawProcessor : public LibRaw {
 public:
  auto DeclaredDataEnd() const -> int64_t {
    const auto& unpacker = libraw_internal_data.unpacker_data;
    if (unpacker.data_size <= 0) {
      return 0;
    }
    return static_cast<int64_t>(unpacker.data_offset) + static_cast<int64_t>(unpacker.data_size);
  }
};

auto UnpackReadAheadAllowance(size_t input_size) -> size_t {
  return std::min(kMaxUnpackReadAhead, input_size / 16);
}

auto KindFromLibRaw(int code) -> ErrorKind {
  switch (code) {
    case LIBRAW_FILE_UNSUPPORTED:
      return ErrorKind::UnsupportedFormat;
    case LIBRAW_TOO_BIG:
      return ErrorKind::PayloadTooLarge;
    case LIBRAW_CANCELLED_BY_CALLBACK:
      return ErrorKind::Cancelled;
    case LIBRAW_UNSUFFICIENT_MEMORY:
    case LIBRAW_OUT_OF_ORDER_CALL:
    case LIBRAW_NO_THUMBNAIL:
    case LIBRAW_UNSUPPORTED_THUMBNAIL:
    case LIBRAW_INPUT_CLOSED:
    case LIBRAW_NOT_IMPLEMENTED:
      return ErrorKind::InternalError;
    default:
      return ErrorKind::CorruptData;
  }
}

void CheckLibRaw(int code, std::string_view stage) {
  if (code == LIBRAW_SUCCESS) {
    return;
  }
  throw DecodeError(KindFromLibRaw(code),
                    std::format("RawDecoder: {} failed: {}", stage, libraw_strerror(code)));
}

void CheckCancelled(const CancelToken* cancel) {
  if (cancel != nullptr && cancel->IsCancelled()) {
    throw DecodeError(ErrorKind::Cancelled, "RawDecoder: decode cancelled");
  }
}

auto SniffContainer(const uint8_t* data, size_t size) -> RawContainer {
  if (data == nullptr || size == 0) {
    throw DecodeError(ErrorKind::EmptyInput, "RawDecoder: input is empty");
  }
  const RawContainer container = DetectRawContainer(data, size);
  if (container == RawContainer::Unknown) {
    throw DecodeError(ErrorKind::UnsupportedFormat,
                      "RawDecoder: input does not carry a known RAW signature");
  }
  return container;
}

// Opening a truncated container may make LibRaw give up with "unsupported". When the parser ran
// past the end of the buffer the file is broken rather than foreign.
void OpenStream(LibRaw& raw_processor, CheckedBufferDatastream& stream) {
  const int ret = raw_processor.open_datastream(&stream);
  if (ret == LIBRAW_FILE_UNSUPPORTED && stream.ParseShortReads() > 0) {
    throw DecodeError(ErrorKind::CorruptData, "RawDecoder: container is truncated");
  }
  CheckLibRaw(ret, "open");
}

using ProcessedImagePtr = std::unique_ptr<libraw_processed_image_t, void (*)(libraw_processed_image_t*)>;
}  // namespace

auto RawDecoder::CopyProcessedImage(const libraw_processed_image_t& img) -> cv::Mat {
  if (img.type == LIBRAW_IMAGE_BITMAP && img.colors == 4) {
    throw DecodeError(ErrorKind::UnsupportedFormat,
                      "RawDecoder: four-colour sensor output is not supported");
  }
  if (img.type != LIBRAW_IMAGE_BITMAP || img.bits != 16 || (img.colors != 1 && img.colors != 3) ||
      img.width == 0 || img.height == 0) {
    throw DecodeError(ErrorKind::CorruptData,
                      std::format("RawDecoder: unexpected LibRaw output ({}x{}, {} colors, {} bits)",
                                  img.width, img.height, img.colors, img.bits));
  }
  const size_t expected = static_cast<size_t>(img.width) * img.height * img.colors * sizeof(uint16_t);
  if (static_cast<size_t>(img.data_size) != expected) {
    throw DecodeError(ErrorKind::CorruptData,
                      std::format("RawDecoder: LibRaw output holds {} bytes, expected {}",
                                  img.data_size, expected));
  }
  cv::Mat view(static_cast<int>(img.height), static_cast<int>(img.width),
               CV_MAKETYPE(CV_16U, img.colors), const_cast<unsigned char*>(img.data));
  return view.clone();
}

auto RawDecoder::Decode(const uint8_t* data, size_t size, const RawDecodeParams& params,
                        const CancelToken* cancel) const -> DecodedImage {
  const RawContainer container = SniffContainer(data, size);
  CheckCancelled(cancel);

  try {
    EASY_BLOCK("LibRaw Unpacking");
    // The stream must outlive the processor that reads from it
    CheckedBufferDatastream stream(data, size);
    ProgressContext         progress{cancel};
    auto                    raw_processor = std::make_unique<RawProcessor>();
    raw_processor->set_progress_handler(CancelProgressCallback, &progress);
    raw_processor->set_dataerror_handler(DataErrorCallback, &stream);
    raw_processor->imgdata.rawparams.max_raw_memory_mb = params.max_raw_memory_mb_;

    OpenStream(*raw_processor, stream);
    CaptureMetadata metadata    = MetadataExtractor::FromLibRaw(*raw_processor, container);
    const int       orientation = metadata.orientation_;

    auto&           p           = raw_processor->imgdata.params;
    // Camera RGB, linear, 16 bit. Color conversion and orientation are done by the pipeline.
    p.output_color              = 0;
    p.output_bps                = 16;
    p.gamm[0]                   = 1.0;
    p.gamm[1]                   = 1.0;
    p.no_auto_bright            = params.auto_bright_ ? 0 : 1;
    p.use_camera_wb             = params.white_balance_ == WhiteBalanceMode::CAMERA ? 1 : 0;
    p.use_auto_wb               = params.white_balance_ == WhiteBalanceMode::AUTO ? 1 : 0;
    p.half_size                 = params.half_size_ ? 1 : 0;
    p.user_flip                 = 0;

    const int64_t data_end = raw_processor->DeclaredDataEnd();
    if (data_end > static_cast<int64_t>(size)) {
      throw DecodeError(ErrorKind::CorruptData,
                        std::format("RawDecoder: sensor data ends at byte {} but the input holds {}",
                                    data_end, size));
    }

    stream.Arm();
    CheckLibRaw(raw_processor->unpack(), "unpack");
    if (stream.DataErrors() > 0 || stream.UnpackOverrunBytes() > UnpackReadAheadAllowance(size)) {
      throw DecodeError(ErrorKind::CorruptData,
                        std::format("RawDecoder: sensor data is truncated or damaged ({} bytes "
                                    "missing, {} data errors)",
                                    stream.UnpackOverrunBytes(), stream.DataErrors()));
    }
    CheckCancelled(cancel);
    EASY_END_BLOCK;

    EASY_BLOCK("LibRaw Processing");
    CheckLibRaw(raw_processor->dcraw_process(), "process");

    ColorProfile profile;
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 3; ++j) {
        profile.camera_to_srgb_(i, j) = raw_processor->imgdata.color.rgb_cam[i][j];
      }
    }

    int               err = LIBRAW_SUCCESS;
    ProcessedImagePtr processed(raw_processor->dcraw_make_mem_image(&err),
                                &LibRaw::dcraw_clear_mem);
    CheckLibRaw(err, "render");
    if (!processed) {
      throw DecodeError(ErrorKind::InternalError, "RawDecoder: LibRaw returned no image");
    }
    cv::Mat pixels = CopyProcessedImage(*processed);
    processed.reset();
    raw_processor->recycle();
    EASY_END_BLOCK;

    DecodedImage image(std::move(pixels), 16, std::move(profile), orientation,
                       std::move(metadata), container);
    if (params.read_exif_) {
      if (auto exif = MetadataExtractor::ExtractEXIFFromBuffer(data, size)) {
        image.SetExif(std::move(*exif));
      }
    }
    return image;
  } catch (const std::bad_alloc&) {
    throw DecodeError(ErrorKind::InternalError, "RawDecoder: out of memory while decoding");
  } catch (const cv::Exception& e) {
    throw DecodeError(ErrorKind::InternalError, std::format("RawDecoder: {}", e.what()));
  }
}

auto RawDecoder::ReadMetadata(const uint8_t* data, size_t size,
                              const RawDecodeParams& params) const -> CaptureMetadata {
  const RawContainer container = SniffContainer(data, size);
  try {
    CheckedBufferDatastream stream(data, size);
    auto                    raw_processor = std::make_unique<LibRaw>();
    raw_processor->imgdata.rawparams.max_raw_memory_mb = params.max_raw_memory_mb_;
    OpenStream(*raw_processor, stream);
    return MetadataExtractor::FromLibRaw(*raw_processor, container);
  } catch (const std::bad_alloc&) {
    throw DecodeError(ErrorKind::InternalError, "RawDecoder: out of memory while reading metadata");
  }
}
};  // namespace rawthumb
