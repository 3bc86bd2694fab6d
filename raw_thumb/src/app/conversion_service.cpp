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

#include <exception>
#include <format>
#include <new>
#include <utility>

#include "error/error.hpp"

namespace rawthumb {
namespace {
// Run one stage and rewrap its failures with the component name. The kind never changes.
template <typename Fn>
auto RunStage(const char* component, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const ServiceError&) {
    throw;
  } catch (const RawThumbError& e) {
    throw ServiceError(e.Kind(), component, e.what());
  } catch (const std::bad_alloc&) {
    throw ServiceError(ErrorKind::InternalError, component, "out of memory");
  } catch (const std::exception& e) {
    throw ServiceError(ErrorKind::InternalError, component, e.what());
  }
}
}  // namespace

void ConversionService::CheckUpload(const UploadedAsset& asset) const {
  if (asset.Size() > max_upload_bytes_) {
    throw ServiceError(ErrorKind::PayloadTooLarge, "handler",
                       std::format("upload of {} bytes exceeds the limit of {} bytes",
                                   asset.Size(), max_upload_bytes_));
  }
  if (asset.Size() == 0) {
    throw ServiceError(ErrorKind::EmptyInput, "handler", "upload is empty");
  }
}

auto ConversionService::Handle(const UploadedAsset& asset, const ConversionOptions& options,
                               const CancelToken* cancel) const -> ConversionResult {
  CheckUpload(asset);
  RunStage("pipeline", [&] {
    pipeline_.ValidateOptions(options);
    return 0;
  });

  RawDecodeParams decode_params    = options.decode_;
  decode_params.max_raw_memory_mb_ = max_raw_memory_mb_;
  decode_params.read_exif_         = options.keep_exif_;

  DecodedImage image = RunStage("decoder", [&] {
    return decoder_.Decode(asset.bytes_.data(), asset.Size(), decode_params, cancel);
  });
  return RunStage("pipeline",
                  [&] { return pipeline_.Convert(std::move(image), options, cancel); });
}

auto ConversionService::Inspect(const UploadedAsset& asset) const -> CaptureMetadata {
  CheckUpload(asset);
  RawDecodeParams params;
  params.max_raw_memory_mb_ = max_raw_memory_mb_;
  return RunStage("decoder",
                  [&] { return decoder_.ReadMetadata(asset.bytes_.data(), asset.Size(), params); });
}
};  // namespace rawthumb
