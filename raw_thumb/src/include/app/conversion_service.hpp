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
#include <string>
#include <vector>

#include "concurrency/cancel_token.hpp"
#include "decoders/raw_decoder.hpp"
#include "image/metadata.hpp"
#include "pipeline/conversion_options.hpp"
#include "pipeline/conversion_pipeline.hpp"
#include "type/type.hpp"

namespace rawthumb {
/**
 * @brief One uploaded file. Lives as long as the request that carried it.
 */
struct UploadedAsset {
  byte_buffer_t bytes_;
  std::string   declared_type_;
  std::string   file_name_;

  auto          Size() const -> size_t { return bytes_.size(); }
};

/**
 * @brief Request handler: decode, then convert. Holds only immutable limits, so a single
 * instance serves every worker thread.
 */
class ConversionService {
 private:
  size_t             max_upload_bytes_;
  unsigned           max_raw_memory_mb_;

  RawDecoder         decoder_;
  ConversionPipeline pipeline_;

  void               CheckUpload(const UploadedAsset& asset) const;

 public:
  ConversionService() = delete;
  ConversionService(size_t max_upload_bytes, unsigned max_raw_memory_mb,
                    OutputLimits output_limits = {})
      : max_upload_bytes_(max_upload_bytes),
        max_raw_memory_mb_(max_raw_memory_mb),
        pipeline_(output_limits) {}

  /**
   * @brief Convert one uploaded RAW file.
   *
   * @throws ServiceError with the kind of the underlying failure and the component that raised
   * it ("decoder", "pipeline", "handler")
   */
  auto Handle(const UploadedAsset& asset, const ConversionOptions& options,
              const CancelToken* cancel = nullptr) const -> ConversionResult;

  /**
   * @brief Capture metadata of an uploaded RAW file without decoding its pixels.
   */
  auto Inspect(const UploadedAsset& asset) const -> CaptureMetadata;

  auto MaxUploadBytes() const -> size_t { return max_upload_bytes_; }
};
};  // namespace rawthumb
