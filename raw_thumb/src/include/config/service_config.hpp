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
 * @file        raw_thumb/src/include/config/service_config.hpp
 * @brief       Service configuration: JSON file, then environment, then command line
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

#include "pipeline/conversion_options.hpp"

namespace rawthumb {
struct ThumbnailPreset {
  int  width_     = 800;
  int  height_    = 600;
  int  quality_   = 100;
  bool half_size_ = true;
};

struct ServiceConfig {
  std::string     listen_address_       = "0.0.0.0";
  uint16_t        port_                 = 3000;
  size_t          max_upload_bytes_     = 100ull * 1024 * 1024;
  uint32_t        request_timeout_ms_   = 30000;
  // 0 picks the hardware concurrency
  size_t          worker_threads_       = 0;
  size_t          queue_depth_          = 4;
  size_t          max_connections_      = 64;
  unsigned        max_raw_memory_mb_    = 2048;
  int             max_output_dimension_ = 20000;
  uint64_t        max_output_pixels_    = 160ull * 1000 * 1000;

  OutputFormat    default_format_       = OutputFormat::JPEG;
  int             default_quality_      = 92;
  int             default_compression_  = 6;

  ThumbnailPreset thumbnail_;

  /**
   * @brief Build a config from JSON. Missing keys keep their defaults.
   *
   * @throws std::invalid_argument on a value of the wrong type or out of range. Integers are
   * range checked against their field type before they are stored.
   */
  static auto     FromJson(const nlohmann::json& j) -> ServiceConfig;
  static auto     LoadFile(const std::filesystem::path& path) -> ServiceConfig;
  auto            ToJson() const -> nlohmann::json;

  /**
   * @brief Apply PORT and the RAW_THUMB_* overrides. `getenv` is injectable for tests.
   */
  void            ApplyEnvironment(const std::function<const char*(const char*)>& getenv);

  void            Validate() const;

  auto            ResolvedWorkerThreads() const -> size_t;
  auto            DefaultOptions() const -> ConversionOptions;
  auto            ThumbnailOptions() const -> ConversionOptions;
  auto            GetOutputLimits() const -> OutputLimits;
};
};  // namespace rawthumb
