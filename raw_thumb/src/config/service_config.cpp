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

#include "config/service_config.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include "concurrency/thread_pool.hpp"

namespace rawthumb {
namespace {
template <typename T>
auto ParseNumber(std::string_view text, const char* name) -> T {
  T          value{};
  const auto end          = text.data() + text.size();
  auto [ptr, ec]          = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    throw std::invalid_argument(std::format("ServiceConfig: {} is not a valid number: '{}'", name,
                                            text));
  }
  return value;
}

// Upper bounds for the pool and connection settings
constexpr size_t kMaxWorkerThreads = 1024;
constexpr size_t kMaxQueueDepth    = 65536;
constexpr size_t kMaxConnections   = 65536;
constexpr int    kMaxOutputSide    = 65535;

// nlohmann converts numbers with a plain static_cast. Integers go through this check first so
// that out-of-range values are rejected instead of wrapping.
template <typename T>
auto CheckedInteger(const nlohmann::json& value, const char* key) -> T {
  if (value.is_number_unsigned()) {
    const auto v = value.get<uint64_t>();
    if (std::in_range<T>(v)) return static_cast<T>(v);
  } else if (value.is_number_integer()) {
    const auto v = value.get<int64_t>();
    if (std::in_range<T>(v)) return static_cast<T>(v);
  } else {
    throw std::invalid_argument(
        std::format("ServiceConfig: '{}' must be an integer, got {}", key, value.dump()));
  }
  throw std::invalid_argument(
      std::format("ServiceConfig: '{}' is out of range: {}", key, value.dump()));
}

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
  if (!j.contains(key)) {
    return;
  }
  if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    out = CheckedInteger<T>(j.at(key), key);
  } else {
    try {
      out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
      throw std::invalid_argument(
          std::format("ServiceConfig: bad value for '{}': {}", key, e.what()));
    }
  }
}
}  // namespace

auto ServiceConfig::FromJson(const nlohmann::json& j) -> ServiceConfig {
  if (!j.is_object()) {
    throw std::invalid_argument("ServiceConfig: configuration must be a JSON object");
  }
  ServiceConfig config;
  ReadKey(j, "listen_address", config.listen_address_);
  ReadKey(j, "port", config.port_);
  ReadKey(j, "max_upload_bytes", config.max_upload_bytes_);
  ReadKey(j, "request_timeout_ms", config.request_timeout_ms_);
  ReadKey(j, "worker_threads", config.worker_threads_);
  ReadKey(j, "queue_depth", config.queue_depth_);
  ReadKey(j, "max_connections", config.max_connections_);
  ReadKey(j, "max_raw_memory_mb", config.max_raw_memory_mb_);
  ReadKey(j, "max_output_dimension", config.max_output_dimension_);
  ReadKey(j, "max_output_pixels", config.max_output_pixels_);

  if (j.contains("default_options")) {
    const auto& defaults = j.at("default_options");
    std::string format   = std::string(FormatName(config.default_format_));
    ReadKey(defaults, "format", format);
    auto parsed = FormatFromName(format);
    if (!parsed) {
      throw std::invalid_argument(std::format("ServiceConfig: unknown format '{}'", format));
    }
    config.default_format_ = *parsed;
    ReadKey(defaults, "quality", config.default_quality_);
    ReadKey(defaults, "compression", config.default_compression_);
  }

  if (j.contains("thumbnail")) {
    const auto& thumb = j.at("thumbnail");
    ReadKey(thumb, "width", config.thumbnail_.width_);
    ReadKey(thumb, "height", config.thumbnail_.height_);
    ReadKey(thumb, "quality", config.thumbnail_.quality_);
    ReadKey(thumb, "half_size", config.thumbnail_.half_size_);
  }

  config.Validate();
  return config;
}

auto ServiceConfig::LoadFile(const std::filesystem::path& path) -> ServiceConfig {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument(
        std::format("ServiceConfig: cannot open config file '{}'", path.string()));
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument(
        std::format("ServiceConfig: '{}' is not valid JSON: {}", path.string(), e.what()));
  }
  return FromJson(j);
}

auto ServiceConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["listen_address"]       = listen_address_;
  j["port"]                 = port_;
  j["max_upload_bytes"]     = max_upload_bytes_;
  j["request_timeout_ms"]   = request_timeout_ms_;
  j["worker_threads"]       = worker_threads_;
  j["queue_depth"]          = queue_depth_;
  j["max_connections"]      = max_connections_;
  j["max_raw_memory_mb"]    = max_raw_memory_mb_;
  j["max_output_dimension"] = max_output_dimension_;
  j["max_output_pixels"]    = max_output_pixels_;
  j["default_options"]      = {{"format", std::string(FormatName(default_format_))},
                               {"quality", default_quality_},
                               {"compression", default_compression_}};
  j["thumbnail"]            = {{"width", thumbnail_.width_},
                               {"height", thumbnail_.height_},
                               {"quality", thumbnail_.quality_},
                               {"half_size", thumbnail_.half_size_}};
  return j;
}

void ServiceConfig::ApplyEnvironment(const std::function<const char*(const char*)>& getenv) {
  if (const char* port = getenv("PORT"); port != nullptr && *port != '\0') {
    port_ = ParseNumber<uint16_t>(port, "PORT");
  }
  if (const char* v = getenv("RAW_THUMB_MAX_UPLOAD_BYTES"); v != nullptr && *v != '\0') {
    max_upload_bytes_ = ParseNumber<size_t>(v, "RAW_THUMB_MAX_UPLOAD_BYTES");
  }
  if (const char* v = getenv("RAW_THUMB_TIMEOUT_MS"); v != nullptr && *v != '\0') {
    request_timeout_ms_ = ParseNumber<uint32_t>(v, "RAW_THUMB_TIMEOUT_MS");
  }
  if (const char* v = getenv("RAW_THUMB_WORKERS"); v != nullptr && *v != '\0') {
    worker_threads_ = ParseNumber<size_t>(v, "RAW_THUMB_WORKERS");
  }
  Validate();
}

void ServiceConfig::Validate() const {
  if (listen_address_.empty()) {
    throw std::invalid_argument("ServiceConfig: listen_address must not be empty");
  }
  if (max_upload_bytes_ == 0) {
    throw std::invalid_argument("ServiceConfig: max_upload_bytes must be positive");
  }
  if (request_timeout_ms_ == 0) {
    throw std::invalid_argument("ServiceConfig: request_timeout_ms must be positive");
  }
  if (worker_threads_ > kMaxWorkerThreads) {
    throw std::invalid_argument(
        std::format("ServiceConfig: worker_threads must be at most {}", kMaxWorkerThreads));
  }
  if (queue_depth_ > kMaxQueueDepth) {
    throw std::invalid_argument(
        std::format("ServiceConfig: queue_depth must be at most {}", kMaxQueueDepth));
  }
  if (max_connections_ == 0 || max_connections_ > kMaxConnections) {
    throw std::invalid_argument(
        std::format("ServiceConfig: max_connections must be within 1..{}", kMaxConnections));
  }
  if (max_output_dimension_ <= 0 || max_output_dimension_ > kMaxOutputSide) {
    throw std::invalid_argument(
        std::format("ServiceConfig: max_output_dimension must be within 1..{}", kMaxOutputSide));
  }
  if (max_output_pixels_ == 0) {
    throw std::invalid_argument("ServiceConfig: max_output_pixels must be positive");
  }
  if (max_raw_memory_mb_ == 0) {
    throw std::invalid_argument("ServiceConfig: max_raw_memory_mb must be positive");
  }
  if (default_quality_ < 1 || default_quality_ > 100 || thumbnail_.quality_ < 1 ||
      thumbnail_.quality_ > 100) {
    throw std::invalid_argument("ServiceConfig: quality must be within 1..100");
  }
  if (default_compression_ < 0 || default_compression_ > 9) {
    throw std::invalid_argument("ServiceConfig: compression must be within 0..9");
  }
  if (thumbnail_.width_ <= 0 || thumbnail_.height_ <= 0) {
    throw std::invalid_argument("ServiceConfig: thumbnail size must be positive");
  }
}

auto ServiceConfig::ResolvedWorkerThreads() const -> size_t {
  return worker_threads_ > 0 ? worker_threads_ : ThreadPool::DefaultThreadCount();
}

auto ServiceConfig::DefaultOptions() const -> ConversionOptions {
  ConversionOptions options;
  options.format_            = default_format_;
  options.quality_           = default_quality_;
  options.compression_level_ = default_compression_;
  return options;
}

auto ServiceConfig::ThumbnailOptions() const -> ConversionOptions {
  ConversionOptions options;
  options.format_            = OutputFormat::JPEG;
  options.quality_           = thumbnail_.quality_;
  options.target_width_      = thumbnail_.width_;
  options.target_height_     = thumbnail_.height_;
  options.fit_               = FitMode::CONTAIN;
  options.progressive_       = true;
  options.optimize_          = true;
  options.decode_.half_size_ = thumbnail_.half_size_;
  return options;
}

auto ServiceConfig::GetOutputLimits() const -> OutputLimits {
  OutputLimits limits;
  limits.max_dimension_ = max_output_dimension_;
  limits.max_pixels_    = max_output_pixels_;
  return limits;
}
};  // namespace rawthumb
