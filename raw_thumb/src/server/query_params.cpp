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

#include "server/query_params.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <utility>

#include "error/error.hpp"

namespace rawthumb {
namespace {
auto InvalidOption(const std::string& key, const std::string& value) -> ServiceError {
  return ServiceError(ErrorKind::InvalidOptions, "frontend",
                      std::format("invalid value '{}' for parameter '{}'", value, key));
}

auto HexValue(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto PercentDecode(std::string_view in) -> std::string {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    const char c = in[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= in.size()) {
        throw ServiceError(ErrorKind::InvalidOptions, "frontend",
                           "truncated percent escape in query string");
      }
      const int hi = HexValue(in[i + 1]);
      const int lo = HexValue(in[i + 2]);
      if (hi < 0 || lo < 0) {
        throw ServiceError(ErrorKind::InvalidOptions, "frontend",
                           "malformed percent escape in query string");
      }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

auto ToLower(std::string value) -> std::string {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}
}  // namespace

auto TargetPath(std::string_view target) -> std::string_view {
  const auto pos = target.find('?');
  return pos == std::string_view::npos ? target : target.substr(0, pos);
}

auto TargetQuery(std::string_view target) -> std::string_view {
  const auto pos = target.find('?');
  return pos == std::string_view::npos ? std::string_view{} : target.substr(pos + 1);
}

auto QueryParams::Parse(std::string_view query) -> QueryParams {
  QueryParams params;
  while (!query.empty()) {
    const auto       amp  = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    const auto  eq    = pair.find('=');
    std::string key   = PercentDecode(pair.substr(0, eq));
    std::string value =
        eq == std::string_view::npos ? std::string{} : PercentDecode(pair.substr(eq + 1));
    if (!key.empty()) {
      params.values_[std::move(key)] = std::move(value);
    }
  }
  return params;
}

auto QueryParams::Get(const std::string& key) const -> std::optional<std::string> {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto QueryParams::GetInt(const std::string& key) const -> std::optional<int> {
  auto raw = Get(key);
  if (!raw) {
    return std::nullopt;
  }
  int         value = 0;
  const char* begin = raw->data();
  const char* end   = raw->data() + raw->size();
  auto [ptr, ec]    = std::from_chars(begin, end, value);
  if (raw->empty() || ec != std::errc() || ptr != end) {
    throw InvalidOption(key, *raw);
  }
  return value;
}

auto QueryParams::GetBool(const std::string& key) const -> std::optional<bool> {
  auto raw = Get(key);
  if (!raw) {
    return std::nullopt;
  }
  const std::string lower = ToLower(*raw);
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on" || lower.empty()) {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw InvalidOption(key, *raw);
}

auto ApplyQueryToOptions(const QueryParams& query, ConversionOptions base) -> ConversionOptions {
  if (auto format = query.Get("format")) {
    auto parsed = FormatFromName(*format);
    if (!parsed) throw InvalidOption("format", *format);
    base.format_ = *parsed;
  }
  if (auto quality = query.GetInt("quality")) base.quality_ = *quality;
  if (auto compression = query.GetInt("compression")) base.compression_level_ = *compression;
  if (auto depth = query.GetInt("depth")) base.bit_depth_ = *depth;
  if (auto width = query.GetInt("width")) base.target_width_ = *width;
  if (auto height = query.GetInt("height")) base.target_height_ = *height;
  if (auto fit = query.Get("fit")) {
    auto parsed = FitModeFromName(*fit);
    if (!parsed) throw InvalidOption("fit", *fit);
    base.fit_ = *parsed;
  }
  if (auto upscale = query.GetBool("upscale")) base.allow_upscale_ = *upscale;
  if (auto progressive = query.GetBool("progressive")) base.progressive_ = *progressive;
  if (auto optimize = query.GetBool("optimize")) base.optimize_ = *optimize;
  if (auto orient = query.GetBool("orient")) base.auto_orient_ = *orient;
  if (auto keep_exif = query.GetBool("keep_exif")) base.keep_exif_ = *keep_exif;
  if (auto half_size = query.GetBool("half_size")) base.decode_.half_size_ = *half_size;
  if (auto wb = query.Get("wb")) {
    auto parsed = WhiteBalanceFromName(*wb);
    if (!parsed) throw InvalidOption("wb", *wb);
    base.decode_.white_balance_ = *parsed;
  }
  if (auto auto_bright = query.GetBool("auto_bright")) base.decode_.auto_bright_ = *auto_bright;
  return base;
}
};  // namespace rawthumb
