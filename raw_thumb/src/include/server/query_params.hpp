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

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "pipeline/conversion_options.hpp"

namespace rawthumb {
/**
 * @brief Decoded key/value pairs of a request target's query string. A repeated key keeps its
 * last value.
 */
class QueryParams {
 private:
  std::map<std::string, std::string> values_;

 public:
  /**
   * @brief Split "path?query" and decode the query part.
   *
   * @throws ServiceError InvalidOptions on a malformed percent escape
   */
  static auto Parse(std::string_view query) -> QueryParams;

  auto        Get(const std::string& key) const -> std::optional<std::string>;
  auto        Size() const -> size_t { return values_.size(); }

  auto        GetInt(const std::string& key) const -> std::optional<int>;
  auto        GetBool(const std::string& key) const -> std::optional<bool>;
};

// Path part of a request target, without the query string
auto TargetPath(std::string_view target) -> std::string_view;
// Query part of a request target, empty when there is none
auto TargetQuery(std::string_view target) -> std::string_view;

/**
 * @brief Overlay query parameters on `base`. Unknown keys are ignored.
 *
 * @throws ServiceError InvalidOptions when a known key carries an unparsable value
 */
auto ApplyQueryToOptions(const QueryParams& query, ConversionOptions base) -> ConversionOptions;
};  // namespace rawthumb
