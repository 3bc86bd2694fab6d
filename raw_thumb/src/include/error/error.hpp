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

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rawthumb {
enum class ErrorKind : int {
  EmptyInput        = 0,
  UnsupportedFormat = 1,
  CorruptData       = 2,
  InvalidOptions    = 3,
  EncodeFailed      = 4,
  PayloadTooLarge   = 5,
  Timeout           = 6,
  Overloaded        = 7,
  InternalError     = 8,
  // Work abandoned after a timeout or a client disconnect. Never reported to a client.
  Cancelled         = 9
};

auto ErrorKindName(ErrorKind kind) -> std::string_view;

/**
 * @brief Base of every typed failure in the service. The kind travels unchanged from the
 * component that raised it up to the HTTP status mapping.
 */
class RawThumbError : public std::runtime_error {
 private:
  ErrorKind kind_;

 public:
  RawThumbError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  auto Kind() const noexcept -> ErrorKind { return kind_; }
};

class DecodeError : public RawThumbError {
 public:
  using RawThumbError::RawThumbError;
};

class ConversionError : public RawThumbError {
 public:
  using RawThumbError::RawThumbError;
};

/**
 * @brief Error surfaced by the request handler and the frontend. Carries the component the
 * failure originated from ("decoder", "pipeline", "handler", "frontend").
 */
class ServiceError : public RawThumbError {
 private:
  std::string component_;

 public:
  ServiceError(ErrorKind kind, std::string component, const std::string& message)
      : RawThumbError(kind, message), component_(std::move(component)) {}

  auto Component() const noexcept -> const std::string& { return component_; }
};
};  // namespace rawthumb
