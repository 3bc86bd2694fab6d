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

#include "error/error.hpp"

namespace rawthumb {
auto ErrorKindName(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::EmptyInput:
      return "EmptyInput";
    case ErrorKind::UnsupportedFormat:
      return "UnsupportedFormat";
    case ErrorKind::CorruptData:
      return "CorruptData";
    case ErrorKind::InvalidOptions:
      return "InvalidOptions";
    case ErrorKind::EncodeFailed:
      return "EncodeFailed";
    case ErrorKind::PayloadTooLarge:
      return "PayloadTooLarge";
    case ErrorKind::Timeout:
      return "Timeout";
    case ErrorKind::Overloaded:
      return "Overloaded";
    case ErrorKind::Cancelled:
      return "Cancelled";
    case ErrorKind::InternalError:
    default:
      return "InternalError";
  }
}
};  // namespace rawthumb
