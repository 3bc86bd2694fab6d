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

#include <libraw/libraw.h>

#include <cstddef>

namespace rawthumb {
/**
 * @brief LibRaw memory datastream that records reads running past the end of the buffer.
 *
 * LibRaw tolerates short reads while unpacking and fills the missing samples, so a truncated
 * upload would otherwise decode into a partially black image. Several unpackers read ahead in
 * fixed blocks or a few bytes past the last sample, so the unpacking phase (after Arm()) counts
 * the bytes requested beyond the end instead of the number of short reads. The container parsing
 * phase counts short reads.
 */
class CheckedBufferDatastream : public LibRaw_buffer_datastream {
 private:
  bool   armed_                = false;
  size_t parse_short_reads_    = 0;
  size_t unpack_overrun_bytes_ = 0;
  size_t reported_data_errors_ = 0;

  void   RecordShortRead(size_t missing_bytes);

 public:
  CheckedBufferDatastream(const void* buffer, size_t size);

  int    read(void* ptr, size_t size, size_t nmemb) override;
  int    get_char() override;

  void   Arm() { armed_ = true; }
  void   RecordDataError() { ++reported_data_errors_; }

  auto   ParseShortReads() const -> size_t { return parse_short_reads_; }
  auto   UnpackOverrunBytes() const -> size_t { return unpack_overrun_bytes_; }
  auto   DataErrors() const -> size_t { return reported_data_errors_; }
};
};  // namespace rawthumb
