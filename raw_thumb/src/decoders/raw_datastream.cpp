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

#include "decoders/raw_datastream.hpp"

namespace rawthumb {
CheckedBufferDatastream::CheckedBufferDatastream(const void* buffer, size_t size)
    : LibRaw_buffer_datastream(buffer, size) {}

void CheckedBufferDatastream::RecordShortRead(size_t missing_bytes) {
  if (armed_) {
    unpack_overrun_bytes_ += missing_bytes;
  } else {
    ++parse_short_reads_;
  }
}

int CheckedBufferDatastream::read(void* ptr, size_t size, size_t nmemb) {
  const int got = LibRaw_buffer_datastream::read(ptr, size, nmemb);
  if (size == 0 || nmemb == 0) {
    return got;
  }
  const size_t items = got < 0 ? 0 : static_cast<size_t>(got);
  if (items < nmemb) {
    RecordShortRead((nmemb - items) * size);
  }
  return got;
}

int CheckedBufferDatastream::get_char() {
  const int c = LibRaw_buffer_datastream::get_char();
  if (c < 0) {
    RecordShortRead(1);
  }
  return c;
}
};  // namespace rawthumb
