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
 * @file        raw_thumb/src/include/type/type.hpp
 * @brief       collection of wrapper types
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rawthumb {

#define request_id_t uint64_t

#define byte_buffer_t std::vector<uint8_t>
};  // namespace rawthumb
