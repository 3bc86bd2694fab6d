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

#include <atomic>

namespace rawthumb {
/**
 * @brief Per-request cancellation flag. Set by the frontend on timeout or client disconnect,
 * polled by the decoder and the conversion pipeline at their checkpoints.
 */
class CancelToken {
 private:
  std::atomic<bool> cancelled_{false};

 public:
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  auto IsCancelled() const noexcept -> bool { return cancelled_.load(std::memory_order_acquire); }
};
};  // namespace rawthumb
