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
 * @file        raw_thumb/src/include/concurrency/thread_pool.hpp
 * @brief       A bounded thread pool that refuses work instead of queueing it indefinitely
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rawthumb {
class ThreadPool {
 public:
  /**
   * @brief Create a pool with thread_count workers. At most thread_count + queue_depth tasks
   * are admitted at once (running or waiting).
   */
  ThreadPool(size_t thread_count, size_t queue_depth);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /**
   * @brief Admit a task if the pool has room for it.
   *
   * @return false when the pool is saturated or shutting down; the task is not run.
   */
  auto        TrySubmit(std::function<void()> task) -> bool;

  auto        InFlight() const -> size_t;
  auto        Capacity() const -> size_t { return capacity; }
  auto        ThreadCount() const -> size_t { return workers.size(); }

  static auto DefaultThreadCount() -> size_t;

 private:
  std::queue<std::function<void()>> tasks;
  mutable std::mutex                mtx;
  std::condition_variable           condition;
  std::vector<std::thread>          workers;

  size_t                            capacity;
  size_t                            in_flight = 0;
  bool                              stop;

  void                              WorkerThread();
};
};  // namespace rawthumb
