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

#include "concurrency/thread_pool.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

namespace rawthumb {
ThreadPool::ThreadPool(size_t thread_count, size_t queue_depth)
    : capacity(std::max<size_t>(thread_count, 1) + queue_depth), stop(false) {
  thread_count = std::max<size_t>(thread_count, 1);
  for (size_t i = 0; i < thread_count; ++i) {
    workers.emplace_back(&ThreadPool::WorkerThread, this);
  }
}

ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(mtx);
    stop = true;
  }
  condition.notify_all();
  for (std::thread& worker : workers) {
    worker.join();
  }
}

auto ThreadPool::TrySubmit(std::function<void()> task) -> bool {
  {
    std::lock_guard<std::mutex> lock(mtx);
    if (stop || in_flight >= capacity) {
      return false;
    }
    ++in_flight;
    tasks.push(std::move(task));
  }
  condition.notify_one();
  return true;
}

auto ThreadPool::InFlight() const -> size_t {
  std::lock_guard<std::mutex> lock(mtx);
  return in_flight;
}

auto ThreadPool::DefaultThreadCount() -> size_t {
  return std::max<size_t>(std::thread::hardware_concurrency(), 1);
}

void ThreadPool::WorkerThread() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx);
      condition.wait(lock, [this] { return stop || !tasks.empty(); });
      if (stop && tasks.empty()) return;
      task = std::move(tasks.front());
      tasks.pop();
    }
    try {
      task();
    } catch (const std::exception& e) {
      std::cerr << std::format("[ERROR] ThreadPool: task escaped with exception: {}\n", e.what());
    }
    // Drop captured buffers before the slot is handed to the next request
    task = nullptr;
    {
      std::lock_guard<std::mutex> lock(mtx);
      --in_flight;
    }
  }
}

};  // namespace rawthumb
