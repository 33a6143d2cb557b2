//  Copyright 2026 Yurun Zi
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

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace darkroom {
/**
 * @brief Fixed set of workers draining a FIFO of tasks.
 *
 * The pool is fail-fast: the first task that throws cancels everything still queued, and
 * Wait() hands that exception back to the submitting thread. Tasks already running finish.
 */
class ThreadPool {
 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /**
   * @brief Queue a task. Ignored once the pool is cancelled.
   */
  void        Submit(std::function<void()> task);

  /**
   * @brief Block until nothing is queued or running, then rethrow the first task failure
   */
  void        Wait();

  /**
   * @brief Drop queued tasks and refuse new ones
   */
  void        Cancel();
  auto        IsCancelled() const -> bool;

  auto        Size() const -> size_t { return workers_.size(); }

 private:
  std::queue<std::function<void()>> tasks_;
  mutable std::mutex                mtx_;
  std::condition_variable           condition_;
  std::condition_variable           idle_;
  std::vector<std::thread>          workers_;

  size_t                            active_    = 0;
  bool                              stop_      = false;
  bool                              cancelled_ = false;
  std::exception_ptr                first_error_;

  void                              WorkerThread();
  // Caller holds mtx_
  void                              DropQueued();
};
};  // namespace darkroom
