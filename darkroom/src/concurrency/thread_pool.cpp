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

#include "concurrency/thread_pool.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace darkroom {
ThreadPool::ThreadPool(size_t thread_count) {
  if (thread_count == 0) {
    throw std::invalid_argument("[ERROR] ThreadPool: thread_count must be at least 1");
  }
  workers_.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerThread, this);
  }
}

ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(mtx_);
    stop_ = true;
  }
  condition_.notify_all();
  for (std::thread& worker : workers_) {
    worker.join();
  }
  if (first_error_) {
    std::cerr << "[WARN] ThreadPool: a task failed but Wait() was never called" << std::endl;
  }
}

void ThreadPool::Submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stop_) {
      throw std::runtime_error("[ERROR] ThreadPool: Submit after shutdown");
    }
    if (cancelled_) return;
    tasks_.push(std::move(task));
  }
  condition_.notify_one();
}

void ThreadPool::Wait() {
  std::exception_ptr error;
  {
    std::unique_lock<std::mutex> lock(mtx_);
    idle_.wait(lock, [this] { return active_ == 0 && tasks_.empty(); });
    error = std::exchange(first_error_, nullptr);
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

void ThreadPool::Cancel() {
  std::lock_guard<std::mutex> lock(mtx_);
  DropQueued();
}

auto ThreadPool::IsCancelled() const -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return cancelled_;
}

void ThreadPool::DropQueued() {
  cancelled_ = true;
  std::queue<std::function<void()>>().swap(tasks_);
  if (active_ == 0) idle_.notify_all();
}

void ThreadPool::WorkerThread() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
      ++active_;
    }

    std::exception_ptr error;
    try {
      task();
    } catch (...) {
      error = std::current_exception();
    }

    std::lock_guard<std::mutex> lock(mtx_);
    --active_;
    if (error) {
      if (!first_error_) first_error_ = error;
      DropQueued();
    }
    if (active_ == 0 && tasks_.empty()) idle_.notify_all();
  }
}
};  // namespace darkroom
