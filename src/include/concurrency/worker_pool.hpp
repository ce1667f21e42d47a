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

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "concurrency/cancellation_token.hpp"
#include "utils/best_effort/best_effort.hpp"

namespace reformat {
inline constexpr size_t kDefaultConcurrency = 4;

enum class TaskOutcome { SUCCEEDED, FAILED, CANCELED };

template <typename T>
struct TaskResult {
  size_t           index_   = 0;
  TaskOutcome      outcome_ = TaskOutcome::CANCELED;
  std::optional<T> value_;
  std::string      error_;

  auto             Succeeded() const -> bool { return outcome_ == TaskOutcome::SUCCEEDED; }
  auto             Failed() const -> bool { return outcome_ == TaskOutcome::FAILED; }
  auto             Canceled() const -> bool { return outcome_ == TaskOutcome::CANCELED; }
};

template <typename T>
struct PoolProgress {
  size_t        total_     = 0;
  size_t        completed_ = 0;
  size_t        succeeded_ = 0;
  size_t        failed_    = 0;
  size_t        canceled_  = 0;
  TaskResult<T> latest_;
};

template <typename T>
struct WorkerPoolOptions {
  size_t                                       concurrency_ = kDefaultConcurrency;
  std::shared_ptr<CancellationToken>           cancellation_token_;
  std::function<void(const PoolProgress<T>&)> on_progress_;
};

/**
 * @brief Runs independent tasks with at most concurrency_ of them in flight.
 *
 * Run() starts min(concurrency_, tasks.size()) threads that claim tasks in submission order, and
 * returns once all of them have been joined.
 *
 * A task that throws resolves as FAILED without affecting its siblings; one that throws
 * CancellationError resolves as CANCELED. Once the token is observed cancelled, every task that
 * has not started is resolved as CANCELED without being invoked, while running tasks finish
 * normally. on_progress_ is called once per resolution, serialized with all other resolutions.
 * The returned vector is indexed by submission order.
 */
template <typename T>
class WorkerPool {
 public:
  using Task = std::function<T()>;

  static auto Run(const std::vector<Task>& tasks, const WorkerPoolOptions<T>& options = {})
      -> std::vector<TaskResult<T>> {
    const size_t total = tasks.size();
    if (total == 0) return {};

    State state;
    state.results_.resize(total);
    for (size_t i = 0; i < total; ++i) state.results_[i].index_ = i;

    const size_t worker_count = std::min(std::max<size_t>(options.concurrency_, 1), total);

    auto         worker_loop  = [&tasks, &options, &state, total]() {
      while (true) {
        size_t index = 0;
        {
          std::lock_guard<std::mutex> lock(state.mtx_);
          if (state.next_ >= total) return;
          if (options.cancellation_token_ && options.cancellation_token_->IsCancelled()) {
            CancelPendingLocked(state, options, total);
            return;
          }
          index = state.next_++;
        }

        TaskResult<T> result;
        result.index_ = index;
        try {
          result.value_   = tasks[index]();
          result.outcome_ = TaskOutcome::SUCCEEDED;
        } catch (const CancellationError&) {
          result.outcome_ = TaskOutcome::CANCELED;
        } catch (const std::exception& e) {
          result.outcome_ = TaskOutcome::FAILED;
          result.error_   = e.what();
        } catch (...) {
          result.outcome_ = TaskOutcome::FAILED;
          result.error_   = "Unknown task error";
        }

        std::lock_guard<std::mutex> lock(state.mtx_);
        ResolveLocked(state, options, total, std::move(result));
      }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker_loop);
    }
    for (std::thread& worker : workers) {
      worker.join();
    }
    return std::move(state.results_);
  }

 private:
  struct State {
    std::mutex                 mtx_;
    std::vector<TaskResult<T>> results_;
    size_t                     next_      = 0;
    size_t                     completed_ = 0;
    size_t                     succeeded_ = 0;
    size_t                     failed_    = 0;
    size_t                     canceled_  = 0;
  };

  static void ResolveLocked(State& state, const WorkerPoolOptions<T>& options, size_t total,
                            TaskResult<T>&& result) {
    switch (result.outcome_) {
      case TaskOutcome::SUCCEEDED:
        ++state.succeeded_;
        break;
      case TaskOutcome::FAILED:
        ++state.failed_;
        break;
      case TaskOutcome::CANCELED:
        ++state.canceled_;
        break;
    }
    ++state.completed_;
    const size_t index    = result.index_;
    state.results_[index] = std::move(result);

    if (options.on_progress_) {
      PoolProgress<T> progress{
          .total_     = total,
          .completed_ = state.completed_,
          .succeeded_ = state.succeeded_,
          .failed_    = state.failed_,
          .canceled_  = state.canceled_,
          .latest_    = state.results_[index],
      };
      TryBestEffort("WorkerPool", "Progress callback",
                    [&options, &progress]() { options.on_progress_(progress); });
    }
  }

  static void CancelPendingLocked(State& state, const WorkerPoolOptions<T>& options,
                                  size_t total) {
    while (state.next_ < total) {
      TaskResult<T> canceled;
      canceled.index_   = state.next_++;
      canceled.outcome_ = TaskOutcome::CANCELED;
      ResolveLocked(state, options, total, std::move(canceled));
    }
  }
};
};  // namespace reformat
