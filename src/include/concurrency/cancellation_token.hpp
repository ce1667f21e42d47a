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

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace reformat {
/**
 * @brief Raised by work that observed a cancellation request. The worker pool maps it to a
 * canceled outcome rather than a failure.
 */
class CancellationError : public std::runtime_error {
 public:
  CancellationError() : std::runtime_error("Operation cancelled") {}
  explicit CancellationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief One-way cancellation latch shared between the requester and running work.
 * Cancel() is idempotent and invokes registered listeners once, on the calling thread.
 */
class CancellationToken {
 public:
  using Listener = std::function<void()>;

  CancellationToken()                                    = default;
  CancellationToken(const CancellationToken&)            = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();
  auto IsCancelled() const -> bool { return cancelled_.load(std::memory_order_acquire); }
  // Runs the listener immediately if cancellation already happened
  void OnCancel(Listener listener);
  void ThrowIfCancelled() const;

 private:
  std::atomic<bool>     cancelled_{false};
  std::mutex            mtx_;
  std::vector<Listener> listeners_;
};

inline void ThrowIfCancelled(const std::shared_ptr<CancellationToken>& token) {
  if (token) token->ThrowIfCancelled();
}
};  // namespace reformat
