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
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include "concurrency/cancellation_token.hpp"

namespace reformat {
/**
 * @brief Bridges a flag raised from a signal handler to a CancellationToken. The flag is polled
 * on a background thread for as long as the watcher lives, and the token is cancelled the first
 * time it is seen set.
 */
class InterruptWatcher {
 public:
  InterruptWatcher(const volatile std::sig_atomic_t&  flag,
                   std::shared_ptr<CancellationToken> token,
                   std::chrono::milliseconds          poll_interval = std::chrono::milliseconds(50));
  ~InterruptWatcher();

  InterruptWatcher(const InterruptWatcher&)            = delete;
  InterruptWatcher& operator=(const InterruptWatcher&) = delete;

 private:
  void                               Watch();

  const volatile std::sig_atomic_t&  flag_;
  std::shared_ptr<CancellationToken> token_;
  std::chrono::milliseconds          poll_interval_;
  std::atomic<bool>                  done_{false};
  std::thread                        thread_;
};
};  // namespace reformat
