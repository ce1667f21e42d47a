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

#include "concurrency/interrupt_watcher.hpp"

#include <stdexcept>
#include <utility>

namespace reformat {
InterruptWatcher::InterruptWatcher(const volatile std::sig_atomic_t&  flag,
                                   std::shared_ptr<CancellationToken> token,
                                   std::chrono::milliseconds          poll_interval)
    : flag_(flag), token_(std::move(token)), poll_interval_(poll_interval) {
  if (!token_) {
    throw std::runtime_error("[ERROR] InterruptWatcher: token is null");
  }
  thread_ = std::thread(&InterruptWatcher::Watch, this);
}

InterruptWatcher::~InterruptWatcher() {
  done_ = true;
  if (thread_.joinable()) thread_.join();
}

void InterruptWatcher::Watch() {
  while (!done_) {
    if (flag_ != 0) {
      token_->Cancel();
      return;
    }
    std::this_thread::sleep_for(poll_interval_);
  }
}
};  // namespace reformat
