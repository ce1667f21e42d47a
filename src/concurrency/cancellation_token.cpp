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

#include "concurrency/cancellation_token.hpp"

#include <utility>

#include "utils/best_effort/best_effort.hpp"

namespace reformat {
void CancellationToken::Cancel() {
  std::vector<Listener> to_notify;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    to_notify.swap(listeners_);
  }
  for (auto& listener : to_notify) {
    TryBestEffort("CancellationToken", "Cancellation listener", listener);
  }
}

void CancellationToken::OnCancel(Listener listener) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!cancelled_.load(std::memory_order_acquire)) {
      listeners_.push_back(std::move(listener));
      return;
    }
  }
  TryBestEffort("CancellationToken", "Cancellation listener", listener);
}

void CancellationToken::ThrowIfCancelled() const {
  if (IsCancelled()) throw CancellationError();
}
};  // namespace reformat
