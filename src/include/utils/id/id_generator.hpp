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

#include <concepts>
#include <cstdint>
#include <mutex>

namespace reformat {
namespace IncrID {
template <typename IDType>
concept Incrementable = requires(IDType t) {
  { ++t } -> std::same_as<IDType&>;
};

/**
 * @brief Monotonic id source. Shared between threads, so every access is serialized.
 */
template <Incrementable T>
class IDGenerator {
 private:
  mutable std::mutex mtx_;
  T                  counter_;

 public:
  explicit IDGenerator(T start_id) : counter_(start_id) {}

  auto GenerateID() -> T {
    std::lock_guard<std::mutex> lock(mtx_);
    return ++counter_;
  }
  auto GetCurrentID() const -> T {
    std::lock_guard<std::mutex> lock(mtx_);
    return counter_;
  }
  void SetStartID(T start_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    counter_ = start_id;
  }
};
};  // namespace IncrID
};  // namespace reformat
