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

#include <exception>
#include <format>
#include <string_view>

#include "utils/log/logger.hpp"

namespace reformat {
/**
 * @brief Run an operation whose failure must not affect the caller. Exceptions are logged
 * as warnings under the given component and reported through the return value.
 *
 * @return true when fn completed without throwing
 */
template <typename Fn>
auto TryBestEffort(std::string_view component, std::string_view what, Fn&& fn) -> bool {
  try {
    fn();
    return true;
  } catch (const std::exception& e) {
    try {
      Logger::Instance().Warn(component, std::format("{} failed: {}", what, e.what()));
    } catch (const std::exception&) {
      // Logging itself failed; there is nowhere left to report to.
    }
  } catch (...) {
    try {
      Logger::Instance().Warn(component, std::format("{} failed: non-standard exception", what));
    } catch (const std::exception&) {
    }
  }
  return false;
}
};  // namespace reformat
