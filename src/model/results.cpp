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

#include "model/results.hpp"

namespace reformat {
auto ItemStatusToString(ItemStatus status) -> std::string {
  switch (status) {
    case ItemStatus::COMPLETED:
      return "completed";
    case ItemStatus::FAILED:
      return "failed";
    case ItemStatus::CANCELED:
      return "canceled";
  }
  return "canceled";
}
};  // namespace reformat
