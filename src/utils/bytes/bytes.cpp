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

#include "utils/bytes/bytes.hpp"

#include <cmath>
#include <format>

namespace reformat {
namespace Bytes {
auto BytesToMiB(byte_size_t bytes) -> double {
  return static_cast<double>(bytes) / static_cast<double>(kBytesPerMiB);
}

auto MiBToBytes(double mib) -> byte_size_t {
  if (!(mib > 0.0)) return 0;
  return static_cast<byte_size_t>(std::llround(mib * static_cast<double>(kBytesPerMiB)));
}

auto FormatMiB(byte_size_t bytes) -> std::string {
  return std::format("{:.1f} MiB", BytesToMiB(bytes));
}
};  // namespace Bytes
};  // namespace reformat
