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

#include <string>

#include "type/type.hpp"

namespace reformat {
namespace Bytes {
inline constexpr byte_size_t kBytesPerMiB = 1024ULL * 1024ULL;

auto BytesToMiB(byte_size_t bytes) -> double;
auto MiBToBytes(double mib) -> byte_size_t;
// One decimal place, e.g. "1.5 MiB"
auto FormatMiB(byte_size_t bytes) -> std::string;
};  // namespace Bytes
};  // namespace reformat
