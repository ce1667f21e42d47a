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

#include <cstdint>
#include <filesystem>
#include <string>

namespace reformat {

#define image_path_t std::filesystem::path
#define file_name_t  std::string

// Items are keyed by the id handed out by the import stage
#define item_id_t    std::string

// Used in ExportService to number runs
#define run_id_t     uint32_t

// Byte counts of encoded outputs
#define byte_size_t  uint64_t
};  // namespace reformat
