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

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "model/item.hpp"
#include "type/type.hpp"

namespace reformat {
namespace OutputFolder {
// "Reformat_YYYY-MM-DD" for the local date of now
auto GenerateReformatFolderName(const std::chrono::system_clock::time_point& now) -> std::string;

// Parent directory of a path, comparing '\\' and '/' alike
auto ParentFolderPath(const std::string& file_path) -> std::optional<std::string>;
auto ParentFolderName(const std::string& file_path) -> std::optional<std::string>;

/**
 * @brief Name of the subfolder a batch is written to.
 *
 * An explicit destination wins. Otherwise a batch whose file items all share one parent
 * directory goes to "<parent>_reformat"; anything else (clipboard only, or mixed parents) goes
 * to the dated folder.
 */
auto ResolveOutputSubfolder(const std::vector<Item>& items,
                            const std::optional<std::string>& existing_destination,
                            const std::chrono::system_clock::time_point& now) -> std::string;

// root / subfolder; an absolute subfolder is used as is
auto BuildOutputFolderPath(const image_path_t& root, const std::string& subfolder)
    -> image_path_t;

// $HOME/Downloads (or %USERPROFILE%\Downloads); the working directory when neither is set
auto DefaultOutputRoot() -> image_path_t;
};  // namespace OutputFolder
};  // namespace reformat
