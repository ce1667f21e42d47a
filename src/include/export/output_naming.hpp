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

#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "type/type.hpp"

namespace reformat {
namespace OutputNaming {
inline constexpr std::string_view kReformatSuffix       = "_reformat";
inline constexpr std::string_view kClipboardBaseName    = "clipboard";
inline constexpr int              kMaxCollisionAttempts = 10000;

// {base, extension}; the extension keeps its dot and is empty for dotfiles and bare names
auto ParseFilename(std::string_view filename) -> std::pair<std::string, std::string>;

/**
 * @brief Make a name safe on every desktop filesystem: illegal and control characters become
 * '_', trailing dots and spaces are dropped, reserved device names get a leading '_'.
 */
auto SanitizeFilename(std::string_view filename) -> std::string;

// "<base>_reformat<extension>" built from the sanitized original name
auto BuildOutputFilename(std::string_view original_name, std::string_view new_extension)
    -> std::string;

using ExistsFn = std::function<bool(const image_path_t&)>;

/**
 * @brief First of "name", "name-1", "name-2", ... that is_taken rejects. Throws
 * std::runtime_error after kMaxCollisionAttempts candidates.
 */
auto ResolveUniqueFilename(const image_path_t& folder, const std::string& filename,
                           const ExistsFn& is_taken) -> std::string;
};  // namespace OutputNaming

/**
 * @brief Hands out collision-free output paths for one batch. Names are reserved in memory
 * (case-insensitively) as well as checked against the filesystem, so later workers never race
 * for the same file. Not thread-safe; meant to be driven from a single thread before work is
 * dispatched.
 */
class OutputPathReserver {
 private:
  image_path_t                    folder_;
  OutputNaming::ExistsFn          exists_on_disk_;
  std::unordered_set<std::string> reserved_;

 public:
  explicit OutputPathReserver(image_path_t folder, OutputNaming::ExistsFn exists_on_disk = {});

  auto Reserve(std::string_view original_name, std::string_view extension) -> image_path_t;
  auto IsReserved(const std::string& filename) const -> bool;
  auto ReservedCount() const -> size_t { return reserved_.size(); }
};
};  // namespace reformat
