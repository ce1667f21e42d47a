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

#include "export/output_folder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>

#include "export/output_naming.hpp"
#include "utils/clock/time_provider.hpp"

namespace reformat {
namespace OutputFolder {
namespace {
auto NormalizeSeparators(std::string path) -> std::string {
  std::replace(path.begin(), path.end(), '\\', '/');
  return path;
}

auto ToLower(std::string text) -> std::string {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}
}  // namespace

auto GenerateReformatFolderName(const std::chrono::system_clock::time_point& now) -> std::string {
  return "Reformat_" + TimeProvider::DateStamp(now);
}

auto ParentFolderPath(const std::string& file_path) -> std::optional<std::string> {
  if (file_path.empty()) return std::nullopt;
  const auto normalized = NormalizeSeparators(file_path);
  const auto last_slash = normalized.rfind('/');
  if (last_slash == std::string::npos || last_slash == 0) return std::nullopt;
  return normalized.substr(0, last_slash);
}

auto ParentFolderName(const std::string& file_path) -> std::optional<std::string> {
  if (file_path.empty()) return std::nullopt;
  const auto               normalized = NormalizeSeparators(file_path);
  std::vector<std::string> parts;
  size_t                   start      = 0;
  while (start <= normalized.size()) {
    const auto end = normalized.find('/', start);
    const auto part =
        normalized.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!part.empty()) parts.push_back(part);
    if (end == std::string::npos) break;
    start = end + 1;
  }
  if (parts.size() < 2) return std::nullopt;
  return parts[parts.size() - 2];
}

auto ResolveOutputSubfolder(const std::vector<Item>& items,
                            const std::optional<std::string>& existing_destination,
                            const std::chrono::system_clock::time_point& now) -> std::string {
  if (existing_destination) return *existing_destination;

  std::set<std::string> parents;
  const Item*           first_file = nullptr;
  for (const auto& item : items) {
    if (!item.IsFile() || item.source_path_.empty()) continue;
    if (!first_file) first_file = &item;
    if (auto parent = ParentFolderPath(item.source_path_.string())) {
      parents.insert(ToLower(*parent));
    }
  }

  if (first_file && parents.size() == 1) {
    if (auto name = ParentFolderName(first_file->source_path_.string())) {
      return *name + std::string(OutputNaming::kReformatSuffix);
    }
  }
  return GenerateReformatFolderName(now);
}

auto BuildOutputFolderPath(const image_path_t& root, const std::string& subfolder)
    -> image_path_t {
  if (subfolder.empty()) return root;
  return root / image_path_t(subfolder);
}

auto DefaultOutputRoot() -> image_path_t {
  const char* home = std::getenv("HOME");
  if (!home || !*home) home = std::getenv("USERPROFILE");
  if (home && *home) {
    return image_path_t(home) / "Downloads";
  }
  return std::filesystem::current_path();
}
};  // namespace OutputFolder
};  // namespace reformat
