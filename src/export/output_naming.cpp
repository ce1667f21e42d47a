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

#include "export/output_naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <format>
#include <stdexcept>

namespace reformat {
namespace OutputNaming {
namespace {
constexpr std::array<std::string_view, 22> kReservedNames = {
    "CON",  "PRN",  "AUX",  "NUL",  "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7",
    "COM8", "COM9", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

auto IsIllegalChar(unsigned char c) -> bool {
  if (c < 0x20) return true;
  switch (c) {
    case '<':
    case '>':
    case ':':
    case '"':
    case '/':
    case '\\':
    case '|':
    case '?':
    case '*':
      return true;
    default:
      return false;
  }
}

auto ToUpper(std::string text) -> std::string {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}
}  // namespace

auto ParseFilename(std::string_view filename) -> std::pair<std::string, std::string> {
  const auto last_dot = filename.rfind('.');
  if (last_dot == std::string_view::npos || last_dot == 0) {
    return {std::string(filename), std::string()};
  }
  return {std::string(filename.substr(0, last_dot)), std::string(filename.substr(last_dot))};
}

auto SanitizeFilename(std::string_view filename) -> std::string {
  std::string sanitized(filename);
  for (auto& c : sanitized) {
    if (IsIllegalChar(static_cast<unsigned char>(c))) c = '_';
  }
  while (!sanitized.empty() &&
         (sanitized.back() == '.' || std::isspace(static_cast<unsigned char>(sanitized.back())))) {
    sanitized.pop_back();
  }
  if (sanitized.empty()) return "unnamed";

  auto [base, ext] = ParseFilename(sanitized);
  if (std::find(kReservedNames.begin(), kReservedNames.end(), ToUpper(base)) !=
      kReservedNames.end()) {
    sanitized = "_" + base + ext;
  }
  return sanitized;
}

auto BuildOutputFilename(std::string_view original_name, std::string_view new_extension)
    -> std::string {
  const auto sanitized = SanitizeFilename(original_name);
  const auto [base, _] = ParseFilename(sanitized);
  return std::format("{}{}{}", base, kReformatSuffix, new_extension);
}

auto ResolveUniqueFilename(const image_path_t& folder, const std::string& filename,
                           const ExistsFn& is_taken) -> std::string {
  if (!is_taken(folder / filename)) return filename;

  const auto [base, ext] = ParseFilename(filename);
  for (int i = 1; i <= kMaxCollisionAttempts; ++i) {
    auto candidate = std::format("{}-{}{}", base, i, ext);
    if (!is_taken(folder / candidate)) return candidate;
  }
  throw std::runtime_error(std::format("Could not find a unique filename for {} after {} attempts",
                                       filename, kMaxCollisionAttempts));
}
};  // namespace OutputNaming

namespace {
auto FoldCase(const std::string& text) -> std::string {
  std::string folded(text);
  std::transform(folded.begin(), folded.end(), folded.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return folded;
}
}  // namespace

OutputPathReserver::OutputPathReserver(image_path_t folder, OutputNaming::ExistsFn exists_on_disk)
    : folder_(std::move(folder)), exists_on_disk_(std::move(exists_on_disk)) {
  if (!exists_on_disk_) {
    exists_on_disk_ = [](const image_path_t& path) {
      std::error_code ec;
      return std::filesystem::exists(path, ec);
    };
  }
}

auto OutputPathReserver::IsReserved(const std::string& filename) const -> bool {
  return reserved_.contains(FoldCase(filename));
}

auto OutputPathReserver::Reserve(std::string_view original_name, std::string_view extension)
    -> image_path_t {
  const auto candidate = OutputNaming::BuildOutputFilename(original_name, extension);
  const auto unique    = OutputNaming::ResolveUniqueFilename(
      folder_, candidate, [this](const image_path_t& path) {
        return IsReserved(path.filename().string()) || exists_on_disk_(path);
      });
  reserved_.insert(FoldCase(unique));
  return folder_ / unique;
}
};  // namespace reformat
