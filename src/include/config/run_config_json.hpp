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

#include <json.hpp>

#include <optional>
#include <string>
#include <vector>

#include "model/results.hpp"
#include "model/run_config.hpp"
#include "type/type.hpp"

namespace reformat {
struct JobItem {
  item_id_t    id_;
  image_path_t path_;
};

/**
 * @brief Contents of a CLI job file.
 */
struct ExportJob {
  std::vector<JobItem>       items_;
  RunConfig                  config_;
  std::optional<image_path_t> output_root_;
  std::optional<std::string>  destination_;
  size_t                     concurrency_ = 4;
};

namespace ConfigJson {
// Unknown or out-of-range fields fall back to their defaults; this never throws
auto RunConfigFromJson(const nlohmann::json& j) -> RunConfig;
auto RunConfigToJson(const RunConfig& config) -> nlohmann::json;

auto ResizeSpecFromJson(const nlohmann::json& j) -> ResizeSpec;
auto ResizeSpecToJson(const ResizeSpec& spec) -> nlohmann::json;
auto QualityFromJson(const nlohmann::json& j) -> QualitySpec;
auto ItemEditFromJson(const nlohmann::json& j) -> ItemEdit;
auto ItemEditToJson(const ItemEdit& edit) -> nlohmann::json;

/**
 * @brief Parse a job document. Throws std::runtime_error when the document is not an object,
 * has no item list, or lists an item without a path.
 */
auto ExportJobFromJson(const nlohmann::json& j) -> ExportJob;
auto LoadExportJob(const image_path_t& path) -> ExportJob;

auto RunSummaryToJson(const RunSummary& summary) -> nlohmann::json;
};  // namespace ConfigJson
};  // namespace reformat
