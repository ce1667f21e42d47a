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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace reformat {
enum class ItemStatus { COMPLETED, FAILED, CANCELED };

struct ItemResult {
  item_id_t                  item_id_;
  ItemStatus                 status_ = ItemStatus::CANCELED;
  std::optional<image_path_t> output_path_;
  byte_size_t                output_bytes_  = 0;
  int                        output_width_  = 0;
  int                        output_height_ = 0;
  std::string                error_;
  std::vector<std::string>   warnings_;
  bool                       alpha_switched_ = false;
};

struct RunSummary {
  std::string             run_id_;
  size_t                  total_         = 0;
  size_t                  succeeded_     = 0;
  size_t                  failed_        = 0;
  size_t                  canceled_      = 0;
  size_t                  auto_switched_ = 0;
  image_path_t            output_folder_;
  std::vector<ItemResult> results_;
};

struct ExportProgress {
  std::string run_id_;
  size_t      total_     = 0;
  size_t      completed_ = 0;
  size_t      succeeded_ = 0;
  size_t      failed_    = 0;
  size_t      canceled_  = 0;
  ItemResult  latest_;
};

/**
 * @brief Receives progress while a run is in flight. Calls are serialized but may arrive on any
 * worker thread.
 */
class ExportObserver {
 public:
  virtual ~ExportObserver()                              = default;
  virtual void OnRunStarted(const std::string& run_id, size_t total,
                            const image_path_t& output_folder) {
    (void)run_id;
    (void)total;
    (void)output_folder;
  }
  virtual void OnProgress(const ExportProgress& progress) = 0;
};

auto ItemStatusToString(ItemStatus status) -> std::string;
};  // namespace reformat
