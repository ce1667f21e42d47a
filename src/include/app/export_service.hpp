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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "concurrency/cancellation_token.hpp"
#include "concurrency/worker_pool.hpp"
#include "io/buffer/buffer_store.hpp"
#include "model/item.hpp"
#include "model/results.hpp"
#include "model/run_config.hpp"
#include "pipeline/image_pipeline.hpp"
#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace reformat {
struct ExportServiceOptions {
  size_t       concurrency_ = kDefaultConcurrency;
  // Parent of every run folder; DefaultOutputRoot() when empty
  image_path_t output_root_;
};

/**
 * @brief Runs one batch export: resolves the output folder, reserves every output path up
 * front, then processes the items on a bounded worker pool.
 */
class ExportService {
 private:
  std::shared_ptr<ImagePipeline>                 pipeline_;
  std::shared_ptr<SourceBufferStore>             buffer_store_;
  std::shared_ptr<IncrID::IDGenerator<run_id_t>> run_id_generator_;
  ExportServiceOptions                           options_;

  auto SourceFormatFor(const Item& item) const -> ImageFormat;
  auto RunItemTask(const Item& item, const image_path_t& output_path,
                   const FormatResolution& resolution, const ItemEdit& edit,
                   const RunConfig& config,
                   const std::shared_ptr<CancellationToken>& token) const -> ItemResult;

 public:
  ExportService() = delete;
  ExportService(std::shared_ptr<ImagePipeline>                 pipeline,
                std::shared_ptr<SourceBufferStore>             buffer_store,
                std::shared_ptr<IncrID::IDGenerator<run_id_t>> run_id_generator,
                ExportServiceOptions                           options = {});

  ExportService(const ExportService&)            = delete;
  ExportService& operator=(const ExportService&) = delete;

  auto ResolveOutputFolder(const std::vector<Item>&          items,
                           const std::optional<std::string>& destination) const -> image_path_t;

  /**
   * @brief Export all items with the given settings and block until every item has resolved.
   *
   * @param items items to export, in the order results are reported
   * @param config settings for this run, copied so the caller may keep editing its own
   * @param token optional cancellation; pending items resolve as canceled once it trips
   * @param observer optional progress sink
   * @param destination subfolder override, e.g. the folder of a batch already in progress
   * @throws std::runtime_error when the output folder cannot be prepared or no unique output
   * name exists
   */
  auto ExportBatch(const std::vector<Item>& items, RunConfig config,
                   std::shared_ptr<CancellationToken> token       = nullptr,
                   ExportObserver*                    observer    = nullptr,
                   std::optional<std::string>         destination = std::nullopt) -> RunSummary;
};
};  // namespace reformat
