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

#include "app/export_service.hpp"

#include <filesystem>
#include <format>
#include <functional>
#include <stdexcept>
#include <utility>

#include "export/output_folder.hpp"
#include "export/output_naming.hpp"
#include "io/image/image_writer.hpp"
#include "utils/best_effort/best_effort.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace reformat {
namespace {
constexpr std::string_view kComponent = "ExportService";

auto OutputBaseName(const Item& item) -> std::string {
  if (!item.IsFile()) return std::string(OutputNaming::kClipboardBaseName);
  if (!item.original_name_.empty()) return item.original_name_;
  return item.source_path_.filename().string();
}

// Pool outcomes are mapped onto item outcomes; a FAILED item is still a succeeded task
auto ProjectResult(const TaskResult<ItemResult>& task, const Item& item) -> ItemResult {
  if (task.Succeeded() && task.value_) return *task.value_;
  ItemResult result;
  result.item_id_ = item.id_;
  if (task.Failed()) {
    result.status_ = ItemStatus::FAILED;
    result.error_  = task.error_;
  } else {
    result.status_ = ItemStatus::CANCELED;
  }
  return result;
}
}  // namespace

ExportService::ExportService(std::shared_ptr<ImagePipeline>                 pipeline,
                             std::shared_ptr<SourceBufferStore>             buffer_store,
                             std::shared_ptr<IncrID::IDGenerator<run_id_t>> run_id_generator,
                             ExportServiceOptions                           options)
    : pipeline_(std::move(pipeline)),
      buffer_store_(std::move(buffer_store)),
      run_id_generator_(std::move(run_id_generator)),
      options_(std::move(options)) {
  if (!pipeline_) {
    throw std::runtime_error("[ERROR] ExportService: pipeline is null");
  }
  if (!run_id_generator_) {
    throw std::runtime_error("[ERROR] ExportService: run id generator is null");
  }
  if (options_.output_root_.empty()) {
    options_.output_root_ = OutputFolder::DefaultOutputRoot();
  }
}

auto ExportService::ResolveOutputFolder(const std::vector<Item>&          items,
                                        const std::optional<std::string>& destination) const
    -> image_path_t {
  TimeProvider::Refresh();
  const auto subfolder = OutputFolder::ResolveOutputSubfolder(items, destination, TimeProvider::Now());
  return OutputFolder::BuildOutputFolderPath(options_.output_root_, subfolder);
}

// Clipboard captures often arrive without a recorded format; sniff it from the bytes
auto ExportService::SourceFormatFor(const Item& item) const -> ImageFormat {
  if (item.format_ != ImageFormat::UNKNOWN || item.IsFile() || !buffer_store_) {
    return item.format_;
  }
  const auto bytes = buffer_store_->Fetch(item.id_);
  if (!bytes) return ImageFormat::UNKNOWN;
  return DetectImageFormat(*bytes);
}

auto ExportService::RunItemTask(const Item& item, const image_path_t& output_path,
                                const FormatResolution& resolution, const ItemEdit& edit,
                                const RunConfig& config,
                                const std::shared_ptr<CancellationToken>& token) const
    -> ItemResult {
  ItemResult result;
  result.item_id_ = item.id_;

  ProcessRequest request;
  if (item.IsFile()) {
    if (item.source_path_.empty()) {
      result.status_ = ItemStatus::FAILED;
      result.error_  = "Source path is missing";
      return result;
    }
    request.source_path_ = item.source_path_;
  } else {
    request.source_bytes_ = buffer_store_ ? buffer_store_->Fetch(item.id_) : nullptr;
    if (!request.source_bytes_) {
      result.status_ = ItemStatus::FAILED;
      result.error_  = "Clipboard image is no longer available";
      return result;
    }
  }

  request.destination_        = output_path;
  request.transform_          = edit.transform_;
  request.crop_               = edit.crop_;
  request.resize_             = config.resize_;
  request.output_format_      = config.output_format_;
  request.quality_            = config.quality_;
  request.resolved_format_    = resolution;
  request.cancellation_token_ = token;
  if (item.format_ != ImageFormat::UNKNOWN) request.declared_format_ = item.format_;
  request.declared_alpha_ = item.has_alpha_;

  ProcessResult processed = pipeline_->Process(request);
  if (processed.canceled_) {
    throw CancellationError();
  }

  result.warnings_ = std::move(processed.warnings_);
  if (!processed.success_) {
    result.status_ = ItemStatus::FAILED;
    result.error_  = processed.error_;
    Logger::Instance().Warn(kComponent,
                            std::format("Item {} failed: {}", item.id_, processed.error_));
    return result;
  }

  result.status_         = ItemStatus::COMPLETED;
  result.output_path_    = processed.output_path_;
  result.output_bytes_   = processed.output_bytes_;
  result.output_width_   = processed.output_width_;
  result.output_height_  = processed.output_height_;
  result.alpha_switched_ = processed.alpha_switched_;

  if (item.IsFile()) {
    TryBestEffort(kComponent, "Preserving modification time",
                  [&]() { ImageWriter::PreserveTimestamp(item.source_path_, output_path); });
  }
  return result;
}

auto ExportService::ExportBatch(const std::vector<Item>& items, RunConfig config,
                                std::shared_ptr<CancellationToken> token,
                                ExportObserver* observer, std::optional<std::string> destination)
    -> RunSummary {
  RunSummary summary;
  summary.run_id_        = std::format("run-{}", run_id_generator_->GenerateID());
  summary.total_         = items.size();
  summary.output_folder_ = ResolveOutputFolder(items, destination);

  std::error_code ec;
  std::filesystem::create_directories(summary.output_folder_, ec);
  if (ec) {
    const auto message = std::format("Cannot create output folder {}: {}",
                                     summary.output_folder_.string(), ec.message());
    Logger::Instance().Error(kComponent, message);
    throw std::runtime_error("[ERROR] ExportService: " + message);
  }

  // Every output path is claimed here, on this thread, before any worker starts
  // The format chosen here is the one the pipeline encodes, so content matches the extension
  std::vector<image_path_t>     output_paths;
  std::vector<FormatResolution> resolutions;
  output_paths.reserve(items.size());
  resolutions.reserve(items.size());
  try {
    OutputPathReserver reserver(summary.output_folder_);
    for (const auto& item : items) {
      resolutions.push_back(
          ResolveOutputFormat(config.output_format_, SourceFormatFor(item), item.has_alpha_));
      output_paths.push_back(
          reserver.Reserve(OutputBaseName(item), ExtensionFor(resolutions.back().format_)));
    }
  } catch (const std::exception& e) {
    Logger::Instance().Error(kComponent, e.what());
    throw std::runtime_error(std::string("[ERROR] ExportService: ") + e.what());
  }

  Logger::Instance().Info(kComponent,
                          std::format("{}: exporting {} item(s) to {}", summary.run_id_,
                                      items.size(), summary.output_folder_.string()));
  if (observer) {
    TryBestEffort(kComponent, "Run start notification", [&]() {
      observer->OnRunStarted(summary.run_id_, items.size(), summary.output_folder_);
    });
  }
  if (token) {
    const auto run_id = summary.run_id_;
    token->OnCancel([run_id]() {
      Logger::Instance().Info(kComponent, run_id + ": cancellation requested");
    });
  }

  const auto locked_config = std::make_shared<const RunConfig>(std::move(config));

  std::vector<WorkerPool<ItemResult>::Task> tasks;
  tasks.reserve(items.size());
  for (size_t i = 0; i < items.size(); ++i) {
    tasks.emplace_back([this, &items, &output_paths, &resolutions, locked_config, token, i]() {
      const Item& item = items[i];
      return RunItemTask(item, output_paths[i], resolutions[i], locked_config->EditFor(item.id_),
                         *locked_config, token);
    });
  }

  ExportProgress progress;
  progress.run_id_ = summary.run_id_;
  progress.total_  = items.size();

  WorkerPoolOptions<ItemResult> pool_options;
  pool_options.concurrency_        = options_.concurrency_;
  pool_options.cancellation_token_ = token;
  if (observer) {
    // Resolutions are serialized by the pool, so progress needs no lock of its own
    pool_options.on_progress_ = [&progress, &items, observer](const PoolProgress<ItemResult>& p) {
      progress.latest_ = ProjectResult(p.latest_, items[p.latest_.index_]);
      switch (progress.latest_.status_) {
        case ItemStatus::COMPLETED:
          ++progress.succeeded_;
          break;
        case ItemStatus::FAILED:
          ++progress.failed_;
          break;
        case ItemStatus::CANCELED:
          ++progress.canceled_;
          break;
      }
      progress.completed_ = p.completed_;
      observer->OnProgress(progress);
    };
  }

  auto task_results = WorkerPool<ItemResult>::Run(tasks, pool_options);

  summary.results_.reserve(task_results.size());
  for (const auto& task : task_results) {
    ItemResult result = ProjectResult(task, items[task.index_]);
    switch (result.status_) {
      case ItemStatus::COMPLETED:
        ++summary.succeeded_;
        if (result.alpha_switched_) ++summary.auto_switched_;
        break;
      case ItemStatus::FAILED:
        ++summary.failed_;
        break;
      case ItemStatus::CANCELED:
        ++summary.canceled_;
        break;
    }
    summary.results_.push_back(std::move(result));
  }

  Logger::Instance().Info(
      kComponent, std::format("{}: {} succeeded, {} failed, {} canceled", summary.run_id_,
                              summary.succeeded_, summary.failed_, summary.canceled_));
  return summary;
}
};  // namespace reformat
