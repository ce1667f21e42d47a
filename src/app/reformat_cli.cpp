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

#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <vector>

#include "app/export_service.hpp"
#include "concurrency/interrupt_watcher.hpp"
#include "config/run_config_json.hpp"
#include "io/buffer/buffer_store.hpp"
#include "io/image/image_codec_impl.hpp"
#include "io/image/image_loader.hpp"
#include "pipeline/image_pipeline.hpp"
#include "utils/log/logger.hpp"

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void HandleInterrupt(int) { g_interrupted = 1; }

class ConsoleProgress final : public reformat::ExportObserver {
 public:
  void OnRunStarted(const std::string& run_id, size_t total,
                    const image_path_t& output_folder) override {
    std::cerr << std::format("[{}] {} item(s) -> {}", run_id, total, output_folder.string())
              << std::endl;
  }

  void OnProgress(const reformat::ExportProgress& progress) override {
    std::cerr << std::format("[{}] {}/{} {} {}", progress.run_id_, progress.completed_,
                             progress.total_, progress.latest_.item_id_,
                             reformat::ItemStatusToString(progress.latest_.status_))
              << std::endl;
  }
};

void PrintUsage() {
  std::cerr << "usage: reformat_cli <job.json> [--log <file>]" << std::endl;
}
}  // namespace

int main(int argc, char** argv) {
  using namespace reformat;

  if (argc < 2) {
    PrintUsage();
    return 2;
  }
  const std::filesystem::path job_path = argv[1];
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--log" && i + 1 < argc) {
      Logger::Instance().Initialize(argv[++i]);
    } else {
      PrintUsage();
      return 2;
    }
  }

  try {
    ExportJob job   = ConfigJson::LoadExportJob(job_path);
    auto      codec = std::make_shared<ImageCodecImpl>();

    std::vector<Item> items;
    items.reserve(job.items_.size());
    for (const auto& job_item : job.items_) {
      try {
        items.push_back(ProbeFileItem(job_item.id_, job_item.path_, *codec));
      } catch (const std::exception& e) {
        // Keep the item so the run reports it as failed
        Logger::Instance().Warn("CLI", std::format("Cannot probe {}: {}",
                                                   job_item.path_.string(), e.what()));
        Item item;
        item.id_            = job_item.id_;
        item.source_path_   = job_item.path_;
        item.original_name_ = job_item.path_.filename().string();
        items.push_back(std::move(item));
      }
    }

    ExportServiceOptions options;
    options.concurrency_ = job.concurrency_;
    if (job.output_root_) options.output_root_ = *job.output_root_;

    ExportService service(std::make_shared<ImagePipeline>(codec),
                          std::make_shared<InMemoryBufferStore>(),
                          std::make_shared<IncrID::IDGenerator<run_id_t>>(0), options);

    auto cancel_token = std::make_shared<CancellationToken>();
    std::signal(SIGINT, HandleInterrupt);

    ConsoleProgress progress;
    RunSummary      summary;
    {
      // The handler only raises g_interrupted; the watcher trips the token off the signal path
      InterruptWatcher watcher(g_interrupted, cancel_token);
      summary = service.ExportBatch(items, job.config_, cancel_token, &progress, job.destination_);
    }

    std::cout << ConfigJson::RunSummaryToJson(summary).dump(2) << std::endl;
    Logger::Instance().Shutdown();
    return summary.failed_ == 0 && summary.canceled_ == 0 ? 0 : 1;
  } catch (const std::exception& e) {
    Logger::Instance().Error("CLI", e.what());
    Logger::Instance().Shutdown();
    return 1;
  }
}
