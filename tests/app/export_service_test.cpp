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

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "export/output_folder.hpp"
#include "fixtures/fake_image_codec.hpp"
#include "fixtures/scratch_dir_fixation.hpp"
#include "utils/clock/time_provider.hpp"

namespace reformat {
namespace {
using namespace std::chrono_literals;

class RecordingObserver : public ExportObserver {
 public:
  std::mutex                  mtx_;
  std::string                 started_run_id_;
  size_t                      started_total_ = 0;
  image_path_t                started_folder_;
  std::vector<ExportProgress> updates_;

  void OnRunStarted(const std::string& run_id, size_t total,
                    const image_path_t& output_folder) override {
    std::lock_guard<std::mutex> lock(mtx_);
    started_run_id_ = run_id;
    started_total_  = total;
    started_folder_ = output_folder;
  }

  void OnProgress(const ExportProgress& progress) override {
    std::lock_guard<std::mutex> lock(mtx_);
    updates_.push_back(progress);
  }
};

// Trips the token as soon as the first item resolves
class CancelAfterFirstObserver : public ExportObserver {
 public:
  explicit CancelAfterFirstObserver(std::shared_ptr<CancellationToken> token)
      : token_(std::move(token)) {}

  void OnProgress(const ExportProgress& progress) override {
    if (progress.completed_ == 1) token_->Cancel();
  }

 private:
  std::shared_ptr<CancellationToken> token_;
};
}  // namespace

class ExportServiceTests : public ScratchDirTests {
 protected:
  std::shared_ptr<FakeImageCodec>                codec_;
  std::shared_ptr<InMemoryBufferStore>           buffers_;
  std::shared_ptr<IncrID::IDGenerator<run_id_t>> run_ids_;
  image_path_t                                   output_root_;

  void                                           SetUp() override {
    ScratchDirTests::SetUp();
    codec_       = std::make_shared<FakeImageCodec>();
    buffers_     = std::make_shared<InMemoryBufferStore>();
    run_ids_     = std::make_shared<IncrID::IDGenerator<run_id_t>>(0);
    output_root_ = scratch_dir_ / "exports";
  }

  auto MakeService(size_t concurrency = 2) -> ExportService {
    return ExportService(std::make_shared<ImagePipeline>(codec_), buffers_, run_ids_,
                         {.concurrency_ = concurrency, .output_root_ = output_root_});
  }

  auto SourceFile(const std::string& id, const std::string& relative) -> Item {
    const auto path = WriteFile(relative, "source bytes for " + id);
    Item       item;
    item.id_            = id;
    item.origin_        = ItemOrigin::FILE;
    item.source_path_   = path;
    item.original_name_ = path.filename().string();
    item.bytes_         = std::filesystem::file_size(path);
    item.width_         = codec_->source_.cols;
    item.height_        = codec_->source_.rows;
    item.format_        = ImageFormat::PNG;
    return item;
  }

  auto ClipboardItem(const std::string& id, bool with_buffer) -> Item {
    if (with_buffer) buffers_->Put(id, ByteBuffer{1, 2, 3});
    Item item;
    item.id_            = id;
    item.origin_        = ItemOrigin::MEMORY_BUFFER;
    item.original_name_ = "clipboard.png";
    item.format_        = ImageFormat::PNG;
    return item;
  }
};

TEST_F(ExportServiceTests, RejectsMissingCollaborators) {
  EXPECT_THROW(ExportService(nullptr, buffers_, run_ids_), std::runtime_error);
  EXPECT_THROW(ExportService(std::make_shared<ImagePipeline>(codec_), buffers_, nullptr),
               std::runtime_error);
}

TEST_F(ExportServiceTests, SharedParentFolderAndUniqueNames) {
  const std::vector<Item> items = {SourceFile("1", "trip/a.png"), SourceFile("2", "trip/a.png"),
                                   SourceFile("3", "trip/a.png")};
  auto                    service = MakeService();
  const auto              summary = service.ExportBatch(items, RunConfig{});

  EXPECT_EQ(summary.output_folder_, output_root_ / "trip_reformat");
  EXPECT_EQ(summary.total_, 3u);
  EXPECT_EQ(summary.succeeded_, 3u);
  ASSERT_EQ(summary.results_.size(), 3u);

  std::set<image_path_t> written;
  for (size_t i = 0; i < items.size(); ++i) {
    const auto& result = summary.results_[i];
    EXPECT_EQ(result.item_id_, items[i].id_);
    ASSERT_EQ(result.status_, ItemStatus::COMPLETED) << result.error_;
    ASSERT_TRUE(result.output_path_.has_value());
    EXPECT_TRUE(std::filesystem::exists(*result.output_path_));
    written.insert(*result.output_path_);
  }
  EXPECT_EQ(written.size(), 3u);
  EXPECT_EQ(summary.results_[0].output_path_->filename(), "a_reformat.png");
  EXPECT_EQ(summary.results_[1].output_path_->filename(), "a_reformat-1.png");
  EXPECT_EQ(summary.results_[2].output_path_->filename(), "a_reformat-2.png");
}

TEST_F(ExportServiceTests, SecondRunDoesNotOverwriteFirst) {
  const std::vector<Item> items   = {SourceFile("1", "trip/a.png")};
  auto                    service = MakeService();
  const auto              first   = service.ExportBatch(items, RunConfig{});
  const auto              second  = service.ExportBatch(items, RunConfig{});

  ASSERT_EQ(first.results_[0].status_, ItemStatus::COMPLETED);
  ASSERT_EQ(second.results_[0].status_, ItemStatus::COMPLETED);
  EXPECT_NE(*first.results_[0].output_path_, *second.results_[0].output_path_);
  EXPECT_EQ(second.results_[0].output_path_->filename(), "a_reformat-1.png");
}

TEST_F(ExportServiceTests, RunIdsIncrease) {
  auto       service = MakeService();
  const auto first   = service.ExportBatch({}, RunConfig{});
  const auto second  = service.ExportBatch({}, RunConfig{});
  EXPECT_EQ(first.run_id_, "run-1");
  EXPECT_EQ(second.run_id_, "run-2");
  EXPECT_TRUE(first.results_.empty());
}

TEST_F(ExportServiceTests, MixedParentsUseDatedFolder) {
  const std::vector<Item> items   = {SourceFile("1", "trip/a.png"), SourceFile("2", "home/b.png")};
  auto                    service = MakeService();
  const auto              summary = service.ExportBatch(items, RunConfig{});
  TimeProvider::Refresh();
  EXPECT_EQ(summary.output_folder_,
            output_root_ / OutputFolder::GenerateReformatFolderName(TimeProvider::Now()));
  EXPECT_EQ(summary.succeeded_, 2u);
}

TEST_F(ExportServiceTests, DestinationOverrideIsReused) {
  const std::vector<Item> items   = {SourceFile("1", "trip/a.png")};
  auto                    service = MakeService();
  const auto              summary =
      service.ExportBatch(items, RunConfig{}, nullptr, nullptr, std::string("ongoing"));
  EXPECT_EQ(summary.output_folder_, output_root_ / "ongoing");
  EXPECT_TRUE(std::filesystem::exists(*summary.results_[0].output_path_));
}

TEST_F(ExportServiceTests, ClipboardItems) {
  const std::vector<Item> items   = {ClipboardItem("c1", true), ClipboardItem("c2", false)};
  auto                    service = MakeService();
  const auto              summary = service.ExportBatch(items, RunConfig{});

  ASSERT_EQ(summary.results_.size(), 2u);
  EXPECT_EQ(summary.results_[0].status_, ItemStatus::COMPLETED);
  EXPECT_EQ(summary.results_[0].output_path_->filename(), "clipboard_reformat.png");
  EXPECT_EQ(summary.results_[1].status_, ItemStatus::FAILED);
  EXPECT_EQ(summary.results_[1].error_, "Clipboard image is no longer available");
  EXPECT_EQ(summary.succeeded_, 1u);
  EXPECT_EQ(summary.failed_, 1u);
}

TEST_F(ExportServiceTests, UnlabelledClipboardJpegKeepsJpegExtensionAndEncoding) {
  codec_->format_ = ImageFormat::JPEG;
  buffers_->Put("c1", ByteBuffer{0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10});
  Item item;
  item.id_     = "c1";
  item.origin_ = ItemOrigin::MEMORY_BUFFER;

  auto       service = MakeService();
  const auto summary = service.ExportBatch({item}, RunConfig{});

  ASSERT_EQ(summary.results_.size(), 1u);
  ASSERT_EQ(summary.results_[0].status_, ItemStatus::COMPLETED) << summary.results_[0].error_;
  EXPECT_EQ(summary.results_[0].output_path_->filename(), "clipboard_reformat.jpg");
  EXPECT_EQ(codec_->LastCall().format_, ImageFormat::JPEG);
}

TEST_F(ExportServiceTests, UnrecognizedClipboardBytesEncodeInTheReservedFormat) {
  // The decoder reports JPEG, but nothing about the bytes says so before the run starts
  codec_->format_ = ImageFormat::JPEG;
  buffers_->Put("c1", ByteBuffer{1, 2, 3});
  Item item;
  item.id_     = "c1";
  item.origin_ = ItemOrigin::MEMORY_BUFFER;

  auto       service = MakeService();
  const auto summary = service.ExportBatch({item}, RunConfig{});

  ASSERT_EQ(summary.results_[0].status_, ItemStatus::COMPLETED) << summary.results_[0].error_;
  EXPECT_EQ(summary.results_[0].output_path_->extension(), ".png");
  EXPECT_EQ(codec_->LastCall().format_, ImageFormat::PNG);
}

TEST_F(ExportServiceTests, OneFailureDoesNotStopTheBatch) {
  auto items = std::vector<Item>{SourceFile("1", "trip/a.png"), SourceFile("2", "trip/b.png"),
                                 SourceFile("3", "trip/c.png")};
  std::filesystem::remove(items[1].source_path_);

  auto       service = MakeService();
  const auto summary = service.ExportBatch(items, RunConfig{});
  EXPECT_EQ(summary.succeeded_, 2u);
  EXPECT_EQ(summary.failed_, 1u);
  EXPECT_EQ(summary.results_[1].status_, ItemStatus::FAILED);
  EXPECT_FALSE(summary.results_[1].error_.empty());
  EXPECT_FALSE(summary.results_[1].output_path_.has_value());
}

TEST_F(ExportServiceTests, PerItemEditsAreApplied) {
  codec_->source_ = cv::Mat(20, 40, CV_8UC3, cv::Scalar(1, 2, 3));
  const std::vector<Item> items = {SourceFile("turned", "trip/a.png"),
                                   SourceFile("plain", "trip/b.png")};
  RunConfig               config;
  config.edits_["turned"].transform_ = {1, false, false};

  auto       service = MakeService();
  const auto summary = service.ExportBatch(items, config);
  EXPECT_EQ(summary.results_[0].output_width_, 20);
  EXPECT_EQ(summary.results_[0].output_height_, 40);
  EXPECT_EQ(summary.results_[1].output_width_, 40);
  EXPECT_EQ(summary.results_[1].output_height_, 20);
}

TEST_F(ExportServiceTests, TransparentItemsSwitchToPng) {
  codec_->source_        = cv::Mat(8, 8, CV_8UC4, cv::Scalar(1, 2, 3, 50));
  auto transparent       = SourceFile("t", "trip/logo.png");
  transparent.has_alpha_ = true;
  const std::vector<Item> items = {transparent};

  RunConfig config;
  config.output_format_ = OutputFormat::JPEG;
  auto       service    = MakeService();
  const auto summary    = service.ExportBatch(items, config);

  ASSERT_EQ(summary.results_[0].status_, ItemStatus::COMPLETED) << summary.results_[0].error_;
  EXPECT_TRUE(summary.results_[0].alpha_switched_);
  EXPECT_EQ(summary.results_[0].output_path_->extension(), ".png");
  EXPECT_EQ(summary.auto_switched_, 1u);
  ASSERT_EQ(summary.results_[0].warnings_.size(), 1u);
  EXPECT_EQ(summary.results_[0].warnings_[0], kTransparencySwitchWarning);
}

TEST_F(ExportServiceTests, JpegOutputGetsJpgExtension) {
  const std::vector<Item> items = {SourceFile("1", "trip/IMG_1.PNG")};
  RunConfig               config;
  config.output_format_ = OutputFormat::JPEG;
  auto       service    = MakeService();
  const auto summary    = service.ExportBatch(items, config);
  EXPECT_EQ(summary.results_[0].output_path_->filename(), "IMG_1_reformat.jpg");
}

TEST_F(ExportServiceTests, CancelledBeforeStartResolvesEverythingCanceled) {
  const std::vector<Item> items = {SourceFile("1", "trip/a.png"), SourceFile("2", "trip/b.png")};
  auto                    token = std::make_shared<CancellationToken>();
  token->Cancel();

  auto       service = MakeService();
  const auto summary = service.ExportBatch(items, RunConfig{}, token);
  EXPECT_EQ(summary.canceled_, 2u);
  EXPECT_EQ(summary.succeeded_, 0u);
  EXPECT_EQ(codec_->decode_calls_.load(), 0);
  for (const auto& result : summary.results_) {
    EXPECT_EQ(result.status_, ItemStatus::CANCELED);
    EXPECT_FALSE(result.output_path_.has_value());
  }
  EXPECT_TRUE(std::filesystem::is_empty(summary.output_folder_));
}

TEST_F(ExportServiceTests, CancelMidRunKeepsFinishedFiles) {
  const std::vector<Item> items = {SourceFile("1", "trip/a.png"), SourceFile("2", "trip/b.png"),
                                   SourceFile("3", "trip/c.png"), SourceFile("4", "trip/d.png")};
  auto                    token = std::make_shared<CancellationToken>();
  CancelAfterFirstObserver observer(token);

  auto       service = MakeService(1);
  const auto summary = service.ExportBatch(items, RunConfig{}, token, &observer);

  EXPECT_EQ(summary.succeeded_, 1u);
  EXPECT_EQ(summary.canceled_, 3u);
  EXPECT_EQ(summary.failed_, 0u);
  ASSERT_EQ(summary.results_[0].status_, ItemStatus::COMPLETED);
  EXPECT_TRUE(std::filesystem::exists(*summary.results_[0].output_path_));
  for (size_t i = 1; i < summary.results_.size(); ++i) {
    EXPECT_EQ(summary.results_[i].status_, ItemStatus::CANCELED);
  }
  EXPECT_FALSE(std::filesystem::exists(summary.output_folder_ / "b_reformat.png"));
}

TEST_F(ExportServiceTests, ObserverSeesStartAndEveryResolution) {
  const std::vector<Item> items = {SourceFile("1", "trip/a.png"), SourceFile("2", "trip/b.png"),
                                   ClipboardItem("3", false)};
  RecordingObserver       observer;
  auto                    service = MakeService(3);
  const auto summary = service.ExportBatch(items, RunConfig{}, nullptr, &observer);

  EXPECT_EQ(observer.started_run_id_, summary.run_id_);
  EXPECT_EQ(observer.started_total_, 3u);
  EXPECT_EQ(observer.started_folder_, summary.output_folder_);
  ASSERT_EQ(observer.updates_.size(), 3u);
  for (size_t i = 0; i < observer.updates_.size(); ++i) {
    const auto& update = observer.updates_[i];
    EXPECT_EQ(update.run_id_, summary.run_id_);
    EXPECT_EQ(update.total_, 3u);
    EXPECT_EQ(update.completed_, i + 1);
    EXPECT_EQ(update.completed_, update.succeeded_ + update.failed_ + update.canceled_);
  }
  EXPECT_EQ(observer.updates_.back().succeeded_, 2u);
  EXPECT_EQ(observer.updates_.back().failed_, 1u);
}

TEST_F(ExportServiceTests, OutputKeepsSourceModificationTime) {
  auto       item     = SourceFile("1", "trip/a.png");
  const auto old_time = std::filesystem::last_write_time(item.source_path_) - 72h;
  std::filesystem::last_write_time(item.source_path_, old_time);

  auto       service = MakeService();
  const auto summary = service.ExportBatch({item}, RunConfig{});
  ASSERT_EQ(summary.results_[0].status_, ItemStatus::COMPLETED);
  const auto written = std::filesystem::last_write_time(*summary.results_[0].output_path_);
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(written.time_since_epoch()),
            std::chrono::duration_cast<std::chrono::seconds>(old_time.time_since_epoch()));
}

TEST_F(ExportServiceTests, UnusableOutputRootThrows) {
  WriteFile("exports", "a regular file where the folder should be");
  const std::vector<Item> items   = {SourceFile("1", "trip/a.png")};
  auto                    service = MakeService();
  EXPECT_THROW(service.ExportBatch(items, RunConfig{}), std::runtime_error);
}

TEST(ItemStatusTests, Names) {
  EXPECT_EQ(ItemStatusToString(ItemStatus::COMPLETED), "completed");
  EXPECT_EQ(ItemStatusToString(ItemStatus::FAILED), "failed");
  EXPECT_EQ(ItemStatusToString(ItemStatus::CANCELED), "canceled");
}
};  // namespace reformat
