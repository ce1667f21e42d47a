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

#include "config/run_config_json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <variant>

#include "geometry/crop.hpp"
#include "sizing/resize_spec.hpp"

namespace reformat {
namespace ConfigJson {
namespace {
using nlohmann::json;

auto NumberIn(const json& j, const char* key, double min_exclusive, double max_inclusive)
    -> std::optional<double> {
  if (!j.is_object() || !j.contains(key) || !j[key].is_number()) return std::nullopt;
  const double value = j[key].get<double>();
  if (!std::isfinite(value) || value <= min_exclusive || value > max_inclusive) return std::nullopt;
  return value;
}

auto BoolOr(const json& j, const char* key, bool fallback) -> bool {
  if (!j.is_object() || !j.contains(key) || !j[key].is_boolean()) return fallback;
  return j[key].get<bool>();
}

auto FloatOr(const json& j, const char* key, float fallback) -> float {
  if (!j.is_object() || !j.contains(key) || !j[key].is_number()) return fallback;
  return j[key].get<float>();
}

auto QualityValue(const json& j, const char* key) -> int {
  if (!j.contains(key) || !j[key].is_number()) return QualitySpec::kDefaultQuality;
  const double value = j[key].get<double>();
  if (!std::isfinite(value) || value < QualitySpec::kMinQuality ||
      value > QualitySpec::kMaxQuality) {
    return QualitySpec::kDefaultQuality;
  }
  return static_cast<int>(std::lround(value));
}

auto PixelDimension(const json& j, const char* key) -> std::optional<int> {
  auto value = NumberIn(j, key, 0.0, PixelResize::kMaxPixels);
  if (!value) return std::nullopt;
  return std::max(1, static_cast<int>(std::lround(*value)));
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}  // namespace

auto ResizeSpecFromJson(const json& j) -> ResizeSpec {
  if (!j.is_object()) return PixelResize{};
  const std::string mode = j.contains("mode") && j["mode"].is_string()
                               ? j["mode"].get<std::string>()
                               : std::string("pixels");

  if (mode == "percent") {
    return PercentResize{
        NumberIn(j, "percent", 0.0, PercentResize::kMaxPercent).value_or(PercentResize::kDefaultPercent)};
  }
  if (mode == "target_size") {
    return TargetSizeResize{NumberIn(j, "target_mib", 0.0, TargetSizeResize::kMaxMiB)
                                .value_or(TargetSizeResize::kDefaultMiB)};
  }

  PixelResize pixels;
  pixels.keep_ratio_ = BoolOr(j, "keep_ratio", true);
  if (j.contains("driving") && j["driving"].is_string()) {
    pixels.driving_ =
        DrivingDimensionFromString(j["driving"].get<std::string>()).value_or(DrivingDimension::MAX_SIDE);
  }
  pixels.width_    = PixelDimension(j, "width");
  pixels.height_   = PixelDimension(j, "height");
  pixels.max_side_ = PixelDimension(j, "max_side");
  return pixels;
}

auto ResizeSpecToJson(const ResizeSpec& spec) -> json {
  return std::visit(
      Overloaded{
          [](const PercentResize& percent) -> json {
            return {{"mode", "percent"}, {"percent", percent.percent_}};
          },
          [](const TargetSizeResize& target) -> json {
            return {{"mode", "target_size"}, {"target_mib", target.target_mib_}};
          },
          [](const PixelResize& pixels) -> json {
            json out = {{"mode", "pixels"},
                        {"keep_ratio", pixels.keep_ratio_},
                        {"driving", DrivingDimensionToString(pixels.driving_)}};
            if (pixels.width_) out["width"] = *pixels.width_;
            if (pixels.height_) out["height"] = *pixels.height_;
            if (pixels.max_side_) out["max_side"] = *pixels.max_side_;
            return out;
          },
      },
      spec);
}

auto QualityFromJson(const json& j) -> QualitySpec {
  QualitySpec quality;
  if (!j.is_object()) return quality;
  quality.jpeg_ = QualityValue(j, "jpg");
  quality.webp_ = QualityValue(j, "webp");
  quality.heic_ = QualityValue(j, "heic");
  return quality;
}

auto ItemEditFromJson(const json& j) -> ItemEdit {
  ItemEdit edit;
  if (!j.is_object()) return edit;

  if (j.contains("transform") && j["transform"].is_object()) {
    const auto& t = j["transform"];
    if (t.contains("rotate_steps") && t["rotate_steps"].is_number_integer()) {
      edit.transform_.rotate_steps_ = t["rotate_steps"].get<int>();
    }
    edit.transform_.flip_h_ = BoolOr(t, "flip_h", false);
    edit.transform_.flip_v_ = BoolOr(t, "flip_v", false);
    edit.transform_         = edit.transform_.Normalized();
  }

  if (j.contains("crop") && j["crop"].is_object()) {
    const auto& c  = j["crop"];
    edit.crop_.active_ = BoolOr(c, "active", false);
    if (c.contains("preset") && c["preset"].is_string()) {
      edit.crop_.preset_ =
          CropPresetFromString(c["preset"].get<std::string>()).value_or(CropRatioPreset::ORIGINAL);
    }
    if (c.contains("rect") && c["rect"].is_object()) {
      const auto& r = c["rect"];
      edit.crop_.rect_ = ClampCropRect({FloatOr(r, "x", 0.0f), FloatOr(r, "y", 0.0f),
                                        FloatOr(r, "width", 1.0f), FloatOr(r, "height", 1.0f)});
    }
  }
  return edit;
}

auto ItemEditToJson(const ItemEdit& edit) -> json {
  const auto& t = edit.transform_;
  const auto& c = edit.crop_;
  return {{"transform",
           {{"rotate_steps", t.Steps()}, {"flip_h", t.flip_h_}, {"flip_v", t.flip_v_}}},
          {"crop",
           {{"active", c.active_},
            {"preset", CropPresetToString(c.preset_)},
            {"rect",
             {{"x", c.rect_.x_}, {"y", c.rect_.y_}, {"width", c.rect_.w_}, {"height", c.rect_.h_}}}}}};
}

auto RunConfigFromJson(const json& j) -> RunConfig {
  RunConfig config;
  if (!j.is_object()) return config;

  if (j.contains("output_format") && j["output_format"].is_string()) {
    config.output_format_ =
        OutputFormatFromString(j["output_format"].get<std::string>()).value_or(OutputFormat::SAME);
  }
  if (j.contains("resize")) config.resize_ = ResizeSpecFromJson(j["resize"]);
  if (j.contains("quality")) config.quality_ = QualityFromJson(j["quality"]);
  if (j.contains("edits") && j["edits"].is_object()) {
    for (const auto& [id, edit] : j["edits"].items()) {
      config.edits_[id] = ItemEditFromJson(edit);
    }
  }
  return config;
}

auto RunConfigToJson(const RunConfig& config) -> json {
  json out;
  out["output_format"] = OutputFormatToString(config.output_format_);
  out["resize"]        = ResizeSpecToJson(config.resize_);
  out["quality"]       = {{"jpg", config.quality_.jpeg_},
                          {"webp", config.quality_.webp_},
                          {"heic", config.quality_.heic_}};
  json edits           = json::object();
  for (const auto& [id, edit] : config.edits_) {
    edits[id] = ItemEditToJson(edit);
  }
  out["edits"] = edits;
  return out;
}

auto ExportJobFromJson(const json& j) -> ExportJob {
  if (!j.is_object()) {
    throw std::runtime_error("[ERROR] ConfigJson: job must be a JSON object");
  }
  if (!j.contains("items") || !j["items"].is_array()) {
    throw std::runtime_error("[ERROR] ConfigJson: job has no \"items\" array");
  }

  ExportJob job;
  size_t    index = 0;
  for (const auto& entry : j["items"]) {
    JobItem item;
    if (entry.is_string()) {
      item.path_ = entry.get<std::string>();
    } else if (entry.is_object() && entry.contains("path") && entry["path"].is_string()) {
      item.path_ = entry["path"].get<std::string>();
      if (entry.contains("id") && entry["id"].is_string()) item.id_ = entry["id"].get<std::string>();
    } else {
      throw std::runtime_error("[ERROR] ConfigJson: item " + std::to_string(index) +
                               " has no path");
    }
    if (item.id_.empty()) item.id_ = "item-" + std::to_string(index);
    job.items_.push_back(std::move(item));
    ++index;
  }

  if (j.contains("config")) job.config_ = RunConfigFromJson(j["config"]);
  if (j.contains("output_root") && j["output_root"].is_string()) {
    job.output_root_ = image_path_t(j["output_root"].get<std::string>());
  }
  if (j.contains("destination") && j["destination"].is_string()) {
    job.destination_ = j["destination"].get<std::string>();
  }
  if (j.contains("concurrency") && j["concurrency"].is_number_integer()) {
    const auto concurrency = j["concurrency"].get<int64_t>();
    if (concurrency > 0) job.concurrency_ = static_cast<size_t>(concurrency);
  }
  return job;
}

auto LoadExportJob(const image_path_t& path) -> ExportJob {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("[ERROR] ConfigJson: cannot open job file " + path.string());
  }
  json j = json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    throw std::runtime_error("[ERROR] ConfigJson: job file " + path.string() +
                             " is not valid JSON");
  }
  return ExportJobFromJson(j);
}

auto RunSummaryToJson(const RunSummary& summary) -> json {
  json out;
  out["run_id"]        = summary.run_id_;
  out["output_folder"] = summary.output_folder_.string();
  out["total"]         = summary.total_;
  out["succeeded"]     = summary.succeeded_;
  out["failed"]        = summary.failed_;
  out["canceled"]      = summary.canceled_;
  out["auto_switched"] = summary.auto_switched_;

  json items           = json::array();
  for (const auto& result : summary.results_) {
    json item;
    item["id"]     = result.item_id_;
    item["status"] = ItemStatusToString(result.status_);
    if (result.output_path_) {
      item["output_path"] = result.output_path_->string();
      item["bytes"]       = result.output_bytes_;
      item["width"]       = result.output_width_;
      item["height"]      = result.output_height_;
    }
    if (!result.error_.empty()) item["error"] = result.error_;
    if (!result.warnings_.empty()) item["warnings"] = result.warnings_;
    items.push_back(item);
  }
  out["items"] = items;
  return out;
}
};  // namespace ConfigJson
};  // namespace reformat
