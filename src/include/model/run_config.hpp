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

#include <string>
#include <unordered_map>

#include "geometry/crop.hpp"
#include "geometry/transform.hpp"
#include "sizing/resize_spec.hpp"
#include "type/image_format.hpp"
#include "type/type.hpp"

namespace reformat {
struct ItemEdit {
  Transform transform_;
  CropSpec  crop_;
};

/**
 * @brief Settings for one export run. The export service takes it by value, so later changes
 * made by the caller never reach a running batch.
 */
struct RunConfig {
  OutputFormat                            output_format_ = OutputFormat::SAME;
  ResizeSpec                              resize_        = PixelResize{};
  QualitySpec                             quality_;
  std::unordered_map<item_id_t, ItemEdit> edits_;

  auto                                    EditFor(const item_id_t& id) const -> ItemEdit {
    auto it = edits_.find(id);
    if (it == edits_.end()) return {};
    return it->second;
  }
};
};  // namespace reformat
