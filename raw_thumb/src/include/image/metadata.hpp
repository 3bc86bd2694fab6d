//  Copyright 2025 Yurun Zi
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

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace rawthumb {
/**
 * @brief Capture metadata read from the RAW container. Every field is optional in practice;
 * unknown values stay at their defaults.
 */
class CaptureMetadata {
 public:
  // Model
  std::string         make_          = "";
  std::string         model_         = "";
  std::string         lens_          = "";
  std::string         lens_make_     = "";

  std::string         date_time_str_ = "";

  // Size, as reported by the container before any processing
  uint32_t            height_        = 0;
  uint32_t            width_         = 0;
  int                 orientation_   = 1;

  // Technical
  float               aperture_      = 0.0f;
  std::pair<int, int> shutter_speed_ = {0, 0};
  uint64_t            iso_           = 0;
  float               focal_         = 0.0f;

  std::string         container_     = "";

  auto                ToJson() const -> nlohmann::json {
    nlohmann::json json;
    json["Make"]           = make_;
    json["Model"]          = model_;
    json["Lens"]           = lens_;
    json["LensMake"]       = lens_make_;

    json["Aperture"]       = aperture_;
    json["FocalLength"]    = focal_;
    json["ISO"]            = iso_;
    json["ShutterSpeed"]   = {shutter_speed_.first, shutter_speed_.second};
    json["ImageHeight"]    = height_;
    json["ImageWidth"]     = width_;
    json["Orientation"]    = orientation_;
    json["DateTimeString"] = date_time_str_;
    json["Container"]      = container_;
    return json;
  }
};
};  // namespace rawthumb
