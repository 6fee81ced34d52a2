// Copyright 2025 TIER IV, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "autoware/scene_prediction/utils/param_loader.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"

#include <fstream>
#include <string>

namespace autoware::scene_prediction::utils
{
archetype::ModelConfig to_model_config(const json & j)
{
  archetype::ModelConfig config;
  try {
    // Input widths
    config.in_actor = j.at("in_actor").get<size_t>();
    config.in_lane = j.at("in_lane").get<size_t>();

    // Encoders
    config.n_fpn_scale = j.at("n_fpn_scale").get<size_t>();
    config.d_actor = j.at("d_actor").get<size_t>();
    config.d_lane = j.at("d_lane").get<size_t>();

    // Fusion
    config.d_embed = j.at("d_embed").get<size_t>();
    config.d_rpe_in = j.at("d_rpe_in").get<size_t>();
    config.d_rpe = j.at("d_rpe").get<size_t>();
    config.dropout = j.at("dropout").get<double>();
    config.update_edge = j.at("update_edge").get<bool>();
    config.n_scene_head = j.at("n_scene_head").get<size_t>();
    config.n_scene_layer = j.at("n_scene_layer").get<size_t>();

    // Decoder
    config.d_tgt_rpe = j.at("d_tgt_rpe").get<size_t>();
    config.param_out = archetype::to_param_out(j.at("param_out").get<std::string>());
    config.g_pred_len = j.at("g_pred_len").get<size_t>();
    config.g_num_modes = j.at("g_num_modes").get<size_t>();
  } catch (const json::exception & e) {
    throw archetype::SceneException(archetype::SceneError_t::INVALID_CONFIG, e.what());
  }

  config.validate();
  return config;
}

archetype::ModelConfig load_model_config(const std::string & json_path)
{
  std::ifstream file(json_path);
  if (!file) {
    throw archetype::SceneException(
      archetype::SceneError_t::IO, "Could not open param.json file: " + json_path);
  }

  json j;
  try {
    file >> j;
  } catch (const json::parse_error & e) {
    throw archetype::SceneException(archetype::SceneError_t::INVALID_CONFIG, e.what());
  }
  return to_model_config(j);
}
}  // namespace autoware::scene_prediction::utils
