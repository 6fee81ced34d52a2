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

#ifndef AUTOWARE__SCENE_PREDICTION__UTILS__PARAM_LOADER_HPP_
#define AUTOWARE__SCENE_PREDICTION__UTILS__PARAM_LOADER_HPP_

#include "autoware/scene_prediction/archetype/config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace autoware::scene_prediction::utils
{
using json = nlohmann::json;

/**
 * @brief Convert a JSON object into `ModelConfig`.
 *
 * Every key of `ModelConfig` is required. The result is validated.
 *
 * @param j JSON object.
 * @return archetype::ModelConfig
 * @throw SceneException If a key is missing, ill-typed or the configuration is not valid.
 */
archetype::ModelConfig to_model_config(const json & j);

/**
 * @brief Load model configuration from a JSON file.
 *
 * @param json_path Path to the model parameter JSON file, e.g. `scene_pred_net.param.json`.
 * @return archetype::ModelConfig
 * @throw SceneException If the file cannot be opened or parsed, or the configuration is invalid.
 */
archetype::ModelConfig load_model_config(const std::string & json_path);
}  // namespace autoware::scene_prediction::utils
#endif  // AUTOWARE__SCENE_PREDICTION__UTILS__PARAM_LOADER_HPP_
