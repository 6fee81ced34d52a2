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

#ifndef AUTOWARE__SCENE_PREDICTION__SCENE_PRED_NET_HPP_
#define AUTOWARE__SCENE_PREDICTION__SCENE_PRED_NET_HPP_

#include "autoware/scene_prediction/archetype/config.hpp"
#include "autoware/scene_prediction/archetype/result.hpp"
#include "autoware/scene_prediction/archetype/scene_batch.hpp"
#include "autoware/scene_prediction/network/actor_net.hpp"
#include "autoware/scene_prediction/network/fusion_net.hpp"
#include "autoware/scene_prediction/network/lane_net.hpp"
#include "autoware/scene_prediction/network/scene_decoder.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"
#include "autoware/scene_prediction/processing/preprocessor.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace autoware::scene_prediction
{
/**
 * @brief Multi-agent trajectory prediction network composed of actor, lane, fusion and decoder
 * stages.
 */
class ScenePredNet
{
public:
  using output_type = network::SceneDecoder::output_type;

  /**
   * @brief Construct a new ScenePredNet object with deterministically initialized parameters.
   *
   * @param config Model configuration.
   * @param seed Seed of parameter initialization.
   * @throw SceneException If the configuration is not valid.
   */
  explicit ScenePredNet(const archetype::ModelConfig & config, std::uint32_t seed = 0);

  /**
   * @brief Convert an untyped batch into `SceneBatch`.
   *
   * @param batch Mapping with `ACTORS`, `ACTOR_IDCS`, `LANES`, `LANE_IDCS`, `RPE`, `TGT_NODES`
   * and `TGT_RPE`.
   * @throw SceneException If a key is missing or the shapes are inconsistent.
   */
  archetype::SceneBatch pre_process(const nlohmann::json & batch) const;

  /**
   * @brief Execute forward.
   *
   * @param batch Input batch.
   * @return output_type Probabilities, trajectories and auxiliary outputs of each scene.
   * @throw SceneException If the shapes of inputs are inconsistent.
   */
  output_type forward(const archetype::SceneBatch & batch) const;

  /**
   * @brief Execute forward without throwing.
   *
   * @param batch Input batch.
   * @return archetype::Result<output_type>
   */
  archetype::Result<output_type> infer(const archetype::SceneBatch & batch) const noexcept;

  /**
   * @brief Return views to every learned parameter with its exported name.
   */
  nn::ParameterList named_parameters();

  /**
   * @brief Copy tensors into parameters by name.
   *
   * @param state_dict Tensors by name.
   * @return Names in `state_dict` not used by the model.
   * @throw SceneException If a parameter is missing or has a different shape.
   */
  std::vector<std::string> load_state_dict(const nn::StateDict & state_dict);

  /**
   * @brief Load parameters from a safetensors checkpoint.
   *
   * @param path Path to the `.safetensors` file.
   * @throw SceneException If the file cannot be read or does not match the model.
   */
  void load_weights(const std::string & path);

  const archetype::ModelConfig & config() const noexcept { return config_; }

private:
  archetype::ModelConfig config_;
  processing::PreProcessor preprocessor_;
  network::ActorNet actor_net_;
  network::LaneNet lane_net_;
  network::FusionNet fusion_net_;
  network::SceneDecoder pred_scene_;
};
}  // namespace autoware::scene_prediction
#endif  // AUTOWARE__SCENE_PREDICTION__SCENE_PRED_NET_HPP_
