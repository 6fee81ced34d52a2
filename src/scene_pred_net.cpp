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

#include "autoware/scene_prediction/scene_pred_net.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/utils/weight_loader.hpp"

#include <rclcpp/logging.hpp>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace autoware::scene_prediction
{
namespace
{
rclcpp::Logger get_logger()
{
  return rclcpp::get_logger("scene_prediction");
}

/**
 * @brief Return the configuration if it is valid, otherwise throw.
 */
const archetype::ModelConfig & validated(const archetype::ModelConfig & config)
{
  config.validate();
  return config;
}
}  // namespace

ScenePredNet::ScenePredNet(const archetype::ModelConfig & config, std::uint32_t seed)
: config_(validated(config)),
  preprocessor_(config_),
  actor_net_(config_.in_actor, config_.d_actor, config_.n_fpn_scale),
  lane_net_(config_.in_lane, config_.d_lane),
  fusion_net_(config_),
  pred_scene_(config_)
{
  const auto params = named_parameters();
  nn::initialize_parameters(params, seed);

  size_t num_element = 0;
  for (const auto & param : params) {
    num_element += param.numel();
  }
  RCLCPP_INFO(
    get_logger(),
    "ScenePredNet is built: param_out=%s, modes=%zu, steps=%zu, tensors=%zu, parameters=%zu",
    archetype::to_string(config_.param_out).c_str(), config_.g_num_modes, config_.g_pred_len,
    params.size(), num_element);
}

archetype::SceneBatch ScenePredNet::pre_process(const nlohmann::json & batch) const
{
  return preprocessor_.process(batch);
}

ScenePredNet::output_type ScenePredNet::forward(const archetype::SceneBatch & batch) const
{
  RCLCPP_DEBUG(get_logger(), "Forward %zu scene(s)", batch.num_scene());

  const auto actors = actor_net_.forward(batch.actors);
  const auto lanes = lane_net_.forward(batch.lanes);

  const auto [actors_fused, lanes_fused, cls] =
    fusion_net_.forward(actors, batch.actor_idcs, lanes, batch.lane_idcs, batch.rpes);

  const auto tgt_feat = lane_net_.forward(batch.tgt_nodes);
  return pred_scene_.forward(cls, actors_fused, batch.actor_idcs, tgt_feat, batch.tgt_rpes);
}

archetype::Result<ScenePredNet::output_type> ScenePredNet::infer(
  const archetype::SceneBatch & batch) const noexcept
{
  try {
    return archetype::Result<output_type>(forward(batch));
  } catch (const archetype::SceneException & e) {
    RCLCPP_WARN(get_logger(), "%s", e.what());
    return archetype::Err<output_type>(e.error());
  } catch (const std::exception & e) {
    RCLCPP_WARN(get_logger(), "Unexpected error in inference: %s", e.what());
    return archetype::Err<output_type>(archetype::SceneError_t::UNKNOWN, e.what());
  }
}

nn::ParameterList ScenePredNet::named_parameters()
{
  nn::ParameterList params;
  actor_net_.collect_parameters("actor_net", params);
  lane_net_.collect_parameters("lane_net", params);
  fusion_net_.collect_parameters("fusion_net", params);
  pred_scene_.collect_parameters("pred_scene", params);
  return params;
}

std::vector<std::string> ScenePredNet::load_state_dict(const nn::StateDict & state_dict)
{
  const auto params = named_parameters();
  auto unexpected = nn::load_state_dict(params, state_dict);
  for (const auto & name : unexpected) {
    RCLCPP_WARN(get_logger(), "Unexpected key in state dict: %s", name.c_str());
  }
  return unexpected;
}

void ScenePredNet::load_weights(const std::string & path)
{
  const auto state_dict = utils::load_safetensors(path);
  const auto unexpected = load_state_dict(state_dict);
  RCLCPP_INFO(
    get_logger(), "Loaded %zu tensor(s) from %s, %zu unused", state_dict.size() - unexpected.size(),
    path.c_str(), unexpected.size());
}
}  // namespace autoware::scene_prediction
