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

#ifndef AUTOWARE__SCENE_PREDICTION__ARCHETYPE__CONFIG_HPP_
#define AUTOWARE__SCENE_PREDICTION__ARCHETYPE__CONFIG_HPP_

#include <cstddef>
#include <string>

namespace autoware::scene_prediction::archetype
{
/**
 * @brief An enumerate to represent how the decoder parameterizes trajectories.
 */
enum class ParamOut {
  BEZIER = 0,    //!< Bezier control points evaluated with the Bernstein basis.
  MONOMIAL = 1,  //!< Polynomial coefficients evaluated with the power basis.
  NONE = 2,      //!< Raw per-step waypoints.
};

/**
 * @brief Convert the name of parameterization to `ParamOut`.
 *
 * @param name One of `bezier`, `monomial` or `none`.
 * @throw SceneException If the name is not supported.
 */
ParamOut to_param_out(const std::string & name);

/**
 * @brief Return the name of parameterization.
 */
std::string to_string(ParamOut param_out);

/**
 * @brief Construction-time configuration of the network.
 */
struct ModelConfig
{
  size_t in_actor{3};                    //!< Number of actor input attributes.
  size_t in_lane{10};                    //!< Number of lane point input attributes.
  size_t n_fpn_scale{4};                 //!< Number of stages in the actor pyramid.
  size_t d_actor{128};                   //!< Width of actor embeddings.
  size_t d_lane{128};                    //!< Width of lane embeddings.
  size_t d_embed{128};                   //!< Width of fused scene embeddings.
  size_t d_rpe_in{5};                    //!< Number of raw scene RPE attributes.
  size_t d_rpe{128};                     //!< Width of projected scene RPE (edge) embeddings.
  size_t d_tgt_rpe{11};                  //!< Number of raw target RPE attributes.
  double dropout{0.1};                   //!< Dropout ratio, identity at inference.
  bool update_edge{true};                //!< Whether fusion layers update edge embeddings.
  size_t n_scene_head{8};                //!< Number of attention heads in scene fusion.
  size_t n_scene_layer{6};               //!< Number of scene fusion layers.
  ParamOut param_out{ParamOut::BEZIER};  //!< Trajectory parameterization.
  size_t g_pred_len{30};                 //!< Number of predicted future steps.
  size_t g_num_modes{6};                 //!< Number of predicted modes.

  /**
   * @brief Check the consistency of the configuration.
   *
   * @throw SceneException If any value is not supported.
   */
  void validate() const;
};
}  // namespace autoware::scene_prediction::archetype
#endif  // AUTOWARE__SCENE_PREDICTION__ARCHETYPE__CONFIG_HPP_
