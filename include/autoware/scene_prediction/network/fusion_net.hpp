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

#ifndef AUTOWARE__SCENE_PREDICTION__NETWORK__FUSION_NET_HPP_
#define AUTOWARE__SCENE_PREDICTION__NETWORK__FUSION_NET_HPP_

#include "autoware/scene_prediction/archetype/config.hpp"
#include "autoware/scene_prediction/archetype/ragged_index.hpp"
#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/network/rela_fusion.hpp"
#include "autoware/scene_prediction/nn/layers.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"

#include <string>
#include <tuple>
#include <vector>

namespace autoware::scene_prediction::network
{
using archetype::Matrix;
using archetype::RaggedIndex;
using archetype::RpeTensor;

/**
 * @brief Scene-wise fusion of actors, lanes and a context (CLS) token.
 */
class FusionNet
{
public:
  using output_type = std::tuple<Matrix, Matrix, Matrix>;  //!< Actors, lanes and CLS tokens.

  explicit FusionNet(const archetype::ModelConfig & config);

  /**
   * @brief Execute forward.
   *
   * @param actors Actor embeddings in the shape of (ΣA, d_actor).
   * @param actor_idcs Actor groups of each scene.
   * @param lanes Lane embeddings in the shape of (ΣL, d_lane).
   * @param lane_idcs Lane groups of each scene.
   * @param rpes Scene RPE of each scene in the shape of (d_rpe_in, A+L, A+L).
   * @return Fused actors (ΣA, d_embed), lanes (ΣL, d_embed) and CLS tokens (B, d_embed).
   * @throw SceneException If the shapes of inputs are inconsistent.
   */
  output_type forward(
    const Matrix & actors, const RaggedIndex & actor_idcs, const Matrix & lanes,
    const RaggedIndex & lane_idcs, const std::vector<RpeTensor> & rpes) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

private:
  /**
   * @brief Build query-major edges of a scene, padded with zeros for the CLS token.
   */
  Matrix build_edge(const RpeTensor & rpe) const;

  size_t d_embed_;
  size_t d_rpe_in_;
  size_t d_rpe_;
  nn::Mlp proj_actor_;
  nn::Mlp proj_lane_;
  nn::Mlp proj_rpe_scene_;
  RelaFusionNet fuse_scene_;
};
}  // namespace autoware::scene_prediction::network
#endif  // AUTOWARE__SCENE_PREDICTION__NETWORK__FUSION_NET_HPP_
