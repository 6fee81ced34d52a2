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

#ifndef AUTOWARE__SCENE_PREDICTION__NETWORK__SCENE_DECODER_HPP_
#define AUTOWARE__SCENE_PREDICTION__NETWORK__SCENE_DECODER_HPP_

#include "autoware/scene_prediction/archetype/config.hpp"
#include "autoware/scene_prediction/archetype/ragged_index.hpp"
#include "autoware/scene_prediction/archetype/scene_batch.hpp"
#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/network/trajectory_basis.hpp"
#include "autoware/scene_prediction/nn/attention.hpp"
#include "autoware/scene_prediction/nn/layers.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace autoware::scene_prediction::network
{
using archetype::AuxiliaryOutput;
using archetype::Matrix;
using archetype::ModeTensor;
using archetype::RaggedIndex;

/**
 * @brief Multi-modal trajectory decoder.
 *
 * Mode scores are decoded from the scene context (CLS) token and are shared by every actor in the
 * scene. Trajectories are decoded from the sum of context, actor and target embeddings.
 */
class SceneDecoder
{
public:
  // Probabilities (A, K), trajectories (A, K, S, 4) and auxiliary outputs of each scene.
  using output_type =
    std::tuple<std::vector<Matrix>, std::vector<ModeTensor>, std::vector<AuxiliaryOutput>>;

  explicit SceneDecoder(const archetype::ModelConfig & config);

  /**
   * @brief Execute forward.
   *
   * @param ctx Context tokens in the shape of (B, H).
   * @param actors Fused actor embeddings in the shape of (ΣA, H).
   * @param actor_idcs Actor groups of each scene.
   * @param tgt_feat Target node embeddings in the shape of (1, H) or (B, H).
   * @param tgt_rpes Target RPE in the shape of (B, d_tgt_rpe).
   * @return output_type Per-scene outputs in the input order.
   * @throw SceneException If the shapes of inputs are inconsistent.
   */
  output_type forward(
    const Matrix & ctx, const Matrix & actors, const RaggedIndex & actor_idcs,
    const Matrix & tgt_feat, const Matrix & tgt_rpes) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

  const TrajectoryBasis & basis() const noexcept { return *basis_; }

private:
  /**
   * @brief Reshape a (1, K*H) row into (K, H).
   */
  Matrix to_modes(const Matrix & row) const;

  size_t hidden_size_;
  size_t num_mode_;
  size_t d_tgt_rpe_;
  nn::Mlp actor_proj_;
  nn::Mlp ctx_proj_;
  nn::TransformerEncoder ctx_sat_;
  nn::Mlp proj_rpe_;
  nn::Mlp proj_tgt_;
  nn::Mlp cls_;
  std::unique_ptr<TrajectoryBasis> basis_;
  nn::Mlp reg_;
};
}  // namespace autoware::scene_prediction::network
#endif  // AUTOWARE__SCENE_PREDICTION__NETWORK__SCENE_DECODER_HPP_
