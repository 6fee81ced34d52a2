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

#ifndef AUTOWARE__SCENE_PREDICTION__NETWORK__RELA_FUSION_HPP_
#define AUTOWARE__SCENE_PREDICTION__NETWORK__RELA_FUSION_HPP_

#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/nn/attention.hpp"
#include "autoware/scene_prediction/nn/layers.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace autoware::scene_prediction::network
{
using archetype::MaskMatrix;
using archetype::Matrix;

/**
 * @brief Relation-aware attention layer over a fully connected token graph.
 *
 * Edges are stored query-major, the row `i*N + j` holds the relation seen by the token `i` from
 * the token `j`.
 */
class RelaFusionLayer
{
public:
  /**
   * @brief Construct a new RelaFusionLayer object.
   *
   * @param d_edge Width of edge features.
   * @param d_model Width of node features.
   * @param d_ffn Width of the feed-forward hidden layer.
   * @param num_head Number of attention heads.
   * @param update_edge Whether to update edges from the memory.
   */
  RelaFusionLayer(size_t d_edge, size_t d_model, size_t d_ffn, size_t num_head, bool update_edge);

  /**
   * @brief Execute forward.
   *
   * @param node Node features in the shape of (N, d_model).
   * @param edge Edge features in the shape of (N*N, d_edge).
   * @param edge_mask Optional mask in the shape of (N, N), `true` entries are ignored.
   * @return Updated nodes and edges. Edges are returned as is if `update_edge` is false.
   */
  std::pair<Matrix, Matrix> forward(
    const Matrix & node, const Matrix & edge, const MaskMatrix * edge_mask = nullptr) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

  bool update_edge() const noexcept { return proj_edge_.has_value(); }

private:
  nn::Mlp proj_memory_;
  std::optional<nn::Mlp> proj_edge_;
  std::optional<nn::LayerNorm> norm_edge_;
  nn::MultiheadAttention multihead_attn_;
  nn::Linear linear1_;
  nn::Linear linear2_;
  nn::LayerNorm norm2_;
  nn::LayerNorm norm3_;
};

/**
 * @brief Stack of `RelaFusionLayer`s, where the last layer does not update edges.
 */
class RelaFusionNet
{
public:
  RelaFusionNet(
    size_t d_model, size_t d_edge, size_t num_head, size_t num_layer, bool update_edge);

  /**
   * @brief Execute forward.
   *
   * @param node Node features in the shape of (N, d_model).
   * @param edge Edge features in the shape of (N*N, d_edge), query-major.
   * @param edge_mask Optional mask in the shape of (N, N), `true` entries are ignored.
   * @return Matrix Fused nodes in the shape of (N, d_model).
   */
  Matrix forward(
    const Matrix & node, const Matrix & edge, const MaskMatrix * edge_mask = nullptr) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

  const std::vector<RelaFusionLayer> & layers() const noexcept { return fusion_; }

private:
  size_t d_model_;
  size_t d_edge_;
  std::vector<RelaFusionLayer> fusion_;
};
}  // namespace autoware::scene_prediction::network
#endif  // AUTOWARE__SCENE_PREDICTION__NETWORK__RELA_FUSION_HPP_
