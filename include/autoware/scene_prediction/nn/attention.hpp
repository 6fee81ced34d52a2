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

#ifndef AUTOWARE__SCENE_PREDICTION__NN__ATTENTION_HPP_
#define AUTOWARE__SCENE_PREDICTION__NN__ATTENTION_HPP_

#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/nn/layers.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace autoware::scene_prediction::nn
{
using archetype::MaskMatrix;

/**
 * @brief Multi-head scaled dot-product attention with packed input projections.
 */
class MultiheadAttention
{
public:
  /**
   * @brief Construct a new MultiheadAttention object.
   *
   * @param embed_dim Width of queries, keys and values.
   * @param num_head Number of heads, `embed_dim` must be divisible by this.
   */
  MultiheadAttention(size_t embed_dim, size_t num_head);

  /**
   * @brief Attention where every query attends over the same keys.
   *
   * @param query Queries in the shape of (Nq, E).
   * @param key Keys in the shape of (Nk, E).
   * @param value Values in the shape of (Nk, E).
   * @param mask Optional mask in the shape of (Nq, Nk), `true` entries are ignored.
   * @return Matrix Output in the shape of (Nq, E).
   */
  Matrix forward(
    const Matrix & query, const Matrix & key, const Matrix & value,
    const MaskMatrix * mask = nullptr) const;

  /**
   * @brief Attention where the query `i` attends over its own `M` rows of `memory`.
   *
   * Keys and values are both `memory`.
   *
   * @param query Queries in the shape of (Nq, E).
   * @param memory Keys and values in the shape of (Nq*M, E), where rows `[i*M, (i+1)*M)` belong
   * to the query `i`.
   * @param mask Optional mask in the shape of (Nq, M), `true` entries are ignored.
   * @return Matrix Output in the shape of (Nq, E).
   */
  Matrix forward_grouped(
    const Matrix & query, const Matrix & memory, const MaskMatrix * mask = nullptr) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

private:
  /**
   * @brief Attend a single projected query over projected keys and values.
   *
   * @param q Projected query in the shape of (1, E).
   * @param k Projected keys in the shape of (M, E).
   * @param v Projected values in the shape of (M, E).
   * @param mask Pointer to `M` mask values or nullptr.
   * @return Concatenated head outputs in the shape of (1, E).
   */
  Matrix attend(
    const Eigen::Ref<const Matrix> & q, const Eigen::Ref<const Matrix> & k,
    const Eigen::Ref<const Matrix> & v, const bool * mask) const;

  Matrix project(const Matrix & x, size_t chunk) const;

  size_t embed_dim_;
  size_t num_head_;
  Matrix in_proj_weight_;  //!< (3E, E), rows of query, key and value in order.
  Vector in_proj_bias_;    //!< (3E).
  Linear out_proj_;
};

/**
 * @brief Post-norm Transformer encoder layer with ReLU feed-forward.
 */
class TransformerEncoderLayer
{
public:
  TransformerEncoderLayer(size_t d_model, size_t num_head, size_t dim_feedforward);

  /**
   * @brief Execute forward over a sequence in the shape of (L, E).
   */
  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

private:
  MultiheadAttention self_attn_;
  Linear linear1_;
  Linear linear2_;
  LayerNorm norm1_;
  LayerNorm norm2_;
};

/**
 * @brief Stack of `TransformerEncoderLayer`s.
 */
class TransformerEncoder
{
public:
  TransformerEncoder(size_t num_layer, size_t d_model, size_t num_head, size_t dim_feedforward);

  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

private:
  std::vector<TransformerEncoderLayer> layers_;
};
}  // namespace autoware::scene_prediction::nn
#endif  // AUTOWARE__SCENE_PREDICTION__NN__ATTENTION_HPP_
