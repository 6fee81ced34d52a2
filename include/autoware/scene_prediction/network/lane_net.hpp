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

#ifndef AUTOWARE__SCENE_PREDICTION__NETWORK__LANE_NET_HPP_
#define AUTOWARE__SCENE_PREDICTION__NETWORK__LANE_NET_HPP_

#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/nn/layers.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"

#include <cstddef>
#include <string>

namespace autoware::scene_prediction::network
{
using archetype::LaneTensor;
using archetype::Matrix;

/**
 * @brief Mixes each point with the max-pooled feature of its segment.
 */
class PointAggregateBlock
{
public:
  /**
   * @brief Construct a new PointAggregateBlock object.
   *
   * @param hidden_size Width of point features.
   * @param aggre_out Whether to return max-pooled segment features instead of point features.
   */
  PointAggregateBlock(size_t hidden_size, bool aggre_out);

  /**
   * @brief Execute forward.
   *
   * @param x Point features in the shape of (L*P, H).
   * @param num_point Number of points in each segment (P).
   * @return Matrix (L, H) if `aggre_out` is true, otherwise (L*P, H).
   */
  Matrix forward(const Matrix & x, size_t num_point) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

private:
  bool aggre_out_;
  nn::Mlp fc1_;
  nn::Mlp fc2_;
  nn::LayerNorm norm_;
};

/**
 * @brief Point aggregation encoder of polylines.
 *
 * A single instance encodes both lane segments and target nodes.
 */
class LaneNet
{
public:
  LaneNet(size_t in_size, size_t hidden_size);

  /**
   * @brief Execute forward.
   *
   * @param lanes Polylines in the shape of (L, P, F).
   * @return Matrix Segment embeddings in the shape of (L, hidden_size).
   */
  Matrix forward(const LaneTensor & lanes) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

  size_t hidden_size() const noexcept { return hidden_size_; }

private:
  size_t in_size_;
  size_t hidden_size_;
  nn::Mlp proj_;
  PointAggregateBlock aggre1_;
  PointAggregateBlock aggre2_;
};
}  // namespace autoware::scene_prediction::network
#endif  // AUTOWARE__SCENE_PREDICTION__NETWORK__LANE_NET_HPP_
