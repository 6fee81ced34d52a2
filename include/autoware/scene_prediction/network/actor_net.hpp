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

#ifndef AUTOWARE__SCENE_PREDICTION__NETWORK__ACTOR_NET_HPP_
#define AUTOWARE__SCENE_PREDICTION__NETWORK__ACTOR_NET_HPP_

#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/nn/layers.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace autoware::scene_prediction::network
{
using archetype::ActorTensor;
using archetype::Matrix;

/**
 * @brief Convolution followed by group normalization and an optional ReLU.
 */
class Conv1d
{
public:
  Conv1d(
    size_t in_channels, size_t out_channels, size_t kernel_size = 3, size_t stride = 1,
    bool act = true);

  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

private:
  nn::Conv1dLayer conv_;
  nn::GroupNorm norm_;
  bool act_;
};

/**
 * @brief 1D residual block with two 3-tap convolutions.
 *
 * A 1-tap projection is applied to the shortcut when the stride or the width changes.
 */
class Res1d
{
public:
  Res1d(size_t in_channels, size_t out_channels, size_t stride = 1);

  /**
   * @brief Execute forward.
   *
   * @param x Input in the shape of (C_in, L).
   * @return Matrix Output in the shape of (C_out, ceil(L / stride)).
   */
  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

private:
  nn::Conv1dLayer conv1_;
  nn::GroupNorm bn1_;
  nn::Conv1dLayer conv2_;
  nn::GroupNorm bn2_;
  std::optional<nn::Conv1dLayer> downsample_conv_;
  std::optional<nn::GroupNorm> downsample_norm_;
};

/**
 * @brief Temporal feature pyramid over actor histories.
 */
class ActorNet
{
public:
  /**
   * @brief Construct a new ActorNet object.
   *
   * @param in_channels Number of input attributes for each timestamp.
   * @param hidden_size Width of the output embedding.
   * @param num_scale Number of pyramid stages.
   */
  ActorNet(size_t in_channels, size_t hidden_size, size_t num_scale);

  /**
   * @brief Execute forward.
   *
   * @param actors Actor histories in the shape of (A, C, T).
   * @return Matrix Actor embeddings in the shape of (A, hidden_size).
   * @throw SceneException If the lengths of neighboring stages cannot be fused.
   */
  Matrix forward(const ActorTensor & actors) const;

  void collect_parameters(const std::string & prefix, nn::ParameterList & params);

  size_t hidden_size() const noexcept { return hidden_size_; }

private:
  /**
   * @brief Encode a single history in the shape of (C, T) into a row vector.
   */
  Matrix encode(const Matrix & history) const;

  size_t in_channels_;
  size_t hidden_size_;
  std::vector<std::vector<Res1d>> groups_;  //!< Residual blocks of each stage.
  std::vector<Conv1d> lateral_;             //!< Lateral projection of each stage.
  Res1d output_;
};
}  // namespace autoware::scene_prediction::network
#endif  // AUTOWARE__SCENE_PREDICTION__NETWORK__ACTOR_NET_HPP_
