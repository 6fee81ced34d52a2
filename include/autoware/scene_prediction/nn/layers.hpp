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

#ifndef AUTOWARE__SCENE_PREDICTION__NN__LAYERS_HPP_
#define AUTOWARE__SCENE_PREDICTION__NN__LAYERS_HPP_

#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/constants.hpp"
#include "autoware/scene_prediction/nn/parameter.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace autoware::scene_prediction::nn
{
using archetype::Matrix;
using archetype::Vector;

/**
 * @brief Fully connected layer, `y = x W^T + b`.
 */
class Linear
{
public:
  /**
   * @brief Construct a new Linear object.
   *
   * @param in_features Number of input features.
   * @param out_features Number of output features.
   * @param bias Whether to add a learned bias.
   */
  Linear(size_t in_features, size_t out_features, bool bias = true);

  /**
   * @brief Execute forward.
   *
   * @param x Input in the shape of (N, in_features).
   * @return Matrix Output in the shape of (N, out_features).
   */
  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

  size_t in_features() const noexcept { return static_cast<size_t>(weight_.cols()); }
  size_t out_features() const noexcept { return static_cast<size_t>(weight_.rows()); }

  const Matrix & weight() const noexcept { return weight_; }
  const Vector & bias() const noexcept { return bias_; }

private:
  Matrix weight_;  //!< (out_features, in_features).
  Vector bias_;    //!< (out_features).
  bool has_bias_;
};

/**
 * @brief Layer normalization over the last dimension.
 */
class LayerNorm
{
public:
  explicit LayerNorm(size_t dim, float eps = constants::NORM_EPSILON);

  /**
   * @brief Normalize each row of the input.
   */
  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

private:
  Vector weight_;
  Vector bias_;
  float eps_;
};

/**
 * @brief Group normalization of a single sample in the shape of (C, L).
 */
class GroupNorm
{
public:
  GroupNorm(size_t num_group, size_t num_channel, float eps = constants::NORM_EPSILON);

  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

private:
  size_t num_group_;
  Vector weight_;
  Vector bias_;
  float eps_;
};

/**
 * @brief 1D convolution without bias over a single sample in the shape of (C_in, L).
 */
class Conv1dLayer
{
public:
  Conv1dLayer(
    size_t in_channels, size_t out_channels, size_t kernel_size, size_t stride, size_t padding);

  /**
   * @brief Execute forward.
   *
   * @param x Input in the shape of (C_in, L).
   * @return Matrix Output in the shape of (C_out, L_out).
   */
  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

  /**
   * @brief Return the output length for the input length.
   */
  size_t output_length(size_t length) const;

private:
  size_t in_channels_;
  size_t kernel_size_;
  size_t stride_;
  size_t padding_;
  Matrix weight_;  //!< (C_out, C_in * kernel_size), same layout as (C_out, C_in, kernel_size).
};

/**
 * @brief Stack of `Linear -> LayerNorm -> ReLU` blocks, optionally followed by a bare `Linear`.
 *
 * Parameter names follow the indices of the equivalent `torch.nn.Sequential`.
 */
class Mlp
{
public:
  /**
   * @brief Construct a new Mlp object.
   *
   * @param dims Widths from the input to the output, e.g. `{in, hidden, out}`.
   * @param linear_head Whether the last transition is a bare `Linear`.
   */
  explicit Mlp(const std::vector<size_t> & dims, bool linear_head = false);

  Matrix forward(const Matrix & x) const;

  void collect_parameters(const std::string & prefix, ParameterList & params);

  size_t out_features() const noexcept { return out_features_; }

private:
  std::vector<Linear> linears_;
  std::vector<LayerNorm> norms_;
  bool linear_head_;
  size_t out_features_;
};
}  // namespace autoware::scene_prediction::nn
#endif  // AUTOWARE__SCENE_PREDICTION__NN__LAYERS_HPP_
