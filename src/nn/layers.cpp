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

#include "autoware/scene_prediction/nn/layers.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/nn/functional.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace autoware::scene_prediction::nn
{
namespace
{
/**
 * @brief Throw `SHAPE_MISMATCH` if the input width is not the expected one.
 */
void check_width(const char * layer, Eigen::Index actual, size_t expected)
{
  if (static_cast<size_t>(actual) != expected) {
    std::ostringstream msg;
    msg << layer << " expects " << expected << " input features, but got " << actual;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
}
}  // namespace

/////// Linear ///////

Linear::Linear(size_t in_features, size_t out_features, bool bias)
: weight_(Matrix::Zero(out_features, in_features)),
  bias_(Vector::Zero(bias ? out_features : 0)),
  has_bias_(bias)
{
}

Matrix Linear::forward(const Matrix & x) const
{
  check_width("Linear", x.cols(), in_features());
  Matrix output = x * weight_.transpose();
  if (has_bias_) {
    output.rowwise() += bias_.transpose();
  }
  return output;
}

void Linear::collect_parameters(const std::string & prefix, ParameterList & params)
{
  const auto fan_in = in_features();
  params.push_back(
    {join_name(prefix, "weight"), weight_.data(), {out_features(), fan_in}, Initializer::UNIFORM,
     fan_in});
  if (has_bias_) {
    params.push_back(
      {join_name(prefix, "bias"), bias_.data(), {out_features()}, Initializer::UNIFORM, fan_in});
  }
}

/////// LayerNorm ///////

LayerNorm::LayerNorm(size_t dim, float eps)
: weight_(Vector::Ones(dim)), bias_(Vector::Zero(dim)), eps_(eps)
{
}

Matrix LayerNorm::forward(const Matrix & x) const
{
  check_width("LayerNorm", x.cols(), static_cast<size_t>(weight_.size()));
  Matrix output(x.rows(), x.cols());
  for (Eigen::Index i = 0; i < x.rows(); ++i) {
    const float mean = x.row(i).mean();
    const Eigen::RowVectorXf centered = x.row(i).array() - mean;
    const float var = centered.squaredNorm() / static_cast<float>(x.cols());
    output.row(i) = (centered / std::sqrt(var + eps_)).cwiseProduct(weight_.transpose()) +
                    bias_.transpose();
  }
  return output;
}

void LayerNorm::collect_parameters(const std::string & prefix, ParameterList & params)
{
  const auto dim = static_cast<size_t>(weight_.size());
  params.push_back({join_name(prefix, "weight"), weight_.data(), {dim}, Initializer::ONES, dim});
  params.push_back({join_name(prefix, "bias"), bias_.data(), {dim}, Initializer::ZEROS, dim});
}

/////// GroupNorm ///////

GroupNorm::GroupNorm(size_t num_group, size_t num_channel, float eps)
: num_group_(num_group),
  weight_(Vector::Ones(num_channel)),
  bias_(Vector::Zero(num_channel)),
  eps_(eps)
{
  if (num_group == 0 || num_channel % num_group != 0) {
    std::ostringstream msg;
    msg << "Number of channels " << num_channel << " is not divisible by groups " << num_group;
    throw archetype::SceneException(archetype::SceneError_t::INVALID_CONFIG, msg.str());
  }
}

Matrix GroupNorm::forward(const Matrix & x) const
{
  check_width("GroupNorm", x.rows(), static_cast<size_t>(weight_.size()));
  const auto num_group = static_cast<Eigen::Index>(num_group_);
  const Eigen::Index channel_per_group = weight_.size() / num_group;

  Matrix output(x.rows(), x.cols());
  for (Eigen::Index g = 0; g < num_group; ++g) {
    const auto block = x.middleRows(g * channel_per_group, channel_per_group);
    const float mean = block.mean();
    const float var = (block.array() - mean).square().mean();
    output.middleRows(g * channel_per_group, channel_per_group) =
      (block.array() - mean) / std::sqrt(var + eps_);
  }
  for (Eigen::Index c = 0; c < output.rows(); ++c) {
    output.row(c) = output.row(c) * weight_(c) + Eigen::RowVectorXf::Constant(x.cols(), bias_(c));
  }
  return output;
}

void GroupNorm::collect_parameters(const std::string & prefix, ParameterList & params)
{
  const auto dim = static_cast<size_t>(weight_.size());
  params.push_back({join_name(prefix, "weight"), weight_.data(), {dim}, Initializer::ONES, dim});
  params.push_back({join_name(prefix, "bias"), bias_.data(), {dim}, Initializer::ZEROS, dim});
}

/////// Conv1dLayer ///////

Conv1dLayer::Conv1dLayer(
  size_t in_channels, size_t out_channels, size_t kernel_size, size_t stride, size_t padding)
: in_channels_(in_channels),
  kernel_size_(kernel_size),
  stride_(stride),
  padding_(padding),
  weight_(Matrix::Zero(out_channels, in_channels * kernel_size))
{
}

size_t Conv1dLayer::output_length(size_t length) const
{
  const size_t padded = length + 2 * padding_;
  if (padded < kernel_size_) {
    std::ostringstream msg;
    msg << "Input length " << length << " is too short for kernel size " << kernel_size_;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  return (padded - kernel_size_) / stride_ + 1;
}

Matrix Conv1dLayer::forward(const Matrix & x) const
{
  check_width("Conv1d", x.rows(), in_channels_);

  const auto length = static_cast<Eigen::Index>(x.cols());
  const auto out_length = static_cast<Eigen::Index>(output_length(x.cols()));
  const auto kernel = static_cast<Eigen::Index>(kernel_size_);

  // im2col: (C_in * kernel_size, L_out)
  Matrix columns = Matrix::Zero(x.rows() * kernel, out_length);
  for (Eigen::Index c = 0; c < x.rows(); ++c) {
    for (Eigen::Index k = 0; k < kernel; ++k) {
      for (Eigen::Index t = 0; t < out_length; ++t) {
        const Eigen::Index src = t * static_cast<Eigen::Index>(stride_) + k -
                                 static_cast<Eigen::Index>(padding_);
        if (src >= 0 && src < length) {
          columns(c * kernel + k, t) = x(c, src);
        }
      }
    }
  }
  return weight_ * columns;
}

void Conv1dLayer::collect_parameters(const std::string & prefix, ParameterList & params)
{
  const auto out_channels = static_cast<size_t>(weight_.rows());
  const auto fan_in = in_channels_ * kernel_size_;
  params.push_back(
    {join_name(prefix, "weight"), weight_.data(), {out_channels, in_channels_, kernel_size_},
     Initializer::UNIFORM, fan_in});
}

/////// Mlp ///////

Mlp::Mlp(const std::vector<size_t> & dims, bool linear_head)
: linear_head_(linear_head), out_features_(dims.empty() ? 0 : dims.back())
{
  if (dims.size() < 2) {
    throw archetype::SceneException(
      archetype::SceneError_t::INVALID_CONFIG, "Mlp requires at least input and output widths.");
  }
  for (size_t i = 0; i + 1 < dims.size(); ++i) {
    linears_.emplace_back(dims[i], dims[i + 1]);
    const bool is_head = linear_head_ && i + 2 == dims.size();
    if (!is_head) {
      norms_.emplace_back(dims[i + 1]);
    }
  }
}

Matrix Mlp::forward(const Matrix & x) const
{
  Matrix output = x;
  for (size_t i = 0; i < linears_.size(); ++i) {
    output = linears_[i].forward(output);
    if (i < norms_.size()) {
      output = norms_[i].forward(output);
      relu_inplace(output);
    }
  }
  return output;
}

void Mlp::collect_parameters(const std::string & prefix, ParameterList & params)
{
  // Sequential indices: (Linear, LayerNorm, ReLU) * n [+ Linear]
  for (size_t i = 0; i < linears_.size(); ++i) {
    linears_[i].collect_parameters(join_name(prefix, std::to_string(3 * i)), params);
    if (i < norms_.size()) {
      norms_[i].collect_parameters(join_name(prefix, std::to_string(3 * i + 1)), params);
    }
  }
}
}  // namespace autoware::scene_prediction::nn
