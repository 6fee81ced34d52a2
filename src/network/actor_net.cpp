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

#include "autoware/scene_prediction/network/actor_net.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/constants.hpp"
#include "autoware/scene_prediction/nn/functional.hpp"

#include <numeric>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace autoware::scene_prediction::network
{
namespace
{
size_t num_group(size_t num_channel)
{
  return std::gcd(constants::ACTOR_NUM_GROUP, num_channel);
}
}  // namespace

Conv1d::Conv1d(
  size_t in_channels, size_t out_channels, size_t kernel_size, size_t stride, bool act)
: conv_(in_channels, out_channels, kernel_size, stride, (kernel_size - 1) / 2),
  norm_(num_group(out_channels), out_channels),
  act_(act)
{
}

Matrix Conv1d::forward(const Matrix & x) const
{
  Matrix output = norm_.forward(conv_.forward(x));
  if (act_) {
    nn::relu_inplace(output);
  }
  return output;
}

void Conv1d::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  conv_.collect_parameters(nn::join_name(prefix, "conv"), params);
  norm_.collect_parameters(nn::join_name(prefix, "norm"), params);
}

Res1d::Res1d(size_t in_channels, size_t out_channels, size_t stride)
: conv1_(in_channels, out_channels, 3, stride, 1),
  bn1_(num_group(out_channels), out_channels),
  conv2_(out_channels, out_channels, 3, 1, 1),
  bn2_(num_group(out_channels), out_channels)
{
  if (stride != 1 || in_channels != out_channels) {
    downsample_conv_.emplace(in_channels, out_channels, 1, stride, 0);
    downsample_norm_.emplace(num_group(out_channels), out_channels);
  }
}

Matrix Res1d::forward(const Matrix & x) const
{
  Matrix output = bn1_.forward(conv1_.forward(x));
  nn::relu_inplace(output);
  output = bn2_.forward(conv2_.forward(output));

  if (downsample_conv_) {
    output += downsample_norm_->forward(downsample_conv_->forward(x));
  } else {
    output += x;
  }
  nn::relu_inplace(output);
  return output;
}

void Res1d::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  conv1_.collect_parameters(nn::join_name(prefix, "conv1"), params);
  bn1_.collect_parameters(nn::join_name(prefix, "bn1"), params);
  conv2_.collect_parameters(nn::join_name(prefix, "conv2"), params);
  bn2_.collect_parameters(nn::join_name(prefix, "bn2"), params);
  if (downsample_conv_) {
    downsample_conv_->collect_parameters(nn::join_name(prefix, "downsample.0"), params);
    downsample_norm_->collect_parameters(nn::join_name(prefix, "downsample.1"), params);
  }
}

ActorNet::ActorNet(size_t in_channels, size_t hidden_size, size_t num_scale)
: in_channels_(in_channels), hidden_size_(hidden_size), output_(hidden_size, hidden_size)
{
  size_t num_in = in_channels;
  for (size_t s = 0; s < num_scale; ++s) {
    const size_t num_out = size_t{1} << (constants::ACTOR_BASE_CHANNEL_EXP + s);
    std::vector<Res1d> group;
    group.emplace_back(num_in, num_out, s == 0 ? 1 : 2);
    for (size_t j = 1; j < constants::ACTOR_BLOCKS_PER_STAGE; ++j) {
      group.emplace_back(num_out, num_out);
    }
    groups_.emplace_back(std::move(group));
    lateral_.emplace_back(num_out, hidden_size, 3, 1, false);
    num_in = num_out;
  }
}

Matrix ActorNet::encode(const Matrix & history) const
{
  std::vector<Matrix> outputs;
  outputs.reserve(groups_.size());

  Matrix out = history;
  for (const auto & group : groups_) {
    for (const auto & block : group) {
      out = block.forward(out);
    }
    outputs.push_back(out);
  }

  out = lateral_.back().forward(outputs.back());
  for (size_t i = outputs.size() - 1; i-- > 0;) {
    out = nn::upsample_linear2x(out);
    const Matrix lateral = lateral_[i].forward(outputs[i]);
    if (out.cols() != lateral.cols()) {
      std::ostringstream msg;
      msg << "Upsampled length " << out.cols() << " is different from the stage " << i
          << " length " << lateral.cols();
      throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
    }
    out += lateral;
  }

  out = output_.forward(out);
  return out.col(out.cols() - 1).transpose();
}

Matrix ActorNet::forward(const ActorTensor & actors) const
{
  if (actors.num_attribute != in_channels_) {
    std::ostringstream msg;
    msg << "Invalid number of actor attributes: " << actors.num_attribute
        << " != " << in_channels_;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }

  Matrix output(
    static_cast<Eigen::Index>(actors.num_actor), static_cast<Eigen::Index>(hidden_size_));
  for (size_t n = 0; n < actors.num_actor; ++n) {
    output.row(static_cast<Eigen::Index>(n)) = encode(actors.actor(n));
  }
  return output;
}

void ActorNet::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  for (size_t i = 0; i < groups_.size(); ++i) {
    for (size_t j = 0; j < groups_[i].size(); ++j) {
      groups_[i][j].collect_parameters(
        nn::join_name(prefix, "groups." + std::to_string(i) + "." + std::to_string(j)), params);
    }
  }
  for (size_t i = 0; i < lateral_.size(); ++i) {
    lateral_[i].collect_parameters(nn::join_name(prefix, "lateral." + std::to_string(i)), params);
  }
  output_.collect_parameters(nn::join_name(prefix, "output"), params);
}
}  // namespace autoware::scene_prediction::network
