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

#include "autoware/scene_prediction/network/lane_net.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/nn/functional.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace autoware::scene_prediction::network
{
PointAggregateBlock::PointAggregateBlock(size_t hidden_size, bool aggre_out)
: aggre_out_(aggre_out),
  fc1_(std::vector<size_t>{hidden_size, hidden_size, hidden_size}),
  fc2_(std::vector<size_t>{2 * hidden_size, hidden_size, hidden_size}),
  norm_(hidden_size)
{
}

Matrix PointAggregateBlock::forward(const Matrix & x, size_t num_point) const
{
  const Matrix feature = fc1_.forward(x);
  const Matrix pooled = nn::group_max_pool(feature, num_point);

  const auto point = static_cast<Eigen::Index>(num_point);
  Matrix concat(feature.rows(), 2 * feature.cols());
  concat.leftCols(feature.cols()) = feature;
  for (Eigen::Index n = 0; n < feature.rows(); ++n) {
    concat.row(n).rightCols(feature.cols()) = pooled.row(n / point);
  }

  const Matrix output = norm_.forward(x + fc2_.forward(concat));
  return aggre_out_ ? nn::group_max_pool(output, num_point) : output;
}

void PointAggregateBlock::collect_parameters(
  const std::string & prefix, nn::ParameterList & params)
{
  fc1_.collect_parameters(nn::join_name(prefix, "fc1"), params);
  fc2_.collect_parameters(nn::join_name(prefix, "fc2"), params);
  norm_.collect_parameters(nn::join_name(prefix, "norm"), params);
}

LaneNet::LaneNet(size_t in_size, size_t hidden_size)
: in_size_(in_size),
  hidden_size_(hidden_size),
  proj_(std::vector<size_t>{in_size, hidden_size}),
  aggre1_(hidden_size, false),
  aggre2_(hidden_size, true)
{
}

Matrix LaneNet::forward(const LaneTensor & lanes) const
{
  if (lanes.num_attribute != in_size_) {
    std::ostringstream msg;
    msg << "Invalid number of lane attributes: " << lanes.num_attribute << " != " << in_size_;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  if (lanes.num_segment == 0) {
    return Matrix(0, static_cast<Eigen::Index>(hidden_size_));
  }

  Matrix x = proj_.forward(lanes.points());
  x = aggre1_.forward(x, lanes.num_point);
  return aggre2_.forward(x, lanes.num_point);
}

void LaneNet::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  proj_.collect_parameters(nn::join_name(prefix, "proj"), params);
  aggre1_.collect_parameters(nn::join_name(prefix, "aggre1"), params);
  aggre2_.collect_parameters(nn::join_name(prefix, "aggre2"), params);
}
}  // namespace autoware::scene_prediction::network
