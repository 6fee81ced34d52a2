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

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/archetype/tensor.hpp"
#include "autoware/scene_prediction/network/lane_net.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace autoware::scene_prediction::test
{
using autoware::scene_prediction::archetype::LaneTensor;
using autoware::scene_prediction::archetype::SceneException;
using autoware::scene_prediction::network::LaneNet;
namespace nn = autoware::scene_prediction::nn;

class LaneNetTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    nn::ParameterList params;
    net.collect_parameters("lane_net", params);
    nn::initialize_parameters(params, 5);

    // 2 segments, 3 points, 4 attributes
    for (size_t i = 0; i < num_segment * num_point * num_attribute; ++i) {
      values.push_back(0.05f * static_cast<float>((i * 5) % 11) - 0.2f);
    }
  }

  static constexpr size_t num_segment = 2;
  static constexpr size_t num_point = 3;
  static constexpr size_t num_attribute = 4;
  static constexpr size_t hidden_size = 8;

  LaneNet net{num_attribute, hidden_size};
  std::vector<float> values;
};

TEST_F(LaneNetTest, OutputShape)
{
  LaneTensor lanes(values, num_segment, num_point, num_attribute);

  const auto output = net.forward(lanes);

  EXPECT_EQ(output.rows(), 2);
  EXPECT_EQ(output.cols(), 8);
  EXPECT_TRUE(output.allFinite());
}

TEST_F(LaneNetTest, InvariantToPointOrder)
{
  LaneTensor lanes(values, num_segment, num_point, num_attribute);

  // reverse the points of the first segment
  std::vector<float> permuted = values;
  for (size_t p = 0; p < num_point; ++p) {
    for (size_t f = 0; f < num_attribute; ++f) {
      permuted[p * num_attribute + f] = values[(num_point - 1 - p) * num_attribute + f];
    }
  }
  LaneTensor permuted_lanes(permuted, num_segment, num_point, num_attribute);

  const auto output = net.forward(lanes);
  const auto permuted_output = net.forward(permuted_lanes);

  EXPECT_TRUE(output.isApprox(permuted_output, 1e-5f));
}

TEST_F(LaneNetTest, SegmentsAreEncodedIndependently)
{
  LaneTensor lanes(values, num_segment, num_point, num_attribute);
  const std::vector<float> second(values.begin() + num_point * num_attribute, values.end());
  LaneTensor single(second, 1, num_point, num_attribute);

  const auto output = net.forward(lanes);
  const auto single_output = net.forward(single);

  EXPECT_TRUE(output.row(1).isApprox(single_output.row(0), 1e-5f));
}

TEST_F(LaneNetTest, NoSegment)
{
  LaneTensor lanes({}, 0, 1, num_attribute);

  const auto output = net.forward(lanes);

  EXPECT_EQ(output.rows(), 0);
  EXPECT_EQ(output.cols(), 8);
}

TEST_F(LaneNetTest, AttributeMismatchThrows)
{
  LaneTensor lanes(std::vector<float>(6, 0.0f), 1, 2, 3);
  EXPECT_THROW(net.forward(lanes), SceneException);
}

TEST_F(LaneNetTest, ParameterNames)
{
  nn::ParameterList params;
  net.collect_parameters("lane_net", params);

  ASSERT_FALSE(params.empty());
  EXPECT_EQ(params.front().name, "lane_net.proj.0.weight");
  EXPECT_EQ(params.front().shape, (std::vector<size_t>{hidden_size, num_attribute}));
  EXPECT_EQ(params.back().name, "lane_net.aggre2.norm.bias");
}
}  // namespace autoware::scene_prediction::test
