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
#include "autoware/scene_prediction/nn/attention.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace autoware::scene_prediction::test
{
using autoware::scene_prediction::archetype::MaskMatrix;
using autoware::scene_prediction::archetype::Matrix;
using autoware::scene_prediction::archetype::MatrixMap;
using autoware::scene_prediction::archetype::SceneException;
namespace nn = autoware::scene_prediction::nn;

namespace
{
/**
 * @brief Find the parameter with the specified name.
 */
const nn::Parameter & find_parameter(const nn::ParameterList & params, const std::string & name)
{
  for (const auto & param : params) {
    if (param.name == name) {
      return param;
    }
  }
  throw std::runtime_error("Parameter not found: " + name);
}

/**
 * @brief Set zero query/key projections and identity value/output projections.
 *
 * Then every unmasked key gets the same weight and the output is the mean of values.
 */
void set_averaging_weights(nn::MultiheadAttention & attn, Eigen::Index dim)
{
  nn::ParameterList params;
  attn.collect_parameters("attn", params);
  nn::initialize_parameters(params, 0);

  MatrixMap in_proj(find_parameter(params, "attn.in_proj_weight").data, 3 * dim, dim);
  in_proj.setZero();
  in_proj.bottomRows(dim).setIdentity();

  MatrixMap out_proj(find_parameter(params, "attn.out_proj.weight").data, dim, dim);
  out_proj.setIdentity();
  MatrixMap out_bias(find_parameter(params, "attn.out_proj.bias").data, 1, dim);
  out_bias.setZero();
}
}  // namespace

TEST(TestMultiheadAttention, ParameterShapes)
{
  nn::MultiheadAttention attn(8, 2);
  nn::ParameterList params;
  attn.collect_parameters("self_attn", params);

  ASSERT_EQ(params.size(), 4u);
  EXPECT_EQ(params[0].name, "self_attn.in_proj_weight");
  EXPECT_EQ(params[0].shape, (std::vector<size_t>{24, 8}));
  EXPECT_EQ(params[1].name, "self_attn.in_proj_bias");
  EXPECT_EQ(params[2].name, "self_attn.out_proj.weight");
  EXPECT_EQ(params[3].name, "self_attn.out_proj.bias");
}

TEST(TestMultiheadAttention, IndivisibleHeadsThrow)
{
  EXPECT_THROW(nn::MultiheadAttention(6, 4), SceneException);
}

TEST(TestMultiheadAttention, UniformWeightsAverageValues)
{
  nn::MultiheadAttention attn(4, 2);
  set_averaging_weights(attn, 4);

  Matrix query = Matrix::Random(2, 4);
  Matrix key = Matrix::Random(3, 4);
  Matrix value(3, 4);
  value << 1.0f, 2.0f, 3.0f, 4.0f, 3.0f, 2.0f, 1.0f, 0.0f, 2.0f, 2.0f, 2.0f, 2.0f;

  const auto output = attn.forward(query, key, value);

  ASSERT_EQ(output.rows(), 2);
  for (Eigen::Index i = 0; i < output.rows(); ++i) {
    for (Eigen::Index c = 0; c < output.cols(); ++c) {
      EXPECT_NEAR(output(i, c), 2.0f, 1e-5f);
    }
  }
}

TEST(TestMultiheadAttention, MaskedKeysAreIgnored)
{
  nn::MultiheadAttention attn(4, 2);
  set_averaging_weights(attn, 4);

  Matrix query = Matrix::Random(2, 4);
  Matrix value(3, 4);
  value << 1.0f, 1.0f, 1.0f, 1.0f, 3.0f, 3.0f, 3.0f, 3.0f, 100.0f, 100.0f, 100.0f, 100.0f;

  MaskMatrix mask = MaskMatrix::Constant(2, 3, false);
  mask(0, 2) = true;
  mask(1, 0) = true;
  mask(1, 1) = true;
  mask(1, 2) = true;

  const auto output = attn.forward(query, value, value, &mask);

  EXPECT_NEAR(output(0, 0), 2.0f, 1e-5f);
  // a fully masked query gives zeros
  EXPECT_NEAR(output.row(1).cwiseAbs().maxCoeff(), 0.0f, 1e-6f);
}

TEST(TestMultiheadAttention, GroupedMatchesPerQueryForward)
{
  nn::MultiheadAttention attn(8, 4);
  nn::ParameterList params;
  attn.collect_parameters("attn", params);
  nn::initialize_parameters(params, 3);

  const Eigen::Index num_query = 3, group = 2;
  Matrix query = Matrix::Random(num_query, 8);
  Matrix memory = Matrix::Random(num_query * group, 8);

  const auto grouped = attn.forward_grouped(query, memory);

  for (Eigen::Index i = 0; i < num_query; ++i) {
    const Matrix q = query.row(i);
    const Matrix m = memory.middleRows(i * group, group);
    const auto expected = attn.forward(q, m, m);
    EXPECT_TRUE(grouped.row(i).isApprox(expected.row(0), 1e-4f));
  }
}

TEST(TestMultiheadAttention, ShapeErrorsThrow)
{
  nn::MultiheadAttention attn(4, 2);
  EXPECT_THROW(
    attn.forward(Matrix::Zero(1, 4), Matrix::Zero(2, 4), Matrix::Zero(3, 4)), SceneException);
  EXPECT_THROW(
    attn.forward(Matrix::Zero(1, 3), Matrix::Zero(2, 3), Matrix::Zero(2, 3)), SceneException);
  EXPECT_THROW(attn.forward_grouped(Matrix::Zero(2, 4), Matrix::Zero(3, 4)), SceneException);

  MaskMatrix mask = MaskMatrix::Constant(1, 1, false);
  EXPECT_THROW(
    attn.forward(Matrix::Zero(1, 4), Matrix::Zero(2, 4), Matrix::Zero(2, 4), &mask),
    SceneException);
}

TEST(TestTransformerEncoder, ParameterNames)
{
  nn::TransformerEncoder encoder(2, 8, 4, 16);
  nn::ParameterList params;
  encoder.collect_parameters("ctx_sat", params);

  // 4 attention + 4 feed-forward + 4 norm tensors per layer
  ASSERT_EQ(params.size(), 24u);
  EXPECT_EQ(params.front().name, "ctx_sat.layers.0.self_attn.in_proj_weight");
  EXPECT_EQ(params.back().name, "ctx_sat.layers.1.norm2.bias");
  EXPECT_EQ(
    find_parameter(params, "ctx_sat.layers.1.linear1.weight").shape,
    (std::vector<size_t>{16, 8}));
}

TEST(TestTransformerEncoder, PermutationEquivariant)
{
  nn::TransformerEncoder encoder(2, 8, 4, 16);
  nn::ParameterList params;
  encoder.collect_parameters("", params);
  nn::initialize_parameters(params, 11);

  Matrix x = Matrix::Random(3, 8);
  Matrix x_perm(3, 8);
  x_perm.row(0) = x.row(2);
  x_perm.row(1) = x.row(0);
  x_perm.row(2) = x.row(1);

  const auto y = encoder.forward(x);
  const auto y_perm = encoder.forward(x_perm);

  EXPECT_TRUE(y_perm.row(0).isApprox(y.row(2), 1e-4f));
  EXPECT_TRUE(y_perm.row(1).isApprox(y.row(0), 1e-4f));
  EXPECT_TRUE(y_perm.row(2).isApprox(y.row(1), 1e-4f));
}
}  // namespace autoware::scene_prediction::test
