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
#include "autoware/scene_prediction/nn/functional.hpp"

#include <gtest/gtest.h>

namespace autoware::scene_prediction::test
{
using autoware::scene_prediction::archetype::Matrix;
using autoware::scene_prediction::archetype::SceneException;
namespace nn = autoware::scene_prediction::nn;

TEST(TestFunctional, ReluClampsNegative)
{
  Matrix x(1, 3);
  x << -1.0f, 0.0f, 2.5f;
  nn::relu_inplace(x);
  EXPECT_FLOAT_EQ(x(0, 0), 0.0f);
  EXPECT_FLOAT_EQ(x(0, 1), 0.0f);
  EXPECT_FLOAT_EQ(x(0, 2), 2.5f);
}

TEST(TestFunctional, SoftmaxRowsSumToOne)
{
  Matrix x(2, 3);
  x << 1.0f, 2.0f, 3.0f, 1000.0f, 1000.0f, 1000.0f;

  const auto y = nn::softmax(x);

  EXPECT_NEAR(y.row(0).sum(), 1.0f, 1e-6f);
  EXPECT_NEAR(y.row(1).sum(), 1.0f, 1e-6f);
  EXPECT_GT(y(0, 2), y(0, 1));
  EXPECT_NEAR(y(1, 0), 1.0f / 3.0f, 1e-6f);
}

TEST(TestFunctional, SoftmaxTemperatureSharpens)
{
  Matrix x(1, 2);
  x << 0.0f, 1.0f;

  const auto y1 = nn::softmax(x, 1.0f);
  const auto y2 = nn::softmax(x, 4.0f);
  EXPECT_GT(y2(0, 1), y1(0, 1));
}

TEST(TestFunctional, GroupMaxPool)
{
  Matrix x(4, 2);
  x << 1.0f, 5.0f, 3.0f, 2.0f, -1.0f, -4.0f, -2.0f, -3.0f;

  const auto y = nn::group_max_pool(x, 2);

  ASSERT_EQ(y.rows(), 2);
  EXPECT_FLOAT_EQ(y(0, 0), 3.0f);
  EXPECT_FLOAT_EQ(y(0, 1), 5.0f);
  EXPECT_FLOAT_EQ(y(1, 0), -1.0f);
  EXPECT_FLOAT_EQ(y(1, 1), -3.0f);
}

TEST(TestFunctional, GroupMaxPoolIndivisibleThrows)
{
  EXPECT_THROW(nn::group_max_pool(Matrix::Zero(3, 2), 2), SceneException);
  EXPECT_THROW(nn::group_max_pool(Matrix::Zero(3, 2), 0), SceneException);
}

TEST(TestFunctional, UpsampleLinearHalfPixel)
{
  Matrix x(1, 2);
  x << 0.0f, 4.0f;

  const auto y = nn::upsample_linear2x(x);

  // sources are clamped at both ends and interpolated inside
  ASSERT_EQ(y.cols(), 4);
  EXPECT_FLOAT_EQ(y(0, 0), 0.0f);
  EXPECT_FLOAT_EQ(y(0, 1), 1.0f);
  EXPECT_FLOAT_EQ(y(0, 2), 3.0f);
  EXPECT_FLOAT_EQ(y(0, 3), 4.0f);
}

TEST(TestFunctional, UpsampleSingleStep)
{
  Matrix x(2, 1);
  x << 2.0f, -1.0f;

  const auto y = nn::upsample_linear2x(x);

  ASSERT_EQ(y.cols(), 2);
  EXPECT_FLOAT_EQ(y(0, 0), 2.0f);
  EXPECT_FLOAT_EQ(y(0, 1), 2.0f);
  EXPECT_FLOAT_EQ(y(1, 1), -1.0f);
}

TEST(TestFunctional, GradientOfQuadratic)
{
  // x = t^2 sampled at t = 0, 1, 2, 3
  Matrix x(4, 1);
  x << 0.0f, 1.0f, 4.0f, 9.0f;

  const auto dx = nn::gradient(x, 1.0f);

  EXPECT_FLOAT_EQ(dx(0, 0), 1.0f);
  EXPECT_FLOAT_EQ(dx(1, 0), 2.0f);
  EXPECT_FLOAT_EQ(dx(2, 0), 4.0f);
  EXPECT_FLOAT_EQ(dx(3, 0), 5.0f);
}

TEST(TestFunctional, GradientRespectsSpacing)
{
  Matrix x(2, 2);
  x << 0.0f, 1.0f, 1.0f, 3.0f;

  const auto dx = nn::gradient(x, 0.1f);

  EXPECT_NEAR(dx(0, 0), 10.0f, 1e-4f);
  EXPECT_NEAR(dx(1, 1), 20.0f, 1e-4f);
}

TEST(TestFunctional, GradientRequiresTwoSteps)
{
  EXPECT_THROW(nn::gradient(Matrix::Zero(1, 2), 0.1f), SceneException);
}
}  // namespace autoware::scene_prediction::test
