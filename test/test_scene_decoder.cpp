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

#include "autoware/scene_prediction/archetype/config.hpp"
#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/archetype/ragged_index.hpp"
#include "autoware/scene_prediction/network/scene_decoder.hpp"
#include "autoware/scene_prediction/network/trajectory_basis.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <vector>

namespace autoware::scene_prediction::test
{
using autoware::scene_prediction::archetype::Matrix;
using autoware::scene_prediction::archetype::ModelConfig;
using autoware::scene_prediction::archetype::ParamOut;
using autoware::scene_prediction::archetype::RaggedIndex;
using autoware::scene_prediction::archetype::SceneException;
using autoware::scene_prediction::network::MonomialBasis;
using autoware::scene_prediction::network::SceneDecoder;
namespace nn = autoware::scene_prediction::nn;

namespace
{
ModelConfig make_config(ParamOut param_out)
{
  ModelConfig config;
  config.d_actor = 8;
  config.d_lane = 8;
  config.d_embed = 8;
  config.d_tgt_rpe = 11;
  config.n_scene_head = 2;
  config.param_out = param_out;
  config.g_pred_len = 6;
  config.g_num_modes = 3;
  return config;
}
}  // namespace

class SceneDecoderTest : public ::testing::TestWithParam<ParamOut>
{
protected:
  void SetUp() override
  {
    decoder = std::make_unique<SceneDecoder>(make_config(GetParam()));
    nn::ParameterList params;
    decoder->collect_parameters("pred_scene", params);
    nn::initialize_parameters(params, 17);

    // scene 0 has 2 actors, scene 1 has 1 actor
    ctx = Matrix::Random(2, 8);
    actors = Matrix::Random(3, 8);
    tgt_feat = Matrix::Random(1, 8);
    tgt_rpes = Matrix::Random(2, 11);
  }

  std::unique_ptr<SceneDecoder> decoder;
  Matrix ctx;
  Matrix actors;
  RaggedIndex actor_idcs{{2, 1}};
  Matrix tgt_feat;
  Matrix tgt_rpes;
};

TEST_P(SceneDecoderTest, OutputShapes)
{
  const auto [probabilities, trajectories, auxiliaries] =
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, tgt_rpes);

  ASSERT_EQ(probabilities.size(), 2u);
  ASSERT_EQ(trajectories.size(), 2u);
  ASSERT_EQ(auxiliaries.size(), 2u);

  EXPECT_EQ(probabilities[0].rows(), 2);
  EXPECT_EQ(probabilities[0].cols(), 3);
  EXPECT_EQ(probabilities[1].rows(), 1);

  EXPECT_EQ(trajectories[0].num_actor, 2u);
  EXPECT_EQ(trajectories[0].num_mode, 3u);
  EXPECT_EQ(trajectories[0].num_step, 6u);
  EXPECT_EQ(trajectories[0].num_attribute, 4u);
  EXPECT_EQ(trajectories[1].num_actor, 1u);

  EXPECT_EQ(auxiliaries[0].velocity.num_attribute, 2u);
  EXPECT_EQ(auxiliaries[0].variance_velocity.num_step, 6u);
  EXPECT_EQ(auxiliaries[0].parameters.has_value(), GetParam() != ParamOut::NONE);
  if (auxiliaries[0].parameters) {
    EXPECT_EQ(auxiliaries[0].parameters->num_step, 8u);
    EXPECT_EQ(auxiliaries[0].parameters->num_attribute, 5u);
  }
}

TEST_P(SceneDecoderTest, ProbabilitiesAreSharedDistribution)
{
  const auto [probabilities, trajectories, auxiliaries] =
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, tgt_rpes);

  for (const auto & scene : probabilities) {
    for (Eigen::Index a = 0; a < scene.rows(); ++a) {
      EXPECT_NEAR(scene.row(a).sum(), 1.0f, 1e-5f);
      EXPECT_GT(scene.row(a).minCoeff(), 0.0f);
      EXPECT_TRUE(scene.row(a).isApprox(scene.row(0)));
    }
  }
}

TEST_P(SceneDecoderTest, VarianceIsPositive)
{
  const auto [probabilities, trajectories, auxiliaries] =
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, tgt_rpes);

  for (const auto & trajectory : trajectories) {
    for (size_t a = 0; a < trajectory.num_actor; ++a) {
      for (size_t k = 0; k < trajectory.num_mode; ++k) {
        const auto mode = trajectory.mode(a, k);
        EXPECT_GT(mode.rightCols(2).minCoeff(), 0.0f);
        EXPECT_TRUE(mode.allFinite());
      }
    }
  }
}

TEST_P(SceneDecoderTest, TargetOnlyAffectsFirstMode)
{
  const auto [probabilities, trajectories, auxiliaries] =
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, tgt_rpes);

  const Matrix other_rpes = Matrix::Random(2, 11);
  const auto [other_probabilities, other_trajectories, other_auxiliaries] =
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, other_rpes);

  EXPECT_TRUE(probabilities[0].isApprox(other_probabilities[0]));
  EXPECT_FALSE(trajectories[0].mode(0, 0).isApprox(other_trajectories[0].mode(0, 0), 1e-5f));
  EXPECT_TRUE(trajectories[0].mode(0, 1).isApprox(other_trajectories[0].mode(0, 1), 1e-5f));
  EXPECT_TRUE(trajectories[1].mode(0, 2).isApprox(other_trajectories[1].mode(0, 2), 1e-5f));
}

TEST_P(SceneDecoderTest, SingleTargetIsBroadcast)
{
  const auto [probabilities, trajectories, auxiliaries] =
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, tgt_rpes);

  const Matrix per_scene = tgt_feat.replicate(2, 1);
  const auto [other_probabilities, other_trajectories, other_auxiliaries] =
    decoder->forward(ctx, actors, actor_idcs, per_scene, tgt_rpes);

  for (size_t b = 0; b < trajectories.size(); ++b) {
    EXPECT_TRUE(trajectories[b].mode(0, 0).isApprox(other_trajectories[b].mode(0, 0), 1e-5f));
  }
}

TEST_P(SceneDecoderTest, SceneWithoutActor)
{
  const auto [probabilities, trajectories, auxiliaries] =
    decoder->forward(ctx, actors, RaggedIndex({3, 0}), tgt_feat, tgt_rpes);

  EXPECT_EQ(probabilities[1].rows(), 0);
  EXPECT_EQ(trajectories[1].num_actor, 0u);
  EXPECT_EQ(trajectories[1].size(), 0u);
}

TEST_P(SceneDecoderTest, ShapeMismatchThrows)
{
  EXPECT_THROW(
    decoder->forward(Matrix::Random(1, 8), actors, actor_idcs, tgt_feat, tgt_rpes),
    SceneException);
  EXPECT_THROW(
    decoder->forward(ctx, Matrix::Random(2, 8), actor_idcs, tgt_feat, tgt_rpes), SceneException);
  EXPECT_THROW(
    decoder->forward(ctx, actors, actor_idcs, Matrix::Random(3, 8), tgt_rpes), SceneException);
  EXPECT_THROW(
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, Matrix::Random(2, 20)), SceneException);
  EXPECT_THROW(
    decoder->forward(ctx, actors, actor_idcs, tgt_feat, Matrix::Random(1, 11)), SceneException);
}

INSTANTIATE_TEST_SUITE_P(
  AllParameterizations, SceneDecoderTest,
  ::testing::Values(ParamOut::BEZIER, ParamOut::MONOMIAL, ParamOut::NONE));

TEST(TestSceneDecoder, BezierEndpointsFollowControlPoints)
{
  SceneDecoder decoder(make_config(ParamOut::BEZIER));
  nn::ParameterList params;
  decoder.collect_parameters("pred_scene", params);
  nn::initialize_parameters(params, 23);

  const auto [probabilities, trajectories, auxiliaries] = decoder.forward(
    Matrix::Random(1, 8), Matrix::Random(2, 8), RaggedIndex({2}), Matrix::Random(1, 8),
    Matrix::Random(1, 11));

  const auto & trajectory = trajectories[0];
  const auto & raw = *auxiliaries[0].parameters;
  for (size_t a = 0; a < trajectory.num_actor; ++a) {
    for (size_t k = 0; k < trajectory.num_mode; ++k) {
      EXPECT_NEAR(trajectory.at(a, k, 0, 0), raw.at(a, k, 0, 0), 1e-5f);
      EXPECT_NEAR(trajectory.at(a, k, 5, 1), raw.at(a, k, 7, 1), 1e-5f);
      EXPECT_NEAR(trajectory.at(a, k, 0, 2), std::exp(raw.at(a, k, 0, 2)), 1e-4f);
      EXPECT_NEAR(trajectory.at(a, k, 5, 3), std::exp(raw.at(a, k, 7, 3)), 1e-4f);
    }
  }
}

TEST(TestSceneDecoder, MonomialVarianceVelocityFollowsCoefficientDifferences)
{
  const auto config = make_config(ParamOut::MONOMIAL);
  SceneDecoder decoder(config);
  nn::ParameterList params;
  decoder.collect_parameters("pred_scene", params);
  nn::initialize_parameters(params, 31);

  const auto [probabilities, trajectories, auxiliaries] = decoder.forward(
    Matrix::Random(1, 8), Matrix::Random(2, 8), RaggedIndex({2}), Matrix::Random(1, 8),
    Matrix::Random(1, 11));

  const MonomialBasis basis(config.g_pred_len);
  const auto & aux = auxiliaries[0];
  const auto & raw = *aux.parameters;
  const float horizon = static_cast<float>(config.g_pred_len) * 0.1f;
  for (size_t a = 0; a < raw.num_actor; ++a) {
    for (size_t k = 0; k < raw.num_mode; ++k) {
      const Matrix log_var = Matrix(raw.mode(a, k)).middleCols(2, 2);
      const Matrix diff = log_var.bottomRows(7) - log_var.topRows(7);
      const Matrix expected = basis.mat_tp() * diff / horizon;
      EXPECT_TRUE(Matrix(aux.variance_velocity.mode(a, k)).isApprox(expected, 1e-4f));

      const Matrix position = Matrix(raw.mode(a, k)).leftCols(2);
      EXPECT_TRUE(
        Matrix(aux.velocity.mode(a, k)).isApprox(basis.evaluate_velocity(position), 1e-4f));
    }
  }
}

TEST(TestSceneDecoder, ParameterNames)
{
  SceneDecoder decoder(make_config(ParamOut::BEZIER));
  nn::ParameterList params;
  decoder.collect_parameters("pred_scene", params);

  ASSERT_FALSE(params.empty());
  EXPECT_EQ(params.front().name, "pred_scene.actor_proj.0.weight");
  EXPECT_EQ(params.front().shape, (std::vector<size_t>{12, 8}));
  EXPECT_EQ(params.back().name, "pred_scene.reg.6.bias");
  EXPECT_EQ(params.back().shape, (std::vector<size_t>{40}));
}
}  // namespace autoware::scene_prediction::test
