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
#include "autoware/scene_prediction/utils/param_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace autoware::scene_prediction::test
{
using autoware::scene_prediction::archetype::ParamOut;
using autoware::scene_prediction::archetype::SceneError_t;
using autoware::scene_prediction::archetype::SceneException;
using autoware::scene_prediction::utils::json;
using autoware::scene_prediction::utils::load_model_config;
using autoware::scene_prediction::utils::to_model_config;

namespace
{
json make_params()
{
  return json{
    {"in_actor", 3},      {"in_lane", 10},        {"n_fpn_scale", 2},    {"d_actor", 16},
    {"d_lane", 16},       {"d_embed", 16},        {"d_rpe_in", 5},       {"d_rpe", 8},
    {"dropout", 0.1},     {"update_edge", false}, {"n_scene_head", 2},   {"n_scene_layer", 1},
    {"d_tgt_rpe", 20},    {"param_out", "none"},  {"g_pred_len", 12},    {"g_num_modes", 3},
  };
}

SceneError_t error_kind(const json & params)
{
  try {
    to_model_config(params);
  } catch (const SceneException & e) {
    return e.kind();
  }
  return SceneError_t::UNKNOWN;
}
}  // namespace

TEST(TestParamLoader, ConvertJson)
{
  const auto config = to_model_config(make_params());

  EXPECT_EQ(config.in_actor, 3u);
  EXPECT_EQ(config.n_fpn_scale, 2u);
  EXPECT_EQ(config.d_embed, 16u);
  EXPECT_EQ(config.d_rpe, 8u);
  EXPECT_DOUBLE_EQ(config.dropout, 0.1);
  EXPECT_FALSE(config.update_edge);
  EXPECT_EQ(config.d_tgt_rpe, 20u);
  EXPECT_EQ(config.param_out, ParamOut::NONE);
  EXPECT_EQ(config.g_pred_len, 12u);
  EXPECT_EQ(config.g_num_modes, 3u);
}

TEST(TestParamLoader, MissingKeyThrows)
{
  auto params = make_params();
  params.erase("d_rpe");
  EXPECT_EQ(error_kind(params), SceneError_t::INVALID_CONFIG);
}

TEST(TestParamLoader, IllTypedValueThrows)
{
  auto params = make_params();
  params["update_edge"] = "yes";
  EXPECT_EQ(error_kind(params), SceneError_t::INVALID_CONFIG);
}

TEST(TestParamLoader, UnsupportedParameterizationThrows)
{
  auto params = make_params();
  params["param_out"] = "spline";
  EXPECT_EQ(error_kind(params), SceneError_t::INVALID_CONFIG);
}

TEST(TestParamLoader, InconsistentValueThrows)
{
  auto params = make_params();
  params["n_scene_head"] = 3;
  EXPECT_EQ(error_kind(params), SceneError_t::INVALID_CONFIG);
}

TEST(TestParamLoader, LoadDefaultFile)
{
  const auto config =
    load_model_config(std::string(SCENE_PREDICTION_CONFIG_DIR) + "/scene_pred_net.param.json");

  EXPECT_EQ(config.d_embed, 128u);
  EXPECT_EQ(config.n_scene_layer, 6u);
  EXPECT_EQ(config.param_out, ParamOut::BEZIER);
}

TEST(TestParamLoader, LoadWrittenFile)
{
  const std::string path = ::testing::TempDir() + "scene_pred_net_test.param.json";
  {
    std::ofstream file(path);
    file << make_params().dump(2);
  }

  const auto config = load_model_config(path);
  EXPECT_EQ(config.d_actor, 16u);
  std::remove(path.c_str());
}

TEST(TestParamLoader, MissingFileThrows)
{
  try {
    load_model_config("/nonexistent/scene_pred_net.param.json");
    FAIL() << "Expected SceneException";
  } catch (const SceneException & e) {
    EXPECT_EQ(e.kind(), SceneError_t::IO);
  }
}

TEST(TestParamLoader, BrokenFileThrows)
{
  const std::string path = ::testing::TempDir() + "scene_pred_net_broken.param.json";
  {
    std::ofstream file(path);
    file << "{\"in_actor\": ";
  }

  try {
    load_model_config(path);
    FAIL() << "Expected SceneException";
  } catch (const SceneException & e) {
    EXPECT_EQ(e.kind(), SceneError_t::INVALID_CONFIG);
  }
  std::remove(path.c_str());
}
}  // namespace autoware::scene_prediction::test
