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
#include "autoware/scene_prediction/constants.hpp"

#include <sstream>
#include <string>

namespace autoware::scene_prediction::archetype
{
ParamOut to_param_out(const std::string & name)
{
  if (name == "bezier") {
    return ParamOut::BEZIER;
  } else if (name == "monomial") {
    return ParamOut::MONOMIAL;
  } else if (name == "none") {
    return ParamOut::NONE;
  } else {
    throw SceneException(SceneError_t::INVALID_CONFIG, "Unsupported parameterization: " + name);
  }
}

std::string to_string(ParamOut param_out)
{
  switch (param_out) {
    case ParamOut::BEZIER:
      return "bezier";
    case ParamOut::MONOMIAL:
      return "monomial";
    case ParamOut::NONE:
      return "none";
    default:
      throw SceneException(SceneError_t::INVALID_CONFIG, "Unsupported parameterization.");
  }
}

void ModelConfig::validate() const
{
  auto fail = [](const std::string & msg) {
    throw SceneException(SceneError_t::INVALID_CONFIG, msg);
  };

  if (
    param_out != ParamOut::BEZIER && param_out != ParamOut::MONOMIAL &&
    param_out != ParamOut::NONE) {
    fail("Unsupported parameterization.");
  }

  if (
    in_actor == 0 || in_lane == 0 || d_actor == 0 || d_lane == 0 || d_embed == 0 ||
    d_rpe_in == 0 || d_rpe == 0 || d_tgt_rpe == 0) {
    fail("Input and embedding widths must be positive.");
  }
  if (n_fpn_scale == 0) {
    fail("n_fpn_scale must be positive.");
  }
  if (n_scene_head == 0 || n_scene_layer == 0) {
    fail("n_scene_head and n_scene_layer must be positive.");
  }
  if (d_embed % n_scene_head != 0) {
    std::ostringstream msg;
    msg << "d_embed must be divisible by n_scene_head: " << d_embed << " % " << n_scene_head
        << " != 0";
    fail(msg.str());
  }
  if (d_embed % constants::MODE_ATTENTION_HEAD != 0) {
    std::ostringstream msg;
    msg << "d_embed must be divisible by the number of mode attention heads: " << d_embed
        << " % " << constants::MODE_ATTENTION_HEAD << " != 0";
    fail(msg.str());
  }
  if (d_lane != d_embed) {
    std::ostringstream msg;
    msg << "d_lane must be equal to d_embed for target encoding: " << d_lane
        << " != " << d_embed;
    fail(msg.str());
  }
  if (g_pred_len < 2) {
    fail("g_pred_len must be at least 2.");
  }
  if (g_num_modes == 0) {
    fail("g_num_modes must be positive.");
  }
  if (dropout < 0.0 || dropout >= 1.0) {
    fail("dropout must be in [0, 1).");
  }
}
}  // namespace autoware::scene_prediction::archetype
