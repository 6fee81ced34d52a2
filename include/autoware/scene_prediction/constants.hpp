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

#ifndef AUTOWARE__SCENE_PREDICTION__CONSTANTS_HPP_
#define AUTOWARE__SCENE_PREDICTION__CONSTANTS_HPP_

#include <cstddef>

namespace autoware::scene_prediction::constants
{

// Time constants
constexpr float PREDICTION_TIME_STEP_S = 0.1f;

// Actor pyramid
constexpr size_t ACTOR_BASE_CHANNEL_EXP = 5;  // first stage has 2^5 = 32 channels
constexpr size_t ACTOR_BLOCKS_PER_STAGE = 2;
constexpr size_t ACTOR_NUM_GROUP = 1;

// Decoder
constexpr size_t BASIS_ORDER = 7;
constexpr size_t MODE_ATTENTION_HEAD = 4;
constexpr size_t MODE_ATTENTION_LAYER = 2;
constexpr size_t MODE_FEEDFORWARD_RATIO = 12;
constexpr size_t TRAJECTORY_PARAM_DIM = 5;  // (x, y, log_var_x, log_var_y, log_var_extra)
constexpr size_t TRAJECTORY_OUTPUT_DIM = 4;  // (x, y, var_x, var_y)
constexpr float SCORE_TEMPERATURE = 1.0f;

// Normalization
constexpr float NORM_EPSILON = 1e-5f;

}  // namespace autoware::scene_prediction::constants

#endif  // AUTOWARE__SCENE_PREDICTION__CONSTANTS_HPP_
