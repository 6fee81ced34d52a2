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

#ifndef AUTOWARE__SCENE_PREDICTION__PROCESSING__PREPROCESSOR_HPP_
#define AUTOWARE__SCENE_PREDICTION__PROCESSING__PREPROCESSOR_HPP_

#include "autoware/scene_prediction/archetype/config.hpp"
#include "autoware/scene_prediction/archetype/ragged_index.hpp"
#include "autoware/scene_prediction/archetype/scene_batch.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace autoware::scene_prediction::processing
{
/**
 * @brief Flattened values of a nested JSON array.
 */
struct NestedArray
{
  std::vector<size_t> shape;  //!< Size of each level.
  std::vector<float> data;    //!< Row-major values.
};

/**
 * @brief Flatten a rectangular nested JSON array of numbers.
 *
 * @param value JSON array.
 * @param num_dim Expected number of levels.
 * @param key Name of the value used in error messages.
 * @throw SceneException If the array is ragged, not numeric or has a different depth.
 */
NestedArray flatten_array(const nlohmann::json & value, size_t num_dim, const std::string & key);

/**
 * @brief Convert lists of row indices into a `RaggedIndex`.
 *
 * Each group must be an ascending run of consecutive indices starting where the previous group
 * ended.
 *
 * @param value JSON array of integer arrays.
 * @param key Name of the value used in error messages.
 * @throw SceneException If the indices are not contiguous.
 */
archetype::RaggedIndex to_ragged_index(const nlohmann::json & value, const std::string & key);

/**
 * @brief A class to convert an untyped batch into `SceneBatch`.
 */
class PreProcessor
{
public:
  /**
   * @brief Construct a new PreProcessor object.
   *
   * @param config Model configuration, used to shape empty inputs.
   */
  explicit PreProcessor(const archetype::ModelConfig & config);

  /**
   * @brief Execute preprocessing.
   *
   * @param batch Mapping with `ACTORS`, `ACTOR_IDCS`, `LANES`, `LANE_IDCS`, `RPE`, `TGT_NODES`
   * and `TGT_RPE`.
   * @return archetype::SceneBatch
   * @throw SceneException If a key is missing or the shapes are inconsistent.
   */
  archetype::SceneBatch process(const nlohmann::json & batch) const;

private:
  const size_t in_actor_;   //!< Number of actor attributes.
  const size_t in_lane_;    //!< Number of lane point attributes.
  const size_t d_rpe_in_;   //!< Number of scene RPE attributes.
  const size_t d_tgt_rpe_;  //!< Number of target RPE attributes.
};
}  // namespace autoware::scene_prediction::processing
#endif  // AUTOWARE__SCENE_PREDICTION__PROCESSING__PREPROCESSOR_HPP_
