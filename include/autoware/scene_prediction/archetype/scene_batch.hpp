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

#ifndef AUTOWARE__SCENE_PREDICTION__ARCHETYPE__SCENE_BATCH_HPP_
#define AUTOWARE__SCENE_PREDICTION__ARCHETYPE__SCENE_BATCH_HPP_

#include "autoware/scene_prediction/archetype/ragged_index.hpp"
#include "autoware/scene_prediction/archetype/tensor.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace autoware::scene_prediction::archetype
{
/**
 * @brief A batch of scenes concatenated along the actor and lane axes.
 */
struct SceneBatch
{
  SceneBatch(
    ActorTensor _actors, RaggedIndex _actor_idcs, LaneTensor _lanes, RaggedIndex _lane_idcs,
    std::vector<RpeTensor> _rpes, LaneTensor _tgt_nodes, Matrix _tgt_rpes)
  : actors(std::move(_actors)),
    actor_idcs(std::move(_actor_idcs)),
    lanes(std::move(_lanes)),
    lane_idcs(std::move(_lane_idcs)),
    rpes(std::move(_rpes)),
    tgt_nodes(std::move(_tgt_nodes)),
    tgt_rpes(std::move(_tgt_rpes))
  {
  }

  /**
   * @brief Return the number of scenes.
   */
  size_t num_scene() const noexcept { return actor_idcs.num_group(); }

  ActorTensor actors;            //!< Actor histories, (ΣA, C, T).
  RaggedIndex actor_idcs;        //!< Actor groups for each scene.
  LaneTensor lanes;              //!< Lane segments, (ΣL, P, F).
  RaggedIndex lane_idcs;         //!< Lane groups for each scene.
  std::vector<RpeTensor> rpes;   //!< Scene RPE, (F_rpe, N, N) for each scene.
  LaneTensor tgt_nodes;          //!< Target nodes, (1 or ΣT, P, F).
  Matrix tgt_rpes;               //!< Target RPE, (ΣT, d_tgt_rpe).
};

/**
 * @brief Auxiliary outputs of a single scene.
 */
struct AuxiliaryOutput
{
  ModeTensor velocity;                   //!< Position velocity, (A, K, S, 2).
  ModeTensor variance_velocity;          //!< Log-variance velocity, (A, K, S, 2).
  std::optional<ModeTensor> parameters;  //!< Raw basis parameters, (A, K, n_ctrl, 5).
};
}  // namespace autoware::scene_prediction::archetype
#endif  // AUTOWARE__SCENE_PREDICTION__ARCHETYPE__SCENE_BATCH_HPP_
