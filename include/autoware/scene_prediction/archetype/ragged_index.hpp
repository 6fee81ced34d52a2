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

#ifndef AUTOWARE__SCENE_PREDICTION__ARCHETYPE__RAGGED_INDEX_HPP_
#define AUTOWARE__SCENE_PREDICTION__ARCHETYPE__RAGGED_INDEX_HPP_

#include <cstddef>
#include <vector>

namespace autoware::scene_prediction::archetype
{
/**
 * @brief Partition of a flat, scene-concatenated axis into contiguous groups.
 *
 * Group `g` covers the rows `[offset(g), offset(g) + size(g))`.
 */
class RaggedIndex
{
public:
  /**
   * @brief Construct an empty RaggedIndex object, which has no group.
   */
  RaggedIndex() : offsets_{0} {}

  /**
   * @brief Construct a new RaggedIndex object from the size of each group.
   *
   * @param group_sizes Number of rows in each group.
   */
  explicit RaggedIndex(const std::vector<size_t> & group_sizes);

  /**
   * @brief Construct a new RaggedIndex object from group boundaries.
   *
   * @param offsets Non-decreasing boundaries starting from 0, the size is the number of groups + 1.
   * @throw SceneException If boundaries are not valid.
   */
  static RaggedIndex from_offsets(const std::vector<size_t> & offsets);

  /**
   * @brief Return the number of groups.
   */
  size_t num_group() const noexcept { return offsets_.size() - 1; }

  /**
   * @brief Return the total number of rows over all groups.
   */
  size_t total() const noexcept { return offsets_.back(); }

  /**
   * @brief Return the first row of the specified group.
   */
  size_t offset(size_t group) const { return offsets_.at(group); }

  /**
   * @brief Return the number of rows in the specified group.
   */
  size_t size(size_t group) const { return offsets_.at(group + 1) - offsets_.at(group); }

  /**
   * @brief Return group boundaries.
   */
  const std::vector<size_t> & offsets() const noexcept { return offsets_; }

private:
  std::vector<size_t> offsets_;  //!< Group boundaries.
};
}  // namespace autoware::scene_prediction::archetype
#endif  // AUTOWARE__SCENE_PREDICTION__ARCHETYPE__RAGGED_INDEX_HPP_
