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

#include "autoware/scene_prediction/archetype/ragged_index.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"

#include <sstream>
#include <vector>

namespace autoware::scene_prediction::archetype
{
RaggedIndex::RaggedIndex(const std::vector<size_t> & group_sizes) : offsets_{0}
{
  offsets_.reserve(group_sizes.size() + 1);
  for (const auto & size : group_sizes) {
    offsets_.emplace_back(offsets_.back() + size);
  }
}

RaggedIndex RaggedIndex::from_offsets(const std::vector<size_t> & offsets)
{
  if (offsets.empty() || offsets.front() != 0) {
    throw SceneException(SceneError_t::SHAPE_MISMATCH, "Ragged offsets must start with 0.");
  }

  std::vector<size_t> group_sizes;
  group_sizes.reserve(offsets.size() - 1);
  for (size_t i = 1; i < offsets.size(); ++i) {
    if (offsets[i] < offsets[i - 1]) {
      std::ostringstream msg;
      msg << "Ragged offsets must be non-decreasing: " << offsets[i - 1] << " > " << offsets[i];
      throw SceneException(SceneError_t::SHAPE_MISMATCH, msg.str());
    }
    group_sizes.emplace_back(offsets[i] - offsets[i - 1]);
  }
  return RaggedIndex(group_sizes);
}
}  // namespace autoware::scene_prediction::archetype
