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

#include "autoware/scene_prediction/processing/preprocessor.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/archetype/tensor.hpp"

#include <functional>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace autoware::scene_prediction::processing
{
namespace
{
void throw_shape_mismatch(const std::string & msg)
{
  throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg);
}

void flatten_recursive(
  const nlohmann::json & value, size_t level, NestedArray & output, const std::string & key)
{
  if (level == output.shape.size()) {
    if (!value.is_number()) {
      throw archetype::SceneException(
        archetype::SceneError_t::INVALID_VALUE, "Non-numeric value in " + key);
    }
    output.data.push_back(value.get<float>());
    return;
  }

  if (!value.is_array()) {
    const auto depth = std::to_string(output.shape.size());
    throw_shape_mismatch(key + " must be a nested array of depth " + depth);
  }
  if (value.size() != output.shape.at(level)) {
    std::ostringstream msg;
    msg << key << " is ragged at level " << level << ": " << value.size()
        << " != " << output.shape.at(level);
    throw_shape_mismatch(msg.str());
  }
  for (const auto & item : value) {
    flatten_recursive(item, level + 1, output, key);
  }
}

const nlohmann::json & get_required(const nlohmann::json & batch, const std::string & key)
{
  if (!batch.is_object() || !batch.contains(key)) {
    throw archetype::SceneException(
      archetype::SceneError_t::INVALID_VALUE, "Missing key in batch: " + key);
  }
  return batch.at(key);
}
}  // namespace

NestedArray flatten_array(const nlohmann::json & value, size_t num_dim, const std::string & key)
{
  NestedArray output;

  // the shape is taken from the first element of each level
  const nlohmann::json * cursor = &value;
  for (size_t level = 0; level < num_dim; ++level) {
    if (!cursor->is_array()) {
      throw_shape_mismatch(key + " must be a nested array of depth " + std::to_string(num_dim));
    }
    output.shape.push_back(cursor->size());
    if (cursor->empty()) {
      break;
    }
    cursor = &cursor->front();
  }

  if (output.shape.size() < num_dim) {
    // empty on the outer level, inner sizes are unknown
    output.shape.resize(num_dim, 0);
    return output;
  }

  output.data.reserve(std::accumulate(
    output.shape.begin(), output.shape.end(), size_t{1}, std::multiplies<size_t>()));
  flatten_recursive(value, 0, output, key);
  return output;
}

archetype::RaggedIndex to_ragged_index(const nlohmann::json & value, const std::string & key)
{
  if (!value.is_array()) {
    throw_shape_mismatch(key + " must be an array of index arrays.");
  }

  std::vector<size_t> offsets{0};
  for (size_t g = 0; g < value.size(); ++g) {
    const auto & group = value.at(g);
    if (!group.is_array()) {
      throw_shape_mismatch(key + " must be an array of index arrays.");
    }
    size_t expected = offsets.back();
    for (const auto & index : group) {
      if (!index.is_number_integer() || index.get<long long>() < 0) {
        throw archetype::SceneException(
          archetype::SceneError_t::INVALID_VALUE, "Invalid index in " + key);
      }
      if (index.get<size_t>() != expected) {
        std::ostringstream msg;
        msg << key << " must be contiguous: group " << g << " expects " << expected
            << ", but got " << index.get<size_t>();
        throw_shape_mismatch(msg.str());
      }
      ++expected;
    }
    offsets.push_back(expected);
  }
  return archetype::RaggedIndex::from_offsets(offsets);
}

PreProcessor::PreProcessor(const archetype::ModelConfig & config)
: in_actor_(config.in_actor),
  in_lane_(config.in_lane),
  d_rpe_in_(config.d_rpe_in),
  d_tgt_rpe_(config.d_tgt_rpe)
{
}

archetype::SceneBatch PreProcessor::process(const nlohmann::json & batch) const
{
  auto actors = flatten_array(get_required(batch, "ACTORS"), 3, "ACTORS");
  if (actors.shape[0] == 0) {
    actors.shape = {0, in_actor_, 1};
  }
  archetype::ActorTensor actor_tensor(
    actors.data, actors.shape[0], actors.shape[1], actors.shape[2]);

  auto lanes = flatten_array(get_required(batch, "LANES"), 3, "LANES");
  if (lanes.shape[0] == 0) {
    lanes.shape = {0, 1, in_lane_};
  }
  archetype::LaneTensor lane_tensor(lanes.data, lanes.shape[0], lanes.shape[1], lanes.shape[2]);

  auto actor_idcs = to_ragged_index(get_required(batch, "ACTOR_IDCS"), "ACTOR_IDCS");
  auto lane_idcs = to_ragged_index(get_required(batch, "LANE_IDCS"), "LANE_IDCS");
  if (actor_idcs.total() != actor_tensor.num_actor) {
    std::ostringstream msg;
    msg << "ACTOR_IDCS cover " << actor_idcs.total() << " actors, but got "
        << actor_tensor.num_actor;
    throw_shape_mismatch(msg.str());
  }
  if (lane_idcs.total() != lane_tensor.num_segment) {
    std::ostringstream msg;
    msg << "LANE_IDCS cover " << lane_idcs.total() << " lanes, but got "
        << lane_tensor.num_segment;
    throw_shape_mismatch(msg.str());
  }

  const auto & rpe_list = get_required(batch, "RPE");
  if (!rpe_list.is_array()) {
    throw_shape_mismatch("RPE must be an array of objects.");
  }
  std::vector<archetype::RpeTensor> rpes;
  rpes.reserve(rpe_list.size());
  for (size_t b = 0; b < rpe_list.size(); ++b) {
    const auto key = "RPE[" + std::to_string(b) + "].scene";
    auto rpe = flatten_array(get_required(rpe_list.at(b), "scene"), 3, key);
    if (rpe.shape[0] == 0) {
      rpe.shape = {d_rpe_in_, 0, 0};
    }
    if (rpe.shape[1] != rpe.shape[2]) {
      throw_shape_mismatch(key + " must be square over tokens.");
    }
    rpes.emplace_back(rpe.data, rpe.shape[0], rpe.shape[1]);
  }

  auto tgt_nodes = flatten_array(get_required(batch, "TGT_NODES"), 3, "TGT_NODES");
  if (tgt_nodes.shape[0] == 0) {
    tgt_nodes.shape = {0, 1, in_lane_};
  }
  archetype::LaneTensor tgt_node_tensor(
    tgt_nodes.data, tgt_nodes.shape[0], tgt_nodes.shape[1], tgt_nodes.shape[2]);

  auto tgt_rpe = flatten_array(get_required(batch, "TGT_RPE"), 2, "TGT_RPE");
  if (tgt_rpe.shape[0] == 0) {
    tgt_rpe.shape = {0, d_tgt_rpe_};
  }
  archetype::Matrix tgt_rpe_matrix = archetype::ConstMatrixMap(
    tgt_rpe.data.data(), static_cast<Eigen::Index>(tgt_rpe.shape[0]),
    static_cast<Eigen::Index>(tgt_rpe.shape[1]));

  return archetype::SceneBatch(
    std::move(actor_tensor), std::move(actor_idcs), std::move(lane_tensor), std::move(lane_idcs),
    std::move(rpes), std::move(tgt_node_tensor), std::move(tgt_rpe_matrix));
}
}  // namespace autoware::scene_prediction::processing
