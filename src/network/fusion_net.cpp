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

#include "autoware/scene_prediction/network/fusion_net.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace autoware::scene_prediction::network
{
namespace
{
void throw_shape_mismatch(const std::string & msg)
{
  throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg);
}
}  // namespace

FusionNet::FusionNet(const archetype::ModelConfig & config)
: d_embed_(config.d_embed),
  d_rpe_in_(config.d_rpe_in),
  d_rpe_(config.d_rpe),
  proj_actor_(std::vector<size_t>{config.d_actor, config.d_embed}),
  proj_lane_(std::vector<size_t>{config.d_lane, config.d_embed}),
  proj_rpe_scene_(std::vector<size_t>{config.d_rpe_in, config.d_rpe}),
  fuse_scene_(
    config.d_embed, config.d_rpe, config.n_scene_head, config.n_scene_layer, config.update_edge)
{
}

Matrix FusionNet::build_edge(const RpeTensor & rpe) const
{
  const auto num_token = static_cast<Eigen::Index>(rpe.num_token);
  const Eigen::Index num_token_with_cls = num_token + 1;

  // row i*n + j holds the relation from token j to token i
  Matrix raw(num_token * num_token, static_cast<Eigen::Index>(d_rpe_in_));
  for (Eigen::Index i = 0; i < num_token; ++i) {
    for (Eigen::Index j = 0; j < num_token; ++j) {
      for (size_t f = 0; f < d_rpe_in_; ++f) {
        raw(i * num_token + j, static_cast<Eigen::Index>(f)) = rpe.at(f, j, i);
      }
    }
  }
  const Matrix projected = proj_rpe_scene_.forward(raw);

  Matrix edge =
    Matrix::Zero(num_token_with_cls * num_token_with_cls, static_cast<Eigen::Index>(d_rpe_));
  for (Eigen::Index i = 0; i < num_token; ++i) {
    edge.middleRows(i * num_token_with_cls, num_token) =
      projected.middleRows(i * num_token, num_token);
  }
  return edge;
}

FusionNet::output_type FusionNet::forward(
  const Matrix & actors, const RaggedIndex & actor_idcs, const Matrix & lanes,
  const RaggedIndex & lane_idcs, const std::vector<RpeTensor> & rpes) const
{
  const size_t num_scene = actor_idcs.num_group();
  if (lane_idcs.num_group() != num_scene || rpes.size() != num_scene) {
    std::ostringstream msg;
    msg << "Number of scenes is inconsistent: actors=" << num_scene
        << ", lanes=" << lane_idcs.num_group() << ", rpes=" << rpes.size();
    throw_shape_mismatch(msg.str());
  }
  if (actor_idcs.total() != static_cast<size_t>(actors.rows())) {
    std::ostringstream msg;
    msg << "Actor indices cover " << actor_idcs.total() << " rows, but got " << actors.rows();
    throw_shape_mismatch(msg.str());
  }
  if (lane_idcs.total() != static_cast<size_t>(lanes.rows())) {
    std::ostringstream msg;
    msg << "Lane indices cover " << lane_idcs.total() << " rows, but got " << lanes.rows();
    throw_shape_mismatch(msg.str());
  }

  const Matrix actor_embed = proj_actor_.forward(actors);
  const Matrix lane_embed = proj_lane_.forward(lanes);
  const auto d_embed = static_cast<Eigen::Index>(d_embed_);

  Matrix actors_out(actors.rows(), d_embed);
  Matrix lanes_out(lanes.rows(), d_embed);
  Matrix cls_out(static_cast<Eigen::Index>(num_scene), d_embed);

  for (size_t b = 0; b < num_scene; ++b) {
    const auto num_actor = static_cast<Eigen::Index>(actor_idcs.size(b));
    const auto num_lane = static_cast<Eigen::Index>(lane_idcs.size(b));
    const auto actor_offset = static_cast<Eigen::Index>(actor_idcs.offset(b));
    const auto lane_offset = static_cast<Eigen::Index>(lane_idcs.offset(b));
    const auto & rpe = rpes[b];

    if (rpe.num_attribute != d_rpe_in_) {
      std::ostringstream msg;
      msg << "Invalid number of RPE attributes in scene " << b << ": " << rpe.num_attribute
          << " != " << d_rpe_in_;
      throw_shape_mismatch(msg.str());
    }
    if (rpe.num_token != static_cast<size_t>(num_actor + num_lane)) {
      std::ostringstream msg;
      msg << "Invalid number of RPE tokens in scene " << b << ": " << rpe.num_token
          << " != " << num_actor + num_lane;
      throw_shape_mismatch(msg.str());
    }

    // [actors; lanes; CLS]
    Matrix tokens = Matrix::Zero(num_actor + num_lane + 1, d_embed);
    tokens.topRows(num_actor) = actor_embed.middleRows(actor_offset, num_actor);
    tokens.middleRows(num_actor, num_lane) = lane_embed.middleRows(lane_offset, num_lane);

    const Matrix out = fuse_scene_.forward(tokens, build_edge(rpe));

    actors_out.middleRows(actor_offset, num_actor) = out.topRows(num_actor);
    lanes_out.middleRows(lane_offset, num_lane) = out.middleRows(num_actor, num_lane);
    cls_out.row(static_cast<Eigen::Index>(b)) = out.bottomRows(1);
  }
  return {actors_out, lanes_out, cls_out};
}

void FusionNet::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  proj_actor_.collect_parameters(nn::join_name(prefix, "proj_actor"), params);
  proj_lane_.collect_parameters(nn::join_name(prefix, "proj_lane"), params);
  proj_rpe_scene_.collect_parameters(nn::join_name(prefix, "proj_rpe_scene"), params);
  fuse_scene_.collect_parameters(nn::join_name(prefix, "fuse_scene"), params);
}
}  // namespace autoware::scene_prediction::network
