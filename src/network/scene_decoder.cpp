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

#include "autoware/scene_prediction/network/scene_decoder.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/constants.hpp"
#include "autoware/scene_prediction/nn/functional.hpp"

#include <sstream>
#include <string>
#include <utility>
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

SceneDecoder::SceneDecoder(const archetype::ModelConfig & config)
: hidden_size_(config.d_embed),
  num_mode_(config.g_num_modes),
  d_tgt_rpe_(config.d_tgt_rpe),
  actor_proj_(std::vector<size_t>{
    config.d_embed, config.d_embed * config.g_num_modes / 2, config.d_embed * config.g_num_modes}),
  ctx_proj_(std::vector<size_t>{
    config.d_embed, config.d_embed * config.g_num_modes / 2, config.d_embed * config.g_num_modes}),
  ctx_sat_(
    constants::MODE_ATTENTION_LAYER, config.d_embed, constants::MODE_ATTENTION_HEAD,
    config.d_embed * constants::MODE_FEEDFORWARD_RATIO),
  proj_rpe_(std::vector<size_t>{config.d_tgt_rpe, config.d_embed}),
  proj_tgt_(std::vector<size_t>{2 * config.d_embed, config.d_embed, config.d_embed}),
  cls_(std::vector<size_t>{config.d_embed, config.d_embed, config.d_embed, 1}, true),
  basis_(make_trajectory_basis(config.param_out, config.g_pred_len)),
  reg_(
    std::vector<size_t>{
      config.d_embed, config.d_embed, config.d_embed,
      basis_->num_control_point() * constants::TRAJECTORY_PARAM_DIM},
    true)
{
}

Matrix SceneDecoder::to_modes(const Matrix & row) const
{
  return archetype::ConstMatrixMap(
    row.data(), static_cast<Eigen::Index>(num_mode_), static_cast<Eigen::Index>(hidden_size_));
}

SceneDecoder::output_type SceneDecoder::forward(
  const Matrix & ctx, const Matrix & actors, const RaggedIndex & actor_idcs,
  const Matrix & tgt_feat, const Matrix & tgt_rpes) const
{
  const size_t num_scene = actor_idcs.num_group();
  const auto hidden = static_cast<Eigen::Index>(hidden_size_);
  const auto num_mode = static_cast<Eigen::Index>(num_mode_);

  if (static_cast<size_t>(ctx.rows()) != num_scene) {
    std::ostringstream msg;
    msg << "Number of context tokens is different from scenes: " << ctx.rows()
        << " != " << num_scene;
    throw_shape_mismatch(msg.str());
  }
  if (static_cast<size_t>(actors.rows()) != actor_idcs.total()) {
    std::ostringstream msg;
    msg << "Actor indices cover " << actor_idcs.total() << " rows, but got " << actors.rows();
    throw_shape_mismatch(msg.str());
  }
  if (
    static_cast<size_t>(tgt_rpes.rows()) != num_scene ||
    static_cast<size_t>(tgt_rpes.cols()) != d_tgt_rpe_) {
    std::ostringstream msg;
    msg << "Invalid shape of target RPE: (" << tgt_rpes.rows() << ", " << tgt_rpes.cols()
        << ") != (" << num_scene << ", " << d_tgt_rpe_ << ")";
    throw_shape_mismatch(msg.str());
  }
  if (tgt_feat.rows() != 1 && static_cast<size_t>(tgt_feat.rows()) != num_scene) {
    std::ostringstream msg;
    msg << "Number of target nodes must be 1 or " << num_scene << ", but got " << tgt_feat.rows();
    throw_shape_mismatch(msg.str());
  }

  // target embedding of each scene
  Matrix tgt_in(static_cast<Eigen::Index>(num_scene), 2 * hidden);
  if (tgt_feat.rows() == 1) {
    tgt_in.leftCols(hidden) = tgt_feat.replicate(static_cast<Eigen::Index>(num_scene), 1);
  } else {
    tgt_in.leftCols(hidden) = tgt_feat;
  }
  tgt_in.rightCols(hidden) = proj_rpe_.forward(tgt_rpes);
  const Matrix tgt = proj_tgt_.forward(tgt_in);

  const auto num_ctrl = basis_->num_control_point();
  const auto num_step = basis_->num_step();

  std::vector<Matrix> probabilities;
  std::vector<ModeTensor> trajectories;
  std::vector<AuxiliaryOutput> auxiliaries;
  probabilities.reserve(num_scene);
  trajectories.reserve(num_scene);
  auxiliaries.reserve(num_scene);

  for (size_t b = 0; b < num_scene; ++b) {
    const auto scene = static_cast<Eigen::Index>(b);
    const auto num_actor = static_cast<Eigen::Index>(actor_idcs.size(b));
    const auto offset = static_cast<Eigen::Index>(actor_idcs.offset(b));

    const Matrix cls_embed = ctx_sat_.forward(to_modes(ctx_proj_.forward(ctx.row(scene))));
    const Matrix actor_embed = actor_proj_.forward(actors.middleRows(offset, num_actor));

    // embed[a*K + k] = cls[k] + actor[a, k] + (k == 0 ? tgt : 0)
    Matrix embed(num_actor * num_mode, hidden);
    for (Eigen::Index a = 0; a < num_actor; ++a) {
      embed.middleRows(a * num_mode, num_mode) = cls_embed + to_modes(actor_embed.row(a));
      embed.row(a * num_mode) += tgt.row(scene);
    }

    const Matrix logits = cls_.forward(cls_embed).transpose();
    const Matrix scores = nn::softmax(logits, constants::SCORE_TEMPERATURE);
    probabilities.emplace_back(scores.replicate(num_actor, 1));

    const Matrix params = reg_.forward(embed);

    const auto num_actor_size = static_cast<size_t>(num_actor);
    ModeTensor trajectory(num_actor_size, num_mode_, num_step, constants::TRAJECTORY_OUTPUT_DIM);
    AuxiliaryOutput aux{
      ModeTensor(num_actor_size, num_mode_, num_step, 2),
      ModeTensor(num_actor_size, num_mode_, num_step, 2), std::nullopt};
    if (basis_->exposes_parameters()) {
      aux.parameters.emplace(
        num_actor_size, num_mode_, num_ctrl, constants::TRAJECTORY_PARAM_DIM);
    }

    for (size_t a = 0; a < num_actor_size; ++a) {
      for (size_t k = 0; k < num_mode_; ++k) {
        const Matrix param = archetype::ConstMatrixMap(
          params.row(static_cast<Eigen::Index>(a * num_mode_ + k)).data(),
          static_cast<Eigen::Index>(num_ctrl),
          static_cast<Eigen::Index>(constants::TRAJECTORY_PARAM_DIM));
        const Matrix position_param = param.leftCols(2);
        const Matrix log_var_param = param.middleCols(2, 2);

        auto mode = trajectory.mode(a, k);
        mode.leftCols(2) = basis_->evaluate_position(position_param);
        mode.rightCols(2) = basis_->evaluate_position(log_var_param).array().exp().matrix();

        aux.velocity.mode(a, k) = basis_->evaluate_velocity(position_param);
        aux.variance_velocity.mode(a, k) = basis_->evaluate_variance_velocity(log_var_param);
        if (aux.parameters) {
          aux.parameters->mode(a, k) = param;
        }
      }
    }

    trajectories.emplace_back(std::move(trajectory));
    auxiliaries.emplace_back(std::move(aux));
  }

  return {std::move(probabilities), std::move(trajectories), std::move(auxiliaries)};
}

void SceneDecoder::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  actor_proj_.collect_parameters(nn::join_name(prefix, "actor_proj"), params);
  ctx_proj_.collect_parameters(nn::join_name(prefix, "ctx_proj"), params);
  ctx_sat_.collect_parameters(nn::join_name(prefix, "ctx_sat"), params);
  proj_rpe_.collect_parameters(nn::join_name(prefix, "proj_rpe"), params);
  proj_tgt_.collect_parameters(nn::join_name(prefix, "proj_tgt"), params);
  cls_.collect_parameters(nn::join_name(prefix, "cls"), params);
  reg_.collect_parameters(nn::join_name(prefix, "reg"), params);
}
}  // namespace autoware::scene_prediction::network
