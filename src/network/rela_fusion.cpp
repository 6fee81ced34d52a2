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

#include "autoware/scene_prediction/network/rela_fusion.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/nn/functional.hpp"

#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace autoware::scene_prediction::network
{
RelaFusionLayer::RelaFusionLayer(
  size_t d_edge, size_t d_model, size_t d_ffn, size_t num_head, bool update_edge)
: proj_memory_(std::vector<size_t>{2 * d_model + d_edge, d_model}),
  multihead_attn_(d_model, num_head),
  linear1_(d_model, d_ffn),
  linear2_(d_ffn, d_model),
  norm2_(d_model),
  norm3_(d_model)
{
  if (update_edge) {
    proj_edge_.emplace(std::vector<size_t>{d_model, d_edge});
    norm_edge_.emplace(d_edge);
  }
}

std::pair<Matrix, Matrix> RelaFusionLayer::forward(
  const Matrix & node, const Matrix & edge, const MaskMatrix * edge_mask) const
{
  const Eigen::Index num_token = node.rows();
  const Eigen::Index d_model = node.cols();
  const Eigen::Index d_edge = edge.cols();

  // memory[i, j] = proj([edge[i, j], node[i], node[j]])
  Matrix memory_in(num_token * num_token, d_edge + 2 * d_model);
  memory_in.leftCols(d_edge) = edge;
  for (Eigen::Index i = 0; i < num_token; ++i) {
    for (Eigen::Index j = 0; j < num_token; ++j) {
      auto row = memory_in.row(i * num_token + j);
      row.segment(d_edge, d_model) = node.row(i);
      row.segment(d_edge + d_model, d_model) = node.row(j);
    }
  }
  const Matrix memory = proj_memory_.forward(memory_in);

  Matrix next_edge = proj_edge_ ? norm_edge_->forward(edge + proj_edge_->forward(memory)) : edge;

  Matrix x = norm2_.forward(node + multihead_attn_.forward_grouped(node, memory, edge_mask));
  Matrix hidden = linear1_.forward(x);
  nn::relu_inplace(hidden);
  x = norm3_.forward(x + linear2_.forward(hidden));

  return {std::move(x), std::move(next_edge)};
}

void RelaFusionLayer::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  proj_memory_.collect_parameters(nn::join_name(prefix, "proj_memory"), params);
  if (proj_edge_) {
    proj_edge_->collect_parameters(nn::join_name(prefix, "proj_edge"), params);
    norm_edge_->collect_parameters(nn::join_name(prefix, "norm_edge"), params);
  }
  multihead_attn_.collect_parameters(nn::join_name(prefix, "multihead_attn"), params);
  linear1_.collect_parameters(nn::join_name(prefix, "linear1"), params);
  linear2_.collect_parameters(nn::join_name(prefix, "linear2"), params);
  norm2_.collect_parameters(nn::join_name(prefix, "norm2"), params);
  norm3_.collect_parameters(nn::join_name(prefix, "norm3"), params);
}

RelaFusionNet::RelaFusionNet(
  size_t d_model, size_t d_edge, size_t num_head, size_t num_layer, bool update_edge)
: d_model_(d_model), d_edge_(d_edge)
{
  fusion_.reserve(num_layer);
  for (size_t i = 0; i < num_layer; ++i) {
    const bool need_update_edge = i + 1 == num_layer ? false : update_edge;
    fusion_.emplace_back(d_edge, d_model, 2 * d_model, num_head, need_update_edge);
  }
}

Matrix RelaFusionNet::forward(
  const Matrix & node, const Matrix & edge, const MaskMatrix * edge_mask) const
{
  const auto num_token = node.rows();
  if (static_cast<size_t>(node.cols()) != d_model_) {
    std::ostringstream msg;
    msg << "Invalid width of nodes: " << node.cols() << " != " << d_model_;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  if (edge.rows() != num_token * num_token || static_cast<size_t>(edge.cols()) != d_edge_) {
    std::ostringstream msg;
    msg << "Invalid shape of edges: (" << edge.rows() << ", " << edge.cols() << ") != ("
        << num_token * num_token << ", " << d_edge_ << ")";
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  if (edge_mask && (edge_mask->rows() != num_token || edge_mask->cols() != num_token)) {
    throw archetype::SceneException(
      archetype::SceneError_t::SHAPE_MISMATCH, "Edge mask must be in the shape of (N, N).");
  }

  Matrix x = node;
  Matrix e = edge;
  for (const auto & layer : fusion_) {
    std::tie(x, e) = layer.forward(x, e, edge_mask);
  }
  return x;
}

void RelaFusionNet::collect_parameters(const std::string & prefix, nn::ParameterList & params)
{
  for (size_t i = 0; i < fusion_.size(); ++i) {
    fusion_[i].collect_parameters(nn::join_name(prefix, "fusion." + std::to_string(i)), params);
  }
}
}  // namespace autoware::scene_prediction::network
