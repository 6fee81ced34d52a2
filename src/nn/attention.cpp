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

#include "autoware/scene_prediction/nn/attention.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/nn/functional.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

namespace autoware::scene_prediction::nn
{
MultiheadAttention::MultiheadAttention(size_t embed_dim, size_t num_head)
: embed_dim_(embed_dim),
  num_head_(num_head),
  in_proj_weight_(Matrix::Zero(3 * embed_dim, embed_dim)),
  in_proj_bias_(Vector::Zero(3 * embed_dim)),
  out_proj_(embed_dim, embed_dim)
{
  if (num_head == 0 || embed_dim % num_head != 0) {
    std::ostringstream msg;
    msg << "Embedding dimension " << embed_dim << " is not divisible by heads " << num_head;
    throw archetype::SceneException(archetype::SceneError_t::INVALID_CONFIG, msg.str());
  }
}

Matrix MultiheadAttention::project(const Matrix & x, size_t chunk) const
{
  if (static_cast<size_t>(x.cols()) != embed_dim_) {
    std::ostringstream msg;
    msg << "Attention expects " << embed_dim_ << " features, but got " << x.cols();
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  const auto dim = static_cast<Eigen::Index>(embed_dim_);
  const auto offset = static_cast<Eigen::Index>(chunk) * dim;
  Matrix output = x * in_proj_weight_.middleRows(offset, dim).transpose();
  output.rowwise() += in_proj_bias_.segment(offset, dim).transpose();
  return output;
}

Matrix MultiheadAttention::attend(
  const Eigen::Ref<const Matrix> & q, const Eigen::Ref<const Matrix> & k,
  const Eigen::Ref<const Matrix> & v, const bool * mask) const
{
  const auto head_dim = static_cast<Eigen::Index>(embed_dim_ / num_head_);
  const float scale = 1.0f / std::sqrt(static_cast<float>(head_dim));
  const Eigen::Index num_key = k.rows();

  Matrix output = Matrix::Zero(1, static_cast<Eigen::Index>(embed_dim_));
  for (Eigen::Index h = 0; h < static_cast<Eigen::Index>(num_head_); ++h) {
    const Eigen::Index offset = h * head_dim;
    Eigen::RowVectorXf scores =
      (k.middleCols(offset, head_dim) * q.middleCols(offset, head_dim).transpose()).transpose() *
      scale;

    float max_score = -std::numeric_limits<float>::infinity();
    for (Eigen::Index j = 0; j < num_key; ++j) {
      if (mask == nullptr || !mask[j]) {
        max_score = std::max(max_score, scores(j));
      }
    }
    // every key is masked
    if (!std::isfinite(max_score)) {
      continue;
    }

    Eigen::RowVectorXf weights(num_key);
    for (Eigen::Index j = 0; j < num_key; ++j) {
      weights(j) = (mask != nullptr && mask[j]) ? 0.0f : std::exp(scores(j) - max_score);
    }
    weights /= weights.sum();
    output.middleCols(offset, head_dim) = weights * v.middleCols(offset, head_dim);
  }
  return output;
}

Matrix MultiheadAttention::forward(
  const Matrix & query, const Matrix & key, const Matrix & value, const MaskMatrix * mask) const
{
  if (key.rows() != value.rows()) {
    throw archetype::SceneException(
      archetype::SceneError_t::SHAPE_MISMATCH, "Key and value must have the same length.");
  }
  if (mask != nullptr && (mask->rows() != query.rows() || mask->cols() != key.rows())) {
    throw archetype::SceneException(
      archetype::SceneError_t::SHAPE_MISMATCH, "Attention mask must be in the shape of (Nq, Nk).");
  }

  const Matrix q = project(query, 0);
  const Matrix k = project(key, 1);
  const Matrix v = project(value, 2);

  Matrix output(query.rows(), static_cast<Eigen::Index>(embed_dim_));
  for (Eigen::Index i = 0; i < query.rows(); ++i) {
    const bool * mask_row = mask != nullptr ? mask->row(i).data() : nullptr;
    output.row(i) = attend(q.row(i), k, v, mask_row);
  }
  return out_proj_.forward(output);
}

Matrix MultiheadAttention::forward_grouped(
  const Matrix & query, const Matrix & memory, const MaskMatrix * mask) const
{
  const Eigen::Index num_query = query.rows();
  if (num_query == 0 || memory.rows() % num_query != 0) {
    std::ostringstream msg;
    msg << "Memory length " << memory.rows() << " is not divisible by queries " << num_query;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  const Eigen::Index group = memory.rows() / num_query;
  if (mask != nullptr && (mask->rows() != num_query || mask->cols() != group)) {
    throw archetype::SceneException(
      archetype::SceneError_t::SHAPE_MISMATCH, "Attention mask must be in the shape of (Nq, M).");
  }

  const Matrix q = project(query, 0);
  const Matrix k = project(memory, 1);
  const Matrix v = project(memory, 2);

  Matrix output(num_query, static_cast<Eigen::Index>(embed_dim_));
  for (Eigen::Index i = 0; i < num_query; ++i) {
    const bool * mask_row = mask != nullptr ? mask->row(i).data() : nullptr;
    output.row(i) =
      attend(q.row(i), k.middleRows(i * group, group), v.middleRows(i * group, group), mask_row);
  }
  return out_proj_.forward(output);
}

void MultiheadAttention::collect_parameters(const std::string & prefix, ParameterList & params)
{
  params.push_back(
    {join_name(prefix, "in_proj_weight"), in_proj_weight_.data(), {3 * embed_dim_, embed_dim_},
     Initializer::UNIFORM, embed_dim_});
  params.push_back(
    {join_name(prefix, "in_proj_bias"), in_proj_bias_.data(), {3 * embed_dim_},
     Initializer::ZEROS, embed_dim_});
  out_proj_.collect_parameters(join_name(prefix, "out_proj"), params);
}

TransformerEncoderLayer::TransformerEncoderLayer(
  size_t d_model, size_t num_head, size_t dim_feedforward)
: self_attn_(d_model, num_head),
  linear1_(d_model, dim_feedforward),
  linear2_(dim_feedforward, d_model),
  norm1_(d_model),
  norm2_(d_model)
{
}

Matrix TransformerEncoderLayer::forward(const Matrix & x) const
{
  Matrix output = norm1_.forward(x + self_attn_.forward(x, x, x));
  Matrix hidden = linear1_.forward(output);
  relu_inplace(hidden);
  return norm2_.forward(output + linear2_.forward(hidden));
}

void TransformerEncoderLayer::collect_parameters(
  const std::string & prefix, ParameterList & params)
{
  self_attn_.collect_parameters(join_name(prefix, "self_attn"), params);
  linear1_.collect_parameters(join_name(prefix, "linear1"), params);
  linear2_.collect_parameters(join_name(prefix, "linear2"), params);
  norm1_.collect_parameters(join_name(prefix, "norm1"), params);
  norm2_.collect_parameters(join_name(prefix, "norm2"), params);
}

TransformerEncoder::TransformerEncoder(
  size_t num_layer, size_t d_model, size_t num_head, size_t dim_feedforward)
{
  layers_.reserve(num_layer);
  for (size_t i = 0; i < num_layer; ++i) {
    layers_.emplace_back(d_model, num_head, dim_feedforward);
  }
}

Matrix TransformerEncoder::forward(const Matrix & x) const
{
  Matrix output = x;
  for (const auto & layer : layers_) {
    output = layer.forward(output);
  }
  return output;
}

void TransformerEncoder::collect_parameters(const std::string & prefix, ParameterList & params)
{
  for (size_t i = 0; i < layers_.size(); ++i) {
    layers_[i].collect_parameters(join_name(prefix, "layers." + std::to_string(i)), params);
  }
}
}  // namespace autoware::scene_prediction::nn
