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

#include "autoware/scene_prediction/nn/functional.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"

#include <algorithm>
#include <sstream>

namespace autoware::scene_prediction::nn
{
void relu_inplace(Matrix & x)
{
  x = x.cwiseMax(0.0f);
}

Matrix softmax(const Matrix & x, float temperature)
{
  Matrix output(x.rows(), x.cols());
  for (Eigen::Index i = 0; i < x.rows(); ++i) {
    const Eigen::RowVectorXf logits = x.row(i) * temperature;
    const Eigen::RowVectorXf exps = (logits.array() - logits.maxCoeff()).exp().matrix();
    output.row(i) = exps / exps.sum();
  }
  return output;
}

Matrix group_max_pool(const Matrix & x, size_t group_size)
{
  if (group_size == 0 || static_cast<size_t>(x.rows()) % group_size != 0) {
    std::ostringstream msg;
    msg << "Number of rows " << x.rows() << " is not divisible by group size " << group_size;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }

  const auto num_row = static_cast<Eigen::Index>(group_size);
  const Eigen::Index num_group = x.rows() / num_row;
  Matrix output(num_group, x.cols());
  for (Eigen::Index g = 0; g < num_group; ++g) {
    output.row(g) = x.middleRows(g * num_row, num_row).colwise().maxCoeff();
  }
  return output;
}

Matrix upsample_linear2x(const Matrix & x)
{
  const Eigen::Index length = x.cols();
  Matrix output(x.rows(), length * 2);
  for (Eigen::Index i = 0; i < length * 2; ++i) {
    // source coordinate of the output center
    const float src = std::max(0.5f * (static_cast<float>(i) + 0.5f) - 0.5f, 0.0f);
    const auto i0 = static_cast<Eigen::Index>(src);
    const Eigen::Index i1 = i0 < length - 1 ? i0 + 1 : i0;
    const float lambda1 = src - static_cast<float>(i0);
    const float lambda0 = 1.0f - lambda1;
    output.col(i) = lambda0 * x.col(i0) + lambda1 * x.col(i1);
  }
  return output;
}

Matrix gradient(const Matrix & x, float spacing)
{
  const Eigen::Index num_step = x.rows();
  if (num_step < 2) {
    throw archetype::SceneException(
      archetype::SceneError_t::SHAPE_MISMATCH, "Gradient requires at least 2 steps.");
  }

  Matrix output(num_step, x.cols());
  output.row(0) = (x.row(1) - x.row(0)) / spacing;
  for (Eigen::Index t = 1; t < num_step - 1; ++t) {
    output.row(t) = (x.row(t + 1) - x.row(t - 1)) / (2.0f * spacing);
  }
  output.row(num_step - 1) = (x.row(num_step - 1) - x.row(num_step - 2)) / spacing;
  return output;
}
}  // namespace autoware::scene_prediction::nn
