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

#ifndef AUTOWARE__SCENE_PREDICTION__NN__FUNCTIONAL_HPP_
#define AUTOWARE__SCENE_PREDICTION__NN__FUNCTIONAL_HPP_

#include "autoware/scene_prediction/archetype/tensor.hpp"

#include <cstddef>

namespace autoware::scene_prediction::nn
{
using archetype::Matrix;

/**
 * @brief Apply ReLU in place.
 */
void relu_inplace(Matrix & x);

/**
 * @brief Apply softmax along each row.
 *
 * @param x Input logits.
 * @param temperature Logits are multiplied by this value before normalization.
 */
Matrix softmax(const Matrix & x, float temperature = 1.0f);

/**
 * @brief Max pooling over consecutive row groups.
 *
 * @param x Input in the shape of (G*P, D).
 * @param group_size Number of rows in each group (P).
 * @return Matrix Output in the shape of (G, D).
 */
Matrix group_max_pool(const Matrix & x, size_t group_size);

/**
 * @brief Linear interpolation along columns with the scale factor 2, where corners are not aligned.
 *
 * @param x Input in the shape of (C, L).
 * @return Matrix Output in the shape of (C, 2L).
 */
Matrix upsample_linear2x(const Matrix & x);

/**
 * @brief Finite difference derivative along rows.
 *
 * Interior rows use central differences, the first and last rows use one-sided differences.
 *
 * @param x Input in the shape of (S, D), S must be at least 2.
 * @param spacing Spacing between rows.
 */
Matrix gradient(const Matrix & x, float spacing);
}  // namespace autoware::scene_prediction::nn
#endif  // AUTOWARE__SCENE_PREDICTION__NN__FUNCTIONAL_HPP_
