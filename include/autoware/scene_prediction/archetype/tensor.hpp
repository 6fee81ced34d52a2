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

#ifndef AUTOWARE__SCENE_PREDICTION__ARCHETYPE__TENSOR_HPP_
#define AUTOWARE__SCENE_PREDICTION__ARCHETYPE__TENSOR_HPP_

#include "autoware/scene_prediction/archetype/exception.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <vector>

namespace autoware::scene_prediction::archetype
{
// Row-major float matrix, which has the same memory layout as a contiguous torch tensor.
using Matrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MatrixMap = Eigen::Map<Matrix>;
using ConstMatrixMap = Eigen::Map<const Matrix>;
using Vector = Eigen::VectorXf;
using RowVector = Eigen::RowVectorXf;

// Boolean mask, `true` marks an entry to be ignored.
using MaskMatrix = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief A class to represent actor history tensor data.
 */
class ActorTensor
{
public:
  using size_type = std::vector<float>::size_type;

  /**
   * @brief Construct a new ActorTensor object.
   *
   * @param tensor 1D actor tensor data in the shape of (A*C*T).
   * @param num_actor Number of actors (A).
   * @param num_attribute Number of attributes (C).
   * @param num_past Number of past timestamps (T).
   */
  ActorTensor(
    const std::vector<float> & tensor, size_t num_actor, size_t num_attribute, size_t num_past);

  /**
   * @brief Return the pointer to the tensor data.
   */
  const float * data() const noexcept { return tensor_.data(); }

  /**
   * @brief Return the size of the tensor (A*C*T).
   */
  size_type size() const noexcept { return tensor_.size(); }

  /**
   * @brief Return the history of the specified actor as (C x T) view.
   *
   * @param n Actor index.
   */
  ConstMatrixMap actor(size_t n) const;

  const size_t num_actor;      //!< Number of actors (A).
  const size_t num_attribute;  //!< Number of attributes (C).
  const size_t num_past;       //!< Number of past timestamps (T).

private:
  std::vector<float> tensor_;  //!< Actor tensor data.
};

/**
 * @brief A class to represent lane segment tensor data.
 *
 * The same layout is used for target nodes.
 */
class LaneTensor
{
public:
  using size_type = std::vector<float>::size_type;

  /**
   * @brief Construct a new LaneTensor object.
   *
   * @param tensor 1D lane tensor data in the shape of (L*P*F).
   * @param num_segment Number of lane segments (L).
   * @param num_point Number of points contained in a single segment (P).
   * @param num_attribute Number of attributes (F).
   */
  LaneTensor(
    const std::vector<float> & tensor, size_t num_segment, size_t num_point, size_t num_attribute);

  /**
   * @brief Return the pointer to tensor data.
   */
  const float * data() const noexcept { return tensor_.data(); }

  /**
   * @brief Return the size of tensor elements, where L*P*F.
   */
  size_type size() const noexcept { return tensor_.size(); }

  /**
   * @brief Return all points as (L*P x F) view.
   */
  ConstMatrixMap points() const;

  const size_t num_segment;    //!< Number of lane segments (L).
  const size_t num_point;      //!< Number of points contained in a single segment (P).
  const size_t num_attribute;  //!< Number of attributes (F).

private:
  std::vector<float> tensor_;  //!< Lane tensor data.
};

/**
 * @brief A class to represent the pairwise relative pose encoding of a single scene.
 */
class RpeTensor
{
public:
  using size_type = std::vector<float>::size_type;

  /**
   * @brief Construct a new RpeTensor object.
   *
   * @param tensor 1D RPE tensor data in the shape of (F*N*N).
   * @param num_attribute Number of attributes (F).
   * @param num_token Number of tokens (N), actors followed by lanes.
   */
  RpeTensor(const std::vector<float> & tensor, size_t num_attribute, size_t num_token);

  /**
   * @brief Return the pointer to tensor data.
   */
  const float * data() const noexcept { return tensor_.data(); }

  /**
   * @brief Return the size of tensor elements, where F*N*N.
   */
  size_type size() const noexcept { return tensor_.size(); }

  /**
   * @brief Return the feature of the pair (`from`, `to`).
   */
  float at(size_t attribute, size_t from, size_t to) const
  {
    return tensor_[(attribute * num_token + from) * num_token + to];
  }

  const size_t num_attribute;  //!< Number of attributes (F).
  const size_t num_token;      //!< Number of tokens (N).

private:
  std::vector<float> tensor_;  //!< RPE tensor data.
};

/**
 * @brief A class to represent per-actor per-mode sequences in the shape of (A, K, S, D).
 */
class ModeTensor
{
public:
  using size_type = std::vector<float>::size_type;

  ModeTensor() : ModeTensor(0, 0, 0, 0) {}

  /**
   * @brief Construct a new zero-filled ModeTensor object.
   *
   * @param num_actor Number of actors (A).
   * @param num_mode Number of modes (K).
   * @param num_step Number of steps (S).
   * @param num_attribute Number of attributes (D).
   */
  ModeTensor(size_t num_actor, size_t num_mode, size_t num_step, size_t num_attribute)
  : num_actor(num_actor),
    num_mode(num_mode),
    num_step(num_step),
    num_attribute(num_attribute),
    tensor_(num_actor * num_mode * num_step * num_attribute, 0.0f)
  {
  }

  float & at(size_t a, size_t k, size_t s, size_t d) { return tensor_.at(index(a, k, s, d)); }

  float at(size_t a, size_t k, size_t s, size_t d) const { return tensor_.at(index(a, k, s, d)); }

  /**
   * @brief Return the sequence of the specified actor and mode as (S x D) view.
   */
  MatrixMap mode(size_t a, size_t k)
  {
    return MatrixMap(tensor_.data() + index(a, k, 0, 0), num_step, num_attribute);
  }

  ConstMatrixMap mode(size_t a, size_t k) const
  {
    return ConstMatrixMap(tensor_.data() + index(a, k, 0, 0), num_step, num_attribute);
  }

  const float * data() const noexcept { return tensor_.data(); }

  size_type size() const noexcept { return tensor_.size(); }

  size_t num_actor;      //!< Number of actors (A).
  size_t num_mode;       //!< Number of modes (K).
  size_t num_step;       //!< Number of steps (S).
  size_t num_attribute;  //!< Number of attributes (D).

private:
  size_t index(size_t a, size_t k, size_t s, size_t d) const noexcept
  {
    return ((a * num_mode + k) * num_step + s) * num_attribute + d;
  }

  std::vector<float> tensor_;  //!< Tensor data.
};
}  // namespace autoware::scene_prediction::archetype
#endif  // AUTOWARE__SCENE_PREDICTION__ARCHETYPE__TENSOR_HPP_
