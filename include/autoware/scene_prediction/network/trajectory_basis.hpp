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

#ifndef AUTOWARE__SCENE_PREDICTION__NETWORK__TRAJECTORY_BASIS_HPP_
#define AUTOWARE__SCENE_PREDICTION__NETWORK__TRAJECTORY_BASIS_HPP_

#include "autoware/scene_prediction/archetype/config.hpp"
#include "autoware/scene_prediction/archetype/tensor.hpp"

#include <cstddef>
#include <memory>

namespace autoware::scene_prediction::network
{
using archetype::Matrix;

/**
 * @brief An interface to turn regressed parameters into per-step sequences.
 */
class TrajectoryBasis
{
public:
  virtual ~TrajectoryBasis() = default;

  /**
   * @brief Return the number of parameter rows regressed for each mode.
   */
  virtual size_t num_control_point() const noexcept = 0;

  /**
   * @brief Return the number of output steps.
   */
  virtual size_t num_step() const noexcept = 0;

  /**
   * @brief Evaluate values at each step.
   *
   * @param params Parameters in the shape of (num_control_point, D).
   * @return Matrix Values in the shape of (num_step, D).
   */
  virtual Matrix evaluate_position(const Matrix & params) const = 0;

  /**
   * @brief Evaluate time derivatives [/s] at each step.
   *
   * @param params Parameters in the shape of (num_control_point, D).
   * @return Matrix Derivatives in the shape of (num_step, D).
   */
  virtual Matrix evaluate_velocity(const Matrix & params) const = 0;

  /**
   * @brief Evaluate time derivatives [/s] of the log-variance channels at each step.
   *
   * Same as `evaluate_velocity` unless a basis overrides it.
   *
   * @param params Parameters in the shape of (num_control_point, D).
   * @return Matrix Derivatives in the shape of (num_step, D).
   */
  virtual Matrix evaluate_variance_velocity(const Matrix & params) const
  {
    return evaluate_velocity(params);
  }

  /**
   * @brief Return true if raw parameters are part of the auxiliary output.
   */
  virtual bool exposes_parameters() const noexcept = 0;
};

/**
 * @brief Bezier curve of order 7 evaluated with the Bernstein basis.
 */
class BezierBasis : public TrajectoryBasis
{
public:
  explicit BezierBasis(size_t num_step);

  size_t num_control_point() const noexcept override
  {
    return static_cast<size_t>(mat_t_.cols());
  }
  size_t num_step() const noexcept override { return static_cast<size_t>(mat_t_.rows()); }
  Matrix evaluate_position(const Matrix & params) const override;
  Matrix evaluate_velocity(const Matrix & params) const override;
  bool exposes_parameters() const noexcept override { return true; }

  const Matrix & mat_t() const noexcept { return mat_t_; }
  const Matrix & mat_tp() const noexcept { return mat_tp_; }

private:
  Matrix mat_t_;   //!< (S, n + 1).
  Matrix mat_tp_;  //!< (S, n).
};

/**
 * @brief Polynomial of order 7 evaluated with the power basis.
 */
class MonomialBasis : public TrajectoryBasis
{
public:
  explicit MonomialBasis(size_t num_step);

  size_t num_control_point() const noexcept override
  {
    return static_cast<size_t>(mat_t_.cols());
  }
  size_t num_step() const noexcept override { return static_cast<size_t>(mat_t_.rows()); }
  Matrix evaluate_position(const Matrix & params) const override;
  Matrix evaluate_velocity(const Matrix & params) const override;

  /**
   * @brief Apply the power-basis derivative matrix to the control-point differences.
   */
  Matrix evaluate_variance_velocity(const Matrix & params) const override;
  bool exposes_parameters() const noexcept override { return true; }

  const Matrix & mat_tp() const noexcept { return mat_tp_; }

private:
  Matrix mat_t_;   //!< (S, n + 1).
  Matrix mat_tp_;  //!< (S, n).
};

/**
 * @brief Raw per-step waypoints, derivatives by finite differences.
 */
class WaypointBasis : public TrajectoryBasis
{
public:
  explicit WaypointBasis(size_t num_step);

  size_t num_control_point() const noexcept override { return num_step_; }
  size_t num_step() const noexcept override { return num_step_; }
  Matrix evaluate_position(const Matrix & params) const override;
  Matrix evaluate_velocity(const Matrix & params) const override;
  bool exposes_parameters() const noexcept override { return false; }

private:
  size_t num_step_;
};

/**
 * @brief Create the basis of the specified parameterization.
 *
 * @param param_out Parameterization.
 * @param num_step Number of output steps, at least 2.
 * @throw SceneException If the parameterization is not supported or `num_step < 2`.
 */
std::unique_ptr<TrajectoryBasis> make_trajectory_basis(
  archetype::ParamOut param_out, size_t num_step);
}  // namespace autoware::scene_prediction::network
#endif  // AUTOWARE__SCENE_PREDICTION__NETWORK__TRAJECTORY_BASIS_HPP_
