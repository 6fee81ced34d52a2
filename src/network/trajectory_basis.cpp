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

#include "autoware/scene_prediction/network/trajectory_basis.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"
#include "autoware/scene_prediction/constants.hpp"
#include "autoware/scene_prediction/nn/functional.hpp"

#include <cmath>
#include <memory>
#include <sstream>

namespace autoware::scene_prediction::network
{
namespace
{
void check_num_step(size_t num_step)
{
  if (num_step < 2) {
    std::ostringstream msg;
    msg << "Number of steps must be at least 2, but got " << num_step;
    throw archetype::SceneException(archetype::SceneError_t::INVALID_CONFIG, msg.str());
  }
}

void check_params(const Matrix & params, size_t num_control_point)
{
  if (static_cast<size_t>(params.rows()) != num_control_point) {
    std::ostringstream msg;
    msg << "Invalid number of control points: " << params.rows() << " != " << num_control_point;
    throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
  }
}

/**
 * @brief Return `num_step` evenly spaced values over [0, 1].
 */
double normalized_time(size_t step, size_t num_step)
{
  return static_cast<double>(step) / static_cast<double>(num_step - 1);
}

double binomial(size_t n, size_t k)
{
  double output = 1.0;
  for (size_t i = 1; i <= k; ++i) {
    output = output * static_cast<double>(n - k + i) / static_cast<double>(i);
  }
  return output;
}

/**
 * @brief Return the time scale of a normalized derivative, `S * dt`.
 */
float horizon(size_t num_step)
{
  return static_cast<float>(num_step) * constants::PREDICTION_TIME_STEP_S;
}
}  // namespace

/////// BezierBasis ///////

BezierBasis::BezierBasis(size_t num_step)
{
  check_num_step(num_step);
  constexpr size_t order = constants::BASIS_ORDER;

  mat_t_.resize(num_step, order + 1);
  mat_tp_.resize(num_step, order);
  for (size_t s = 0; s < num_step; ++s) {
    const double t = normalized_time(s, num_step);
    for (size_t i = 0; i <= order; ++i) {
      mat_t_(s, i) = static_cast<float>(
        binomial(order, i) * std::pow(1.0 - t, static_cast<double>(order - i)) *
        std::pow(t, static_cast<double>(i)));
    }
    for (size_t i = 0; i < order; ++i) {
      mat_tp_(s, i) = static_cast<float>(
        static_cast<double>(order) * binomial(order - 1, i) *
        std::pow(1.0 - t, static_cast<double>(order - 1 - i)) *
        std::pow(t, static_cast<double>(i)));
    }
  }
}

Matrix BezierBasis::evaluate_position(const Matrix & params) const
{
  check_params(params, num_control_point());
  return mat_t_ * params;
}

Matrix BezierBasis::evaluate_velocity(const Matrix & params) const
{
  check_params(params, num_control_point());
  const Eigen::Index order = mat_tp_.cols();
  const Matrix diff = params.bottomRows(order) - params.topRows(order);
  return mat_tp_ * diff / horizon(num_step());
}

/////// MonomialBasis ///////

MonomialBasis::MonomialBasis(size_t num_step)
{
  check_num_step(num_step);
  constexpr size_t order = constants::BASIS_ORDER;

  mat_t_.resize(num_step, order + 1);
  mat_tp_.resize(num_step, order);
  for (size_t s = 0; s < num_step; ++s) {
    const double t = normalized_time(s, num_step);
    for (size_t i = 0; i <= order; ++i) {
      mat_t_(s, i) = static_cast<float>(std::pow(t, static_cast<double>(i)));
    }
    for (size_t i = 0; i < order; ++i) {
      mat_tp_(s, i) =
        static_cast<float>(static_cast<double>(i + 1) * std::pow(t, static_cast<double>(i)));
    }
  }
}

Matrix MonomialBasis::evaluate_position(const Matrix & params) const
{
  check_params(params, num_control_point());
  return mat_t_ * params;
}

Matrix MonomialBasis::evaluate_velocity(const Matrix & params) const
{
  check_params(params, num_control_point());
  return mat_tp_ * params.bottomRows(mat_tp_.cols()) / horizon(num_step());
}

Matrix MonomialBasis::evaluate_variance_velocity(const Matrix & params) const
{
  check_params(params, num_control_point());
  const Eigen::Index order = mat_tp_.cols();
  const Matrix diff = params.bottomRows(order) - params.topRows(order);
  return mat_tp_ * diff / horizon(num_step());
}

/////// WaypointBasis ///////

WaypointBasis::WaypointBasis(size_t num_step) : num_step_(num_step)
{
  check_num_step(num_step);
}

Matrix WaypointBasis::evaluate_position(const Matrix & params) const
{
  check_params(params, num_control_point());
  return params;
}

Matrix WaypointBasis::evaluate_velocity(const Matrix & params) const
{
  check_params(params, num_control_point());
  return nn::gradient(params, constants::PREDICTION_TIME_STEP_S);
}

std::unique_ptr<TrajectoryBasis> make_trajectory_basis(
  archetype::ParamOut param_out, size_t num_step)
{
  switch (param_out) {
    case archetype::ParamOut::BEZIER:
      return std::make_unique<BezierBasis>(num_step);
    case archetype::ParamOut::MONOMIAL:
      return std::make_unique<MonomialBasis>(num_step);
    case archetype::ParamOut::NONE:
      return std::make_unique<WaypointBasis>(num_step);
    default:
      throw archetype::SceneException(
        archetype::SceneError_t::INVALID_CONFIG, "Unsupported parameterization.");
  }
}
}  // namespace autoware::scene_prediction::network
