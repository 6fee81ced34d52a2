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

#include "autoware/scene_prediction/archetype/tensor.hpp"

#include <sstream>
#include <vector>

namespace autoware::scene_prediction::archetype
{
ActorTensor::ActorTensor(
  const std::vector<float> & tensor, size_t num_actor, size_t num_attribute, size_t num_past)
: num_actor(num_actor), num_attribute(num_attribute), num_past(num_past), tensor_(tensor)
{
  if (tensor_.size() != num_actor * num_attribute * num_past) {
    std::ostringstream msg;
    msg << "Invalid size of actor tensor: " << tensor_.size()
        << " != " << num_actor * num_attribute * num_past;
    throw SceneException(SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  if (num_past == 0) {
    throw SceneException(SceneError_t::SHAPE_MISMATCH, "Actor tensor must have at least 1 step.");
  }
}

ConstMatrixMap ActorTensor::actor(size_t n) const
{
  if (n >= num_actor) {
    std::ostringstream msg;
    msg << "Actor index out of range: " << n << " >= " << num_actor;
    throw SceneException(SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  return ConstMatrixMap(tensor_.data() + n * num_attribute * num_past, num_attribute, num_past);
}

LaneTensor::LaneTensor(
  const std::vector<float> & tensor, size_t num_segment, size_t num_point, size_t num_attribute)
: num_segment(num_segment), num_point(num_point), num_attribute(num_attribute), tensor_(tensor)
{
  if (tensor_.size() != num_segment * num_point * num_attribute) {
    std::ostringstream msg;
    msg << "Invalid size of lane tensor: " << tensor_.size()
        << " != " << num_segment * num_point * num_attribute;
    throw SceneException(SceneError_t::SHAPE_MISMATCH, msg.str());
  }
  if (num_point == 0) {
    throw SceneException(
      SceneError_t::SHAPE_MISMATCH, "Lane segment must contain at least 1 point.");
  }
}

ConstMatrixMap LaneTensor::points() const
{
  return ConstMatrixMap(tensor_.data(), num_segment * num_point, num_attribute);
}

RpeTensor::RpeTensor(const std::vector<float> & tensor, size_t num_attribute, size_t num_token)
: num_attribute(num_attribute), num_token(num_token), tensor_(tensor)
{
  if (tensor_.size() != num_attribute * num_token * num_token) {
    std::ostringstream msg;
    msg << "Invalid size of RPE tensor: " << tensor_.size()
        << " != " << num_attribute * num_token * num_token;
    throw SceneException(SceneError_t::SHAPE_MISMATCH, msg.str());
  }
}
}  // namespace autoware::scene_prediction::archetype
