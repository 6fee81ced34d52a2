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

#include "autoware/scene_prediction/nn/parameter.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace autoware::scene_prediction::nn
{
size_t Parameter::numel() const noexcept
{
  return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<size_t>());
}

std::string join_name(const std::string & prefix, const std::string & name)
{
  return prefix.empty() ? name : prefix + "." + name;
}

std::string shape_to_string(const std::vector<size_t> & shape)
{
  std::ostringstream ss;
  ss << "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    ss << (i == 0 ? "" : ", ") << shape[i];
  }
  ss << ")";
  return ss.str();
}

void initialize_parameters(const ParameterList & params, std::uint32_t seed)
{
  std::mt19937 engine(seed);
  for (const auto & param : params) {
    float * first = param.data;
    float * last = param.data + param.numel();
    switch (param.initializer) {
      case Initializer::ONES:
        std::fill(first, last, 1.0f);
        break;
      case Initializer::ZEROS:
        std::fill(first, last, 0.0f);
        break;
      case Initializer::UNIFORM: {
        const float bound =
          param.fan_in > 0 ? 1.0f / std::sqrt(static_cast<float>(param.fan_in)) : 0.0f;
        std::uniform_real_distribution<float> dist(-bound, bound);
        std::generate(first, last, [&]() { return dist(engine); });
        break;
      }
    }
  }
}

std::vector<std::string> load_state_dict(
  const ParameterList & params, const StateDict & state_dict)
{
  // validate everything first so that a failure leaves parameters untouched
  std::vector<const TensorBuffer *> sources;
  sources.reserve(params.size());
  std::unordered_set<std::string> used;
  for (const auto & param : params) {
    const auto itr = state_dict.find(param.name);
    if (itr == state_dict.end()) {
      throw archetype::SceneException(
        archetype::SceneError_t::INVALID_VALUE, "Missing parameter in state dict: " + param.name);
    }

    const auto & tensor = itr->second;
    if (tensor.shape != param.shape || tensor.data.size() != param.numel()) {
      std::ostringstream msg;
      msg << "Shape of " << param.name << " is different: " << shape_to_string(tensor.shape)
          << " != " << shape_to_string(param.shape);
      throw archetype::SceneException(archetype::SceneError_t::SHAPE_MISMATCH, msg.str());
    }

    sources.emplace_back(&tensor);
    used.insert(param.name);
  }

  for (size_t i = 0; i < params.size(); ++i) {
    std::copy(sources[i]->data.begin(), sources[i]->data.end(), params[i].data);
  }

  std::vector<std::string> unexpected;
  for (const auto & [name, tensor] : state_dict) {
    if (used.count(name) == 0) {
      unexpected.emplace_back(name);
    }
  }
  std::sort(unexpected.begin(), unexpected.end());
  return unexpected;
}
}  // namespace autoware::scene_prediction::nn
