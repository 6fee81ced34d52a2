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

#ifndef AUTOWARE__SCENE_PREDICTION__NN__PARAMETER_HPP_
#define AUTOWARE__SCENE_PREDICTION__NN__PARAMETER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoware::scene_prediction::nn
{
/**
 * @brief An enumerate to represent how a parameter is initialized.
 */
enum class Initializer {
  UNIFORM = 0,  //!< Uniform in [-1/sqrt(fan_in), 1/sqrt(fan_in)].
  ONES = 1,     //!< Filled with 1.
  ZEROS = 2,    //!< Filled with 0.
};

/**
 * @brief A named view to learned parameter storage owned by a layer.
 */
struct Parameter
{
  std::string name;            //!< Name in the exported state dict.
  float * data;                //!< Pointer to the contiguous storage.
  std::vector<size_t> shape;   //!< Shape in the exported state dict.
  Initializer initializer;     //!< Initialization rule.
  size_t fan_in;               //!< Fan-in used by `Initializer::UNIFORM`.

  /**
   * @brief Return the number of elements.
   */
  size_t numel() const noexcept;
};

using ParameterList = std::vector<Parameter>;

/**
 * @brief A tensor loaded from a checkpoint.
 */
struct TensorBuffer
{
  std::vector<size_t> shape;  //!< Tensor shape.
  std::vector<float> data;    //!< Flattened row-major values.
};

using StateDict = std::unordered_map<std::string, TensorBuffer>;

/**
 * @brief Join a module prefix and a parameter name with a dot.
 */
std::string join_name(const std::string & prefix, const std::string & name);

/**
 * @brief Return the string representation of a shape such as `(2, 3)`.
 */
std::string shape_to_string(const std::vector<size_t> & shape);

/**
 * @brief Initialize parameters deterministically.
 *
 * @param params Parameters to be initialized.
 * @param seed Random seed.
 */
void initialize_parameters(const ParameterList & params, std::uint32_t seed);

/**
 * @brief Copy tensors in the state dict into parameters with the same name.
 *
 * Nothing is copied unless every parameter has a tensor of the same shape.
 *
 * @param params Destination parameters.
 * @param state_dict Source tensors.
 * @return Names contained in `state_dict` which are not used by any parameter.
 * @throw SceneException If a parameter is missing or the shape is different.
 */
std::vector<std::string> load_state_dict(
  const ParameterList & params, const StateDict & state_dict);
}  // namespace autoware::scene_prediction::nn
#endif  // AUTOWARE__SCENE_PREDICTION__NN__PARAMETER_HPP_
