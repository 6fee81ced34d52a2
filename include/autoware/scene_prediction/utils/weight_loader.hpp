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

#ifndef AUTOWARE__SCENE_PREDICTION__UTILS__WEIGHT_LOADER_HPP_
#define AUTOWARE__SCENE_PREDICTION__UTILS__WEIGHT_LOADER_HPP_

#include "autoware/scene_prediction/nn/parameter.hpp"

#include <string>

namespace autoware::scene_prediction::utils
{
/**
 * @brief Parse a safetensors byte buffer.
 *
 * The buffer starts with the 8-byte little-endian length of a JSON header, followed by the header
 * and the tensor payload. Only `F32` tensors are supported.
 *
 * @param buffer Whole file content.
 * @return nn::StateDict Tensors by name.
 * @throw SceneException If the buffer is truncated, the header is broken or a dtype is not `F32`.
 */
nn::StateDict parse_safetensors(const std::string & buffer);

/**
 * @brief Load a safetensors checkpoint.
 *
 * @param path Path to the `.safetensors` file.
 * @return nn::StateDict Tensors by name.
 * @throw SceneException If the file cannot be read or parsed.
 */
nn::StateDict load_safetensors(const std::string & path);
}  // namespace autoware::scene_prediction::utils
#endif  // AUTOWARE__SCENE_PREDICTION__UTILS__WEIGHT_LOADER_HPP_
