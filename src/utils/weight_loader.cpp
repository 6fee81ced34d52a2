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

#include "autoware/scene_prediction/utils/weight_loader.hpp"

#include "autoware/scene_prediction/archetype/exception.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace autoware::scene_prediction::utils
{
namespace
{
constexpr size_t header_length_size = 8;
constexpr size_t f32_size = 4;

void throw_io(const std::string & msg)
{
  throw archetype::SceneException(archetype::SceneError_t::IO, msg);
}

std::uint64_t read_u64_le(const std::string & buffer)
{
  std::uint64_t value = 0;
  for (size_t i = 0; i < header_length_size; ++i) {
    value |= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i])) << (8 * i);
  }
  return value;
}

float read_f32_le(const char * bytes)
{
  std::uint32_t bits = 0;
  for (size_t i = 0; i < f32_size; ++i) {
    bits |= static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i])) << (8 * i);
  }
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}
}  // namespace

nn::StateDict parse_safetensors(const std::string & buffer)
{
  if (buffer.size() < header_length_size) {
    throw_io("Safetensors file is too short.");
  }
  const std::uint64_t header_size = read_u64_le(buffer);
  if (header_size > buffer.size() - header_length_size) {
    throw_io("Safetensors header exceeds the file size.");
  }

  nlohmann::json header;
  try {
    header = nlohmann::json::parse(buffer.substr(header_length_size, header_size));
  } catch (const nlohmann::json::parse_error & e) {
    throw_io(std::string("Failed to parse safetensors header: ") + e.what());
  }
  if (!header.is_object()) {
    throw_io("Safetensors header must be a JSON object.");
  }

  const size_t payload_offset = header_length_size + header_size;
  const size_t payload_size = buffer.size() - payload_offset;

  nn::StateDict state_dict;
  for (const auto & [name, info] : header.items()) {
    if (name == "__metadata__") {
      continue;
    }

    nn::TensorBuffer tensor;
    size_t begin = 0;
    size_t end = 0;
    std::string dtype;
    try {
      dtype = info.at("dtype").get<std::string>();
      tensor.shape = info.at("shape").get<std::vector<size_t>>();
      const auto & offsets = info.at("data_offsets");
      begin = offsets.at(0).get<size_t>();
      end = offsets.at(1).get<size_t>();
    } catch (const nlohmann::json::exception & e) {
      throw_io("Invalid safetensors entry " + name + ": " + e.what());
    }

    if (dtype != "F32") {
      throw archetype::SceneException(
        archetype::SceneError_t::INVALID_VALUE, "Unsupported dtype of " + name + ": " + dtype);
    }
    if (begin > end || end > payload_size) {
      std::ostringstream msg;
      msg << "Data offsets of " << name << " are out of range: [" << begin << ", " << end
          << ") in " << payload_size << " bytes";
      throw_io(msg.str());
    }

    size_t numel = 1;
    for (const auto dim : tensor.shape) {
      numel *= dim;
    }
    if (numel * f32_size != end - begin) {
      std::ostringstream msg;
      msg << "Byte size of " << name << " does not match its shape: " << end - begin
          << " != " << numel * f32_size;
      throw_io(msg.str());
    }

    tensor.data.resize(numel);
    const char * first = buffer.data() + payload_offset + begin;
    for (size_t i = 0; i < numel; ++i) {
      tensor.data[i] = read_f32_le(first + i * f32_size);
    }
    state_dict.emplace(name, std::move(tensor));
  }
  return state_dict;
}

nn::StateDict load_safetensors(const std::string & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw_io("Could not open safetensors file: " + path);
  }
  const std::string buffer(
    (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return parse_safetensors(buffer);
}
}  // namespace autoware::scene_prediction::utils
