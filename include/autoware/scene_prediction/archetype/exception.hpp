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

#ifndef AUTOWARE__SCENE_PREDICTION__ARCHETYPE__EXCEPTION_HPP_
#define AUTOWARE__SCENE_PREDICTION__ARCHETYPE__EXCEPTION_HPP_

#include <exception>
#include <string>

namespace autoware::scene_prediction::archetype
{
/**
 * @brief An enumerate to represent error kind.
 */
enum class SceneError_t {
  INVALID_CONFIG = 0,  //!< Unsupported or inconsistent model configuration.
  SHAPE_MISMATCH = 1,  //!< Tensor shape violates the input contract.
  INVALID_VALUE = 2,   //!< Invalid value error.
  IO = 3,              //!< File could not be read or is malformed.
  UNKNOWN = 4,         //!< Unknown error.
};

/**
 * @brief A class to hold error kind and message.
 */
struct SceneError
{
  /**
   * @brief Construct a new Scene Error object without any message.
   *
   * @param kind Error kind.
   */
  explicit SceneError(const SceneError_t & kind) : kind(kind), msg("") {}

  /**
   * @brief Construct a new Scene Error object with message.
   *
   * @param kind Error kind.
   * @param msg Error message.
   */
  explicit SceneError(const SceneError_t & kind, const std::string & msg) : kind(kind), msg(msg) {}

  SceneError_t kind;  //!< Error kind.
  std::string msg;    //!< Error message.
};

/**
 * @brief An exception class for `SceneError`.
 */
class SceneException : public std::exception
{
public:
  /**
   * @brief Construct a new Scene Exception object.
   *
   * @param error `SceneError` object.
   */
  explicit SceneException(const SceneError & error) : error_(error) { append_message_header(); }

  /**
   * @brief Construct a new Scene Exception object from the error kind and message.
   *
   * @param kind Error kind.
   * @param msg Error message.
   */
  SceneException(const SceneError_t & kind, const std::string & msg) : error_(kind, msg)
  {
    append_message_header();
  }

  /**
   * @brief Return the error message.
   */
  const char * what() const throw() { return msg_.c_str(); }

  /**
   * @brief Return the error kind.
   */
  SceneError_t kind() const noexcept { return error_.kind; }

  /**
   * @brief Return the error object.
   */
  const SceneError & error() const noexcept { return error_; }

private:
  /**
   * @brief Append header to the error message depending on the kind.
   */
  void append_message_header() noexcept
  {
    if (error_.kind == SceneError_t::INVALID_CONFIG) {
      msg_ = "[InvalidConfig]: " + error_.msg;
    } else if (error_.kind == SceneError_t::SHAPE_MISMATCH) {
      msg_ = "[ShapeMismatch]: " + error_.msg;
    } else if (error_.kind == SceneError_t::INVALID_VALUE) {
      msg_ = "[InvalidValue]: " + error_.msg;
    } else if (error_.kind == SceneError_t::IO) {
      msg_ = "[IO]: " + error_.msg;
    } else {
      msg_ = "[UNKNOWN]: " + error_.msg;
    }
  }

  SceneError error_;  //!< Error object.
  std::string msg_;   //!<  Error message.
};
}  // namespace autoware::scene_prediction::archetype
#endif  // AUTOWARE__SCENE_PREDICTION__ARCHETYPE__EXCEPTION_HPP_
