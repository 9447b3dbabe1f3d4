/* H3Q: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "h3q/common.hpp"
#include <ostream>

namespace h3q::transport::quic
{

/**
 * A QUIC variable-length integer value: an unsigned integer in [0, 2^62 - 1].  Application error codes (as carried
 * by RESET_STREAM, STOP_SENDING and CONNECTION_CLOSE frames) are of this type; so the protocol layer's `uint64_t`
 * codes must pass through Var_int::from_u64() before reaching the QUIC engine.
 *
 * The object is a simple copyable value.  It never holds an out-of-range value: the only way to obtain a
 * non-zero Var_int is from_u64(), which fails if given one.
 *
 * @see transport::error_mapping::app_error_code_to_var_int() which clamps instead of failing.
 */
class Var_int
{
public:
  // Types.

  /// The wide-enough unsigned integer type holding the value.
  using value_t = uint64_t;

  // Constants.

  /// The greatest representable value: 2^62 - 1.
  static constexpr value_t S_MAX_VALUE = (value_t(1) << 62) - 1;

  /// Var_int holding #S_MAX_VALUE.
  static const Var_int S_MAX;

  // Constructors/destructor.

  /// Constructs Var_int holding zero.
  Var_int();

  // Methods.

  /**
   * Constructs Var_int from the given integer, if it is in range; else emits error.
   *
   * @param val
   *        The value.
   * @param result
   *        On success `*result` is set to the new Var_int; else it is untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        quic::error::Code::S_VAR_INT_BOUNDS_EXCEEDED (`val > S_MAX_VALUE`).
   */
  static void from_u64(value_t val, Var_int* result, Error_code* err_code = 0);

  /**
   * The value.
   * @return See above.
   */
  value_t value() const;

private:
  // Constructors.

  /**
   * Constructs Var_int holding the given value, which must be in range.
   * @param val
   *        The value.
   */
  explicit Var_int(value_t val);

  // Data.

  /// See value().
  value_t m_value;
}; // class Var_int

// Free functions.

/**
 * Returns `true` if and only if the two objects hold equal values.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Var_int& val1, const Var_int& val2);

/**
 * Returns `!(val1 == val2)`.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Var_int& val1, const Var_int& val2);

/**
 * Prints the value to the given stream.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Var_int& val);

} // namespace h3q::transport::quic
