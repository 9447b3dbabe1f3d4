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
#include "h3q/transport/quic/var_int.hpp"
#include "h3q/transport/quic/error.hpp"
#include <flow/error/error.hpp>

namespace h3q::transport::quic
{

// Static initializations.

const Var_int Var_int::S_MAX(S_MAX_VALUE);

// Implementations.

Var_int::Var_int() :
  m_value(0)
{
  // Nothing else.
}

Var_int::Var_int(value_t val) :
  m_value(val)
{
  assert((m_value <= S_MAX_VALUE) && "Private ctor must be given an in-range value.");
}

void Var_int::from_u64(value_t val, Var_int* result, Error_code* err_code) // Static.
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { from_u64(val, result, actual_err_code); },
         err_code, "quic::Var_int::from_u64()"))
  {
    return;
  }
  // else

  assert(result);

  if (val > S_MAX_VALUE)
  {
    *err_code = error::Code::S_VAR_INT_BOUNDS_EXCEEDED;
    return;
  }
  // else

  err_code->clear();
  *result = Var_int(val);
}

Var_int::value_t Var_int::value() const
{
  return m_value;
}

bool operator==(const Var_int& val1, const Var_int& val2)
{
  return val1.value() == val2.value();
}

bool operator!=(const Var_int& val1, const Var_int& val2)
{
  return !(val1 == val2);
}

std::ostream& operator<<(std::ostream& os, const Var_int& val)
{
  return os << val.value();
}

} // namespace h3q::transport::quic
