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
#include "h3q/transport/error_mapping.hpp"
#include "h3q/transport/error.hpp"
#include "h3q/transport/quic/error.hpp"
#include <optional>

namespace h3q::transport::error_mapping
{

// Local helpers.

namespace
{

/**
 * Returns the quic::error::Code of `native` if it is of that category, else `std::nullopt`.
 *
 * @param native
 *        Truthy code.
 * @return See above.
 */
std::optional<quic::error::Code> as_quic_code(const Error_code& native)
{
  if (native.category() != quic::error::quic_category())
  {
    return std::nullopt;
  }
  // else
  return static_cast<quic::error::Code>(native.value());
}

/**
 * The connection-level part of all the `map_*_error()`s: if `native` is a connection-level quic::error::Code,
 * returns its mapping; else `std::nullopt`.
 *
 * @param quic_code
 *        Native code.
 * @return See above.
 */
std::optional<Error_code> map_connection_level(quic::error::Code quic_code)
{
  using quic::error::Code;

  switch (quic_code)
  {
  case Code::S_CONN_TIMED_OUT:
    return Error_code(error::Code::S_CONNECTION_TIMED_OUT);
  case Code::S_CONN_APPLICATION_CLOSED:
  case Code::S_CONN_LOCALLY_CLOSED:
    return Error_code(error::Code::S_CONNECTION_CLOSED);
  case Code::S_CONN_VERSION_MISMATCH:
  case Code::S_CONN_TRANSPORT_ERROR:
  case Code::S_CONN_CLOSED_BY_PEER:
  case Code::S_CONN_STATELESS_RESET:
    return Error_code(error::Code::S_CONNECTION_LOST);
  default:
    return std::nullopt;
  }
}

/**
 * The guts of all the `map_*_error()`s.
 *
 * @param native
 *        What the QUIC engine reported.
 * @param stream_specific
 *        The one stream-level quic::error::Code with a dedicated mapping in this context (or `S_END_SENTINEL`).
 * @param stream_specific_mapped
 *        What `stream_specific` maps to.
 * @param fallback
 *        What everything else maps to.
 * @return See above.
 */
Error_code map_error(const Error_code& native, quic::error::Code stream_specific,
                     error::Code stream_specific_mapped, error::Code fallback)
{
  // Already in our taxonomy (including would-block): pass through.
  if ((!native) || (native.category() == Error_code(error::Code::S_SYNC_IO_WOULD_BLOCK).category()))
  {
    return native;
  }
  // else

  const auto quic_code = as_quic_code(native);
  if (!quic_code)
  {
    return fallback;
  }
  // else

  if (*quic_code == stream_specific)
  {
    return stream_specific_mapped;
  }
  // else

  const auto conn_mapped = map_connection_level(*quic_code);
  return conn_mapped ? *conn_mapped : Error_code(fallback);
} // map_error()

} // namespace (anon)

// Implementations.

Error_code map_connection_error(const Error_code& native)
{
  return map_error(native, quic::error::Code::S_END_SENTINEL,
                   error::Code::S_CONNECTION_LOST, error::Code::S_CONNECTION_LOST);
}

Error_code map_read_error(const Error_code& native)
{
  return map_error(native, quic::error::Code::S_STREAM_RESET_BY_PEER,
                   error::Code::S_STREAM_RESET_BY_PEER, error::Code::S_STREAM_READ_FAILED);
}

Error_code map_write_error(const Error_code& native)
{
  return map_error(native, quic::error::Code::S_STREAM_STOPPED_BY_PEER,
                   error::Code::S_STREAM_STOPPED_BY_PEER, error::Code::S_STREAM_WRITE_FAILED);
}

bool is_timeout(const Error_code& err_code)
{
  return (err_code == error::Code::S_CONNECTION_TIMED_OUT) || (err_code == quic::error::Code::S_CONN_TIMED_OUT);
}

quic::Var_int app_error_code_to_var_int(flow::log::Logger* logger_ptr, app_error_code_t code,
                                        util::String_view context)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  quic::Var_int result;
  Error_code err_code;
  quic::Var_int::from_u64(code, &result, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Application error code [" << code << "] for [" << context << "] is outside the QUIC "
                     "variable-length integer range (error [" << err_code << "] [" << err_code.message() << "]); "
                     "clamping to maximum [" << quic::Var_int::S_MAX << "].");
    result = quic::Var_int::S_MAX;
  }
  return result;
}

} // namespace h3q::transport::error_mapping
