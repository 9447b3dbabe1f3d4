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

#include "h3q/transport/transport_fwd.hpp"
#include "h3q/transport/quic/var_int.hpp"
#include <flow/log/log.hpp>

/**
 * Translation of what the QUIC engine reports into what the protocol layer sees, and of what the protocol layer
 * specifies into what the QUIC engine accepts.
 *
 * ### Errors ###
 * A QUIC engine reports failures drawn from quic::error::Code (or another category entirely); the protocol layer is
 * promised transport::error::Code values only.  The `map_*_error()` functions do the translation; which one applies
 * depends on what was being attempted, since e.g. "unknown stream" means a failed read in one place and a failed
 * write in another.  In all of them:
 *   - A falsy code maps to a falsy code.
 *   - A transport::error::Code passes through unchanged (notably transport::error::Code::S_SYNC_IO_WOULD_BLOCK).
 *   - A connection-level quic::error::Code maps to one of transport::error::Code::S_CONNECTION_TIMED_OUT,
 *     `S_CONNECTION_CLOSED`, `S_CONNECTION_LOST`.
 *
 * The native code itself is not discarded by the adapters: each keeps the most recent one for `transport_cause()`,
 * and logs it.
 *
 * ### Application error codes ###
 * The protocol layer speaks `uint64_t` error codes; QUIC carries them as 62-bit variable-length integers.
 * app_error_code_to_var_int() clamps rather than fails; both reset and stop-sending paths use it.
 */
namespace h3q::transport::error_mapping
{

// Free functions.

/**
 * Maps an error reported by a connection-level op (accepting or opening a stream) to the adapter taxonomy.
 * Non-connection-level native codes (which an engine should not report here) and unknown categories map to
 * transport::error::Code::S_CONNECTION_LOST.
 *
 * @param native
 *        What the QUIC engine reported.
 * @return See above.
 */
Error_code map_connection_error(const Error_code& native);

/**
 * Maps an error reported by a stream read to the adapter taxonomy:
 * quic::error::Code::S_STREAM_RESET_BY_PEER => transport::error::Code::S_STREAM_RESET_BY_PEER; connection-level
 * codes as in map_connection_error(); anything else => transport::error::Code::S_STREAM_READ_FAILED.
 *
 * @param native
 *        What the QUIC engine reported.
 * @return See above.
 */
Error_code map_read_error(const Error_code& native);

/**
 * Maps an error reported by a stream write or finish to the adapter taxonomy:
 * quic::error::Code::S_STREAM_STOPPED_BY_PEER => transport::error::Code::S_STREAM_STOPPED_BY_PEER; connection-level
 * codes as in map_connection_error(); anything else => transport::error::Code::S_STREAM_WRITE_FAILED.
 *
 * @param native
 *        What the QUIC engine reported.
 * @return See above.
 */
Error_code map_write_error(const Error_code& native);

/**
 * Returns `true` if and only if the given code (native or already mapped) signifies the connection's idle timeout
 * expiring.
 *
 * @param err_code
 *        Any error code.
 * @return See above.
 */
bool is_timeout(const Error_code& err_code);

/**
 * Converts the protocol layer's application error code into a QUIC variable-length integer, clamping values that
 * exceed quic::Var_int::S_MAX_VALUE to that maximum (and logging a WARNING about it).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param code
 *        The application error code.
 * @param context
 *        Short description of what the code is for (e.g., `"reset"`), for the log message.
 * @return See above.
 */
quic::Var_int app_error_code_to_var_int(flow::log::Logger* logger_ptr, app_error_code_t code,
                                        util::String_view context);

} // namespace h3q::transport::error_mapping
