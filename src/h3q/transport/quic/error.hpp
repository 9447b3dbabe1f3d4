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

/**
 * Namespace containing the error codes a QUIC engine plugged into H3Q reports from its primitives (see
 * quic_concepts.hpp).  An engine wrapper translates its own library's failures into these (or passes through
 * system/other boost.system codes, which H3Q also tolerates); H3Q then maps them into h3q::transport::error codes
 * via h3q::transport::error_mapping before emitting them to the protocol layer.
 *
 * The codes model the usual QUIC engine failure classes: connection-level (any stream op can report these, once
 * the connection is gone) and stream-level.
 */
namespace h3q::transport::quic::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors a QUIC engine reports via H3Q's transport concepts, apart from system-triggered errors.
 *
 * @internal
 *
 * Same maintenance rules as for h3q::transport::error::Code: keep error.cpp's Category::message() and
 * Category::code_symbol() in sync; add new values just ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Connection: the opposing side does not support any QUIC version we offered.
  S_CONN_VERSION_MISMATCH = S_CODE_LOWEST_INT_VALUE,

  /// Connection: the opposing side violated the QUIC protocol or an internal transport error occurred.
  S_CONN_TRANSPORT_ERROR,

  /// Connection: the opposing side's transport closed the connection with a transport-level error code.
  S_CONN_CLOSED_BY_PEER,

  /// Connection: an application (ours or the opposing side's) closed the connection with an application error code.
  S_CONN_APPLICATION_CLOSED,

  /// Connection: the opposing side sent a stateless reset; it has lost all state of this connection.
  S_CONN_STATELESS_RESET,

  /// Connection: no traffic heard from the opposing side within the idle timeout.
  S_CONN_TIMED_OUT,

  /// Connection: the local application closed the connection; any further op on it fails this way.
  S_CONN_LOCALLY_CLOSED,

  /// Stream: the opposing side reset its sending direction of this stream (RESET_STREAM received).
  S_STREAM_RESET_BY_PEER,

  /// Stream: the opposing side asked us to stop sending on this stream (STOP_SENDING received).
  S_STREAM_STOPPED_BY_PEER,

  /// Stream: the stream is not known to the connection; it was already finished, reset or stopped and forgotten.
  S_STREAM_UNKNOWN,

  /// Stream: the stream was opened in 0-RTT data that the opposing side rejected.
  S_STREAM_ZERO_RTT_REJECTED,

  /// Stream: an ordered read was attempted on a stream that had already been read out of order.
  S_STREAM_ILLEGAL_ORDERED_READ,

  /// A numeric value exceeded the QUIC variable-length integer range [0, 2^62 - 1].
  S_VAR_INT_BOUNDS_EXCEEDED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight flow::Error_code (boost.system `error_code`)
 * representing that error.  This glues the (completely general) flow::Error_code to the (QUIC-specific) error code
 * set h3q::transport::quic::error::Code, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding flow::Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a quic::error::Code from a standard input stream, in the same way as for
 * h3q::transport::error::Code; e.g., "CONN_TIMED_OUT" for Code::S_CONN_TIMED_OUT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a quic::error::Code to a standard output stream.  The output string is compatible with the
 * reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

/**
 * Returns the category object of quic::error::Code-based `Error_code`s; for comparing `err_code.category()` against
 * it, to tell native QUIC codes from other categories.
 *
 * @return See above.
 */
const boost::system::error_category& quic_category();

} // namespace h3q::transport::quic::error

namespace boost::system
{

// Types.

/// Makes `enum` h3q::transport::quic::error::Code convertible to `Error_code`.  See also h3q::transport::error.
template<>
struct is_error_code_enum<::h3q::transport::quic::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
