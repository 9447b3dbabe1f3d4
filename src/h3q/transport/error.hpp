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
 * Namespace containing the h3q::transport module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  This is the taxonomy the protocol
 * layer sees: every error a QUIC engine reports (in h3q::transport::quic::error or any other category) is
 * translated into one of these by h3q::transport::error_mapping before it leaves an H3Q adapter.  The original
 * (native) code is not lost: see `transport_cause()` on each adapter.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 * As of this writing there is discussion there useful for someone new to boost.system error reporting.
 */
namespace h3q::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by h3q::transport functions/methods.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.  This mirrors Flow's convention.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_SEND_NOT_READY => `"SEND_NOT_READY"`.  This enables the consistent and human-friendly
 * serialization `<<` and deserialization `>>` of a Code w/r/t standard streams.
 *
 * If, when adding a new revision of the code, you add a value to this `enum`, add it to the end, but ahead of
 * Code::S_END_SENTINEL.
 * If, when adding a new revision of the code, you deprecate a value in this `enum`, do not delete
 * it from this `enum`.  Instead mark it as deprecated here and then remove it from Category::message().
 *
 * Errors that indicate apparent library bugs such as invariant violations are not represented here, because we
 * assert instead.
 */
enum class Code
{
  /// A sync_io operation could not immediately complete; it will complete contingent on active async-wait event(s).
  S_SYNC_IO_WOULD_BLOCK = S_CODE_LOWEST_INT_VALUE,

  /**
   * User protocol-code mismatch: send_data() called while a previously submitted buffer is not yet fully written;
   * poll_ready() must report readiness first.  No transport state was touched; the call may be retried later.
   */
  S_SEND_NOT_READY,

  /// Will not send data: local user already finished or reset the sending direction of this stream.
  S_SENDS_FINISHED_CANNOT_SEND,

  /// QUIC connection was lost due to a transport-level failure (protocol violation, version mismatch, reset, ...).
  S_CONNECTION_LOST,

  /// QUIC connection was closed deliberately by the application on this or the opposing side.
  S_CONNECTION_CLOSED,

  /// QUIC connection was closed because the idle timeout elapsed without hearing from the opposing side.
  S_CONNECTION_TIMED_OUT,

  /// Unable to receive: opposing side abruptly reset the sending direction of this stream.
  S_STREAM_RESET_BY_PEER,

  /// Unable to send: opposing side requested that we stop sending on this stream.
  S_STREAM_STOPPED_BY_PEER,

  /// Unable to receive: the QUIC engine reported a stream read failure not otherwise classified.
  S_STREAM_READ_FAILED,

  /// Unable to send or finish: the QUIC engine reported a stream write failure not otherwise classified.
  S_STREAM_WRITE_FAILED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight flow::Error_code (boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * flow::Error_code to the (h3q::transport-specific) error code set h3q::transport::error::Code, so that one can
 * implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding flow::Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code (e.g., 1 corresponds to the first one).
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "SEND_NOT_READY" for Code::S_SEND_NOT_READY.
 * This enables a few key things to work, including parsing from config file/command line via and conversion from
 * `string` via `boost::lexical_cast`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream.  The output string is compatible with the
 * reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace h3q::transport::error

/**
 * Small group of miscellaneous utilities to ease work with boost.system, extending its API in order to
 * make boost.system understand our code set.
 */
namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::h3q::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
