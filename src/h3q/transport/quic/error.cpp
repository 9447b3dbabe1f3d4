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
#include "h3q/transport/quic/error.hpp"
#include "h3q/util/util_fwd.hpp"

namespace h3q::transport::quic::error
{

// Types.

/**
 * The boost.system category for errors reported by QUIC engines through H3Q transport concepts.
 * See h3q::transport::error's Category; this one is the same except for the code set.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error.
   *
   * @param val
   *        A #Code `enum` value cast to `int`.
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_CONN_TIMED_OUT => `"CONN_TIMED_OUT"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

const boost::system::error_category& quic_category()
{
  return Category::S_CATEGORY;
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "h3q/quic";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_CONN_VERSION_MISMATCH:
    return "Connection: the opposing side does not support any QUIC version we offered.";
  case Code::S_CONN_TRANSPORT_ERROR:
    return "Connection: the opposing side violated the QUIC protocol or an internal transport error occurred.";
  case Code::S_CONN_CLOSED_BY_PEER:
    return "Connection: the opposing side's transport closed the connection with a transport-level error code.";
  case Code::S_CONN_APPLICATION_CLOSED:
    return "Connection: an application (ours or the opposing side's) closed the connection with an application "
           "error code.";
  case Code::S_CONN_STATELESS_RESET:
    return "Connection: the opposing side sent a stateless reset; it has lost all state of this connection.";
  case Code::S_CONN_TIMED_OUT:
    return "Connection: no traffic heard from the opposing side within the idle timeout.";
  case Code::S_CONN_LOCALLY_CLOSED:
    return "Connection: the local application closed the connection; any further op on it fails this way.";
  case Code::S_STREAM_RESET_BY_PEER:
    return "Stream: the opposing side reset its sending direction of this stream (RESET_STREAM received).";
  case Code::S_STREAM_STOPPED_BY_PEER:
    return "Stream: the opposing side asked us to stop sending on this stream (STOP_SENDING received).";
  case Code::S_STREAM_UNKNOWN:
    return "Stream: the stream is not known to the connection; it was already finished, reset or stopped and "
           "forgotten.";
  case Code::S_STREAM_ZERO_RTT_REJECTED:
    return "Stream: the stream was opened in 0-RTT data that the opposing side rejected.";
  case Code::S_STREAM_ILLEGAL_ORDERED_READ:
    return "Stream: an ordered read was attempted on a stream that had already been read out of order.";
  case Code::S_VAR_INT_BOUNDS_EXCEEDED:
    return "A numeric value exceeded the QUIC variable-length integer range [0, 2^62 - 1].";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_CONN_VERSION_MISMATCH:
    return "CONN_VERSION_MISMATCH";
  case Code::S_CONN_TRANSPORT_ERROR:
    return "CONN_TRANSPORT_ERROR";
  case Code::S_CONN_CLOSED_BY_PEER:
    return "CONN_CLOSED_BY_PEER";
  case Code::S_CONN_APPLICATION_CLOSED:
    return "CONN_APPLICATION_CLOSED";
  case Code::S_CONN_STATELESS_RESET:
    return "CONN_STATELESS_RESET";
  case Code::S_CONN_TIMED_OUT:
    return "CONN_TIMED_OUT";
  case Code::S_CONN_LOCALLY_CLOSED:
    return "CONN_LOCALLY_CLOSED";
  case Code::S_STREAM_RESET_BY_PEER:
    return "STREAM_RESET_BY_PEER";
  case Code::S_STREAM_STOPPED_BY_PEER:
    return "STREAM_STOPPED_BY_PEER";
  case Code::S_STREAM_UNKNOWN:
    return "STREAM_UNKNOWN";
  case Code::S_STREAM_ZERO_RTT_REJECTED:
    return "STREAM_ZERO_RTT_REJECTED";
  case Code::S_STREAM_ILLEGAL_ORDERED_READ:
    return "STREAM_ILLEGAL_ORDERED_READ";
  case Code::S_VAR_INT_BOUNDS_EXCEEDED:
    return "VAR_INT_BOUNDS_EXCEEDED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace h3q::transport::quic::error
