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
#include "h3q/transport/error.hpp"
#include "h3q/util/util_fwd.hpp"

namespace h3q::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the h3q::transport module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::name()` and `Error_code::message()`).
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
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging
   * #Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).  This is the "engine" that allows `ec.message()`
   * to work, where `ec` is an #Error_code with an error::Code value.
   *
   * @param val
   *        Error code of an Category error (realistically, a #Code `enum` value cast to
   *        `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_SEND_NOT_READY => `"SEND_NOT_READY"`.
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
  /* Assign Category as the category for transport::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "h3q/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_SYNC_IO_WOULD_BLOCK:
    return
      "A sync_io operation could not immediately complete; it will complete contingent on active async-wait event(s).";
  case Code::S_SEND_NOT_READY:
    return "User protocol-code mismatch: send_data() called while a previously submitted buffer is not yet fully "
           "written; poll_ready() must report readiness first.  No transport state was touched; the call may be "
           "retried later.";
  case Code::S_SENDS_FINISHED_CANNOT_SEND:
    return "Will not send data: local user already finished or reset the sending direction of this stream.";
  case Code::S_CONNECTION_LOST:
    return "QUIC connection was lost due to a transport-level failure (protocol violation, version mismatch, "
           "reset, ...).";
  case Code::S_CONNECTION_CLOSED:
    return "QUIC connection was closed deliberately by the application on this or the opposing side.";
  case Code::S_CONNECTION_TIMED_OUT:
    return "QUIC connection was closed because the idle timeout elapsed without hearing from the opposing side.";
  case Code::S_STREAM_RESET_BY_PEER:
    return "Unable to receive: opposing side abruptly reset the sending direction of this stream.";
  case Code::S_STREAM_STOPPED_BY_PEER:
    return "Unable to send: opposing side requested that we stop sending on this stream.";
  case Code::S_STREAM_READ_FAILED:
    return "Unable to receive: the QUIC engine reported a stream read failure not otherwise classified.";
  case Code::S_STREAM_WRITE_FAILED:
    return "Unable to send or finish: the QUIC engine reported a stream write failure not otherwise classified.";

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
  case Code::S_SYNC_IO_WOULD_BLOCK:
    return "SYNC_IO_WOULD_BLOCK";
  case Code::S_SEND_NOT_READY:
    return "SEND_NOT_READY";
  case Code::S_SENDS_FINISHED_CANNOT_SEND:
    return "SENDS_FINISHED_CANNOT_SEND";
  case Code::S_CONNECTION_LOST:
    return "CONNECTION_LOST";
  case Code::S_CONNECTION_CLOSED:
    return "CONNECTION_CLOSED";
  case Code::S_CONNECTION_TIMED_OUT:
    return "CONNECTION_TIMED_OUT";
  case Code::S_STREAM_RESET_BY_PEER:
    return "STREAM_RESET_BY_PEER";
  case Code::S_STREAM_STOPPED_BY_PEER:
    return "STREAM_STOPPED_BY_PEER";
  case Code::S_STREAM_READ_FAILED:
    return "STREAM_READ_FAILED";
  case Code::S_STREAM_WRITE_FAILED:
    return "STREAM_WRITE_FAILED";

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
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace h3q::transport::error
