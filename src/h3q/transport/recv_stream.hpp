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

#include "h3q/transport/detail/recv_stream_impl.hpp"
#include <boost/move/make_unique.hpp>

namespace h3q::transport
{

// Types.

/**
 * The receiving direction of one QUIC stream, as the HTTP/3 protocol layer sees it: a non-blocking source of the
 * stream's bytes, strictly in order, ending in either a clean end-of-stream or an error.  A Recv_stream is obtained
 * from Connection::poll_accept_recv_stream() (a unidirectional stream opened by the opposing side) or by splitting a
 * Bidi_stream.
 *
 * ### Why not simply read in order from the QUIC engine? ###
 * Because that would stall on every gap: data after a lost packet sits in the engine's memory until the
 * retransmission arrives.  Instead we read *unordered* (see quic::Quic_recv_stream_handle) and restore order
 * ourselves in a Reorder_buffer, which holds only what arrived ahead of the gap; everything arriving in order (the
 * vast majority) passes straight through without copying.  The observable behavior is identical to an in-order
 * read: poll_data() yields consecutive runs of bytes starting at offset 0, with no gaps, duplicates or overlaps.
 *
 * ### Use ###
 * Call poll_data() repeatedly, per the `sync_io` pattern (util::sync_io doc header): each call yields a run of
 * bytes, end-of-stream, an error, or would-block (in which case call it again once `on_active_ev_func` has been
 * invoked).  Once end-of-stream or an error has been emitted, every later call emits the same thing without touching
 * the QUIC engine.  stop_sending() asks the opposing side to stop.  Destroying `*this` releases the stream.
 *
 * ### NULL state ###
 * A default-constructed Recv_stream is in NULL state; so is a moved-from one.  In this state all the methods that
 * return `bool` return `false` and no-op; the accessors return default values.
 *
 * ### Thread safety ###
 * The usual: concurrent non-`const` access to one object is not safe.  Distinct objects are independent, even if they
 * are two halves of one split Bidi_stream.
 *
 * @tparam Quic_recv_stream_handle
 *         Type implementing the quic::Quic_recv_stream_handle concept.  See quic_concepts.hpp.
 */
template<typename Quic_recv_stream_handle>
class Recv_stream
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Quic_stream = Quic_recv_stream_handle;

  // Constructors/destructor.

  /// Constructs object in NULL state.
  Recv_stream();

  /**
   * Constructs object adopting the given QUIC stream (receive direction) and ready to poll_data() from offset 0.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param stream
   *        The QUIC stream handle.  Becomes unusable (moved-from).
   */
  explicit Recv_stream(flow::log::Logger* logger_ptr, util::String_view nickname_str, Quic_stream&& stream);

  /**
   * Move-constructs from `src`; `src` becomes as-if default-cted (therefore in NULL state).
   *
   * @param src
   *        See above.
   */
  Recv_stream(Recv_stream&& src);

  /// Copy construction is disallowed.
  Recv_stream(const Recv_stream&) = delete;

  /// Releases the QUIC stream (if not in NULL state); any stored out-of-order chunks are discarded.
  ~Recv_stream();

  // Methods.

  /**
   * Move-assigns from `src`; `*this` acts as if destructed; `src` becomes as-if default-cted (therefore in NULL state).
   * No-op if `&src == this`.
   *
   * @param src
   *        See above.
   * @return `*this`.
   */
  Recv_stream& operator=(Recv_stream&& src);

  /// Copy assignment is disallowed.
  Recv_stream& operator=(const Recv_stream&) = delete;

  /**
   * Non-blockingly obtains the next run of the stream's bytes (starting exactly where the previous one ended, or at
   * 0), or its end, or an error.
   *
   * Outcomes:
   *   - Data: `*data` is set to a non-empty Blob; `*err_code` is success.
   *   - End: every byte has been yielded and the opposing side finished the stream: `*data` is set to
   *     `std::nullopt`; `*err_code` is success.  Every later call emits the same.
   *   - Would-block: `*err_code` is error::Code::S_SYNC_IO_WOULD_BLOCK; `*data` is untouched; the QUIC engine shall
   *     invoke `(*on_active_ev_func)()` once a repeat call may emit something else.
   *   - Error: `*err_code` is truthy (see below).  Every later call emits the same.  Out-of-order chunks stored so far
   *     are discarded.
   *
   * @param on_active_ev_func
   *        Wake-up to be retained by the QUIC engine if would-block.
   * @param data
   *        See above.  Not null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SYNC_IO_WOULD_BLOCK (see above), error::Code::S_STREAM_RESET_BY_PEER,
   *        error::Code::S_CONNECTION_LOST, error::Code::S_CONNECTION_CLOSED, error::Code::S_CONNECTION_TIMED_OUT,
   *        error::Code::S_STREAM_READ_FAILED (any other QUIC engine failure).  The engine's original code is
   *        available via transport_cause().
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool poll_data(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<util::Blob>* data,
                 Error_code* err_code = 0);

  /**
   * Asks the opposing side to stop sending on this stream, with the given application error code; further incoming
   * data are discarded by the QUIC engine.  Best-effort: failure (e.g., the stream already ended) is logged and
   * otherwise ignored.  A `code` beyond the QUIC varint range is clamped to quic::Var_int::S_MAX_VALUE (and logged).
   *
   * @param code
   *        Application error code.
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool stop_sending(app_error_code_t code);

  /**
   * Returns the QUIC stream ID; or 0 if in NULL state.
   * @return See above.
   */
  stream_id_t id() const;

  /**
   * Returns nickname, a brief string suitable for logging.  This is included in the output by the `ostream<<`
   * operator as well.  This method is thread-safe in that it always returns the same value.
   *
   * If this object is in NULL state, returns the empty string.
   *
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Returns the QUIC engine's original code behind the error emitted by poll_data(), if any; else falsy.
   * Also falsy if in NULL state.
   *
   * @return See above.
   */
  Error_code transport_cause() const;

  /**
   * Returns the number of bytes yielded so far, which is the stream offset of the next byte to yield; or 0 if
   * in NULL state.
   *
   * @return See above.
   */
  Reorder_buffer::offset_t offset() const;

  /**
   * Returns the number of chunks received ahead of a gap and stored pending its filling; or 0 if in NULL state.
   * @return See above.
   */
  size_t buffered_chunk_count() const;

private:
  // Types.

  /// Short-hand for the pImpl-lite impl type.  This is the reason for the existence of Recv_stream.
  using Impl = detail::Recv_stream_impl<Quic_stream>;

  // Friends.

  /// Friend of Recv_stream.
  template<typename Quic_recv_stream_handle2>
  friend std::ostream& operator<<(std::ostream& os, const Recv_stream<Quic_recv_stream_handle2>& val);

  // Data.

  /// The true implementation of this class, or null if in NULL state.
  boost::movelib::unique_ptr<Impl> m_impl;
}; // class Recv_stream

// Free functions: in *_fwd.hpp.

// Template implementations (strict pImpl-idiom style (albeit pImpl-lite due to template-ness)).

// The performant move semantics we get delightfully free with pImpl; they'll just move-to/from the unique_ptr m_impl.

template<typename Quic_recv_stream_handle>
Recv_stream<Quic_recv_stream_handle>::Recv_stream(Recv_stream&&) = default;
template<typename Quic_recv_stream_handle>
Recv_stream<Quic_recv_stream_handle>& Recv_stream<Quic_recv_stream_handle>::operator=(Recv_stream&&) = default;

// The NULL state ctor comports with how null m_impl is treated all over below.
template<typename Quic_recv_stream_handle>
Recv_stream<Quic_recv_stream_handle>::Recv_stream() = default;

// The rest is strict forwarding to m_impl, once PEER state is established (non-null m_impl).

template<typename Quic_recv_stream_handle>
Recv_stream<Quic_recv_stream_handle>::Recv_stream(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                                  Quic_stream&& stream) :
  m_impl(boost::movelib::make_unique<Impl>(logger_ptr, nickname_str, std::move(stream)))
{
  // Yay.
}

// It's only explicitly defined to formally document it.
template<typename Quic_recv_stream_handle>
Recv_stream<Quic_recv_stream_handle>::~Recv_stream() = default;

template<typename Quic_recv_stream_handle>
bool Recv_stream<Quic_recv_stream_handle>::poll_data(const util::sync_io::Task_ptr& on_active_ev_func,
                                                     std::optional<util::Blob>* data, Error_code* err_code)
{
  return m_impl ? (m_impl->poll_data(on_active_ev_func, data, err_code), true)
                : false;
}

template<typename Quic_recv_stream_handle>
bool Recv_stream<Quic_recv_stream_handle>::stop_sending(app_error_code_t code)
{
  return m_impl ? (m_impl->stop_sending(code), true)
                : false;
}

template<typename Quic_recv_stream_handle>
stream_id_t Recv_stream<Quic_recv_stream_handle>::id() const
{
  return m_impl ? m_impl->id() : 0;
}

template<typename Quic_recv_stream_handle>
const std::string& Recv_stream<Quic_recv_stream_handle>::nickname() const
{
  return m_impl ? m_impl->nickname() : util::EMPTY_STRING;
}

template<typename Quic_recv_stream_handle>
Error_code Recv_stream<Quic_recv_stream_handle>::transport_cause() const
{
  return m_impl ? m_impl->transport_cause() : Error_code();
}

template<typename Quic_recv_stream_handle>
Reorder_buffer::offset_t Recv_stream<Quic_recv_stream_handle>::offset() const
{
  return m_impl ? m_impl->offset() : 0;
}

template<typename Quic_recv_stream_handle>
size_t Recv_stream<Quic_recv_stream_handle>::buffered_chunk_count() const
{
  return m_impl ? m_impl->buffered_chunk_count() : 0;
}

// `friend`ship needed for this "non-method method":

template<typename Quic_recv_stream_handle>
std::ostream& operator<<(std::ostream& os, const Recv_stream<Quic_recv_stream_handle>& val)
{
  if (val.m_impl)
  {
    return os << *val.m_impl;
  }
  // else
  return os << "null";
}

} // namespace h3q::transport
