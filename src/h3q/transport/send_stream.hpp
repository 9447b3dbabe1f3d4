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

#include "h3q/transport/detail/send_stream_impl.hpp"
#include <boost/move/make_unique.hpp>

namespace h3q::transport
{

// Types.

/**
 * The sending direction of one QUIC stream, as the HTTP/3 protocol layer sees it: a non-blocking sink of byte
 * buffers, one at a time, ending in a finish (FIN) or a reset.  A Send_stream is obtained from
 * Connection::poll_open_send_stream() (a unidirectional stream we open) or by splitting a Bidi_stream.
 *
 * ### Use ###
 * At most one buffer is in flight at a time.  The protocol:
 *   -# poll_ready() until it succeeds (it does immediately if nothing is pending).
 *   -# send_data() to hand over the next buffer.  It does not touch the QUIC engine: it merely takes the buffer.
 *   -# Repeat.  poll_ready() writes the buffer into the engine, possibly in several partial writes across several
 *      calls (each would-block until the engine has room), and succeeds once it is all written.
 *
 * send_data() while a buffer is still pending is a usage error, reported as error::Code::S_SEND_NOT_READY without
 * harm to the stream: the new buffer is not taken; the pending one is unaffected.
 *
 * To end the stream cleanly, poll_finish() until it succeeds: it writes any pending buffer, marks the stream
 * finished, and waits for the opposing side to acknowledge all of it.  To end it abruptly, reset(): pending data are
 * discarded, and the opposing side is told the given application error code.
 *
 * ### Errors ###
 * Once a write or finish fails, the stream is hosed: the pending buffer is lost, and every later op emits the same
 * error without touching the QUIC engine.
 *
 * ### NULL state ###
 * A default-constructed Send_stream is in NULL state; so is a moved-from one.  In this state all the methods that
 * return `bool` return `false` and no-op; the accessors return default values.
 *
 * ### Thread safety ###
 * The usual: concurrent non-`const` access to one object is not safe.
 *
 * @tparam Quic_send_stream_handle
 *         Type implementing the quic::Quic_send_stream_handle concept.  See quic_concepts.hpp.
 */
template<typename Quic_send_stream_handle>
class Send_stream
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Quic_stream = Quic_send_stream_handle;

  // Constructors/destructor.

  /// Constructs object in NULL state.
  Send_stream();

  /**
   * Constructs object adopting the given QUIC stream (send direction), with nothing pending.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param stream
   *        The QUIC stream handle.  Becomes unusable (moved-from).
   */
  explicit Send_stream(flow::log::Logger* logger_ptr, util::String_view nickname_str, Quic_stream&& stream);

  /**
   * Move-constructs from `src`; `src` becomes as-if default-cted (therefore in NULL state).
   *
   * @param src
   *        See above.
   */
  Send_stream(Send_stream&& src);

  /// Copy construction is disallowed.
  Send_stream(const Send_stream&) = delete;

  /**
   * Releases the QUIC stream (if not in NULL state).  Any pending buffer is discarded.  If the stream was neither
   * finished nor reset, it is up to the QUIC engine what happens (typically a reset with code 0).
   */
  ~Send_stream();

  // Methods.

  /**
   * Move-assigns from `src`; `*this` acts as if destructed; `src` becomes as-if default-cted (therefore in NULL state).
   * No-op if `&src == this`.
   *
   * @param src
   *        See above.
   * @return `*this`.
   */
  Send_stream& operator=(Send_stream&& src);

  /// Copy assignment is disallowed.
  Send_stream& operator=(const Send_stream&) = delete;

  /**
   * Takes the given buffer for sending, if nothing is pending; else refuses it.  Does not touch the QUIC engine:
   * the buffer is written by subsequent poll_ready() or poll_finish().  An empty buffer is accepted and ignored.
   *
   * @param data
   *        The bytes.  On success becomes unspecified (moved-from); else untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SEND_NOT_READY (an earlier buffer is not yet fully written; stream unaffected),
   *        error::Code::S_SENDS_FINISHED_CANNOT_SEND (poll_finish() or reset() was called earlier),
   *        or the error emitted earlier by a failed poll_ready() or poll_finish().
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool send_data(util::Blob&& data, Error_code* err_code = 0);

  /**
   * Non-blockingly writes the pending buffer (if any) into the QUIC engine.  Succeeds once nothing is pending, so
   * send_data() may be called.
   *
   * @param on_active_ev_func
   *        Wake-up to be retained by the QUIC engine if would-block.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SYNC_IO_WOULD_BLOCK (bytes remain; call again once `(*on_active_ev_func)()` is invoked),
   *        error::Code::S_STREAM_STOPPED_BY_PEER, error::Code::S_CONNECTION_LOST,
   *        error::Code::S_CONNECTION_CLOSED, error::Code::S_CONNECTION_TIMED_OUT,
   *        error::Code::S_STREAM_WRITE_FAILED (any other QUIC engine failure).  The engine's original code is
   *        available via transport_cause().
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool poll_ready(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code = 0);

  /**
   * Non-blockingly finishes the stream: writes the pending buffer (if any), marks the stream finished, and succeeds
   * once the opposing side has acknowledged everything.  From the first call on, send_data() refuses.
   *
   * @param on_active_ev_func
   *        Wake-up to be retained by the QUIC engine if would-block.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: as for poll_ready();
   *        and error::Code::S_SENDS_FINISHED_CANNOT_SEND if reset() was called earlier.
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool poll_finish(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code = 0);

  /**
   * Abruptly terminates the stream: discards the pending buffer (if any) and has the QUIC engine tell the opposing
   * side the given application error code.  Best-effort: failure (e.g., the stream already ended) is logged and
   * otherwise ignored.  A `code` beyond the QUIC varint range is clamped to quic::Var_int::S_MAX_VALUE (and logged).
   *
   * @param code
   *        Application error code.
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool reset(app_error_code_t code);

  /**
   * Returns the QUIC stream ID; or 0 if in NULL state.
   * @return See above.
   */
  stream_id_t id() const;

  /**
   * Returns nickname, a brief string suitable for logging.  This is included in the output by the `ostream<<`
   * operator as well.  If this object is in NULL state, returns the empty string.
   *
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Returns the QUIC engine's original code behind the error emitted by poll_ready() or poll_finish(), if any;
   * else falsy.  Also falsy if in NULL state.
   *
   * @return See above.
   */
  Error_code transport_cause() const;

  /**
   * Returns how many bytes of the buffer given to send_data() remain to be written; or 0 if in NULL state.
   * @return See above.
   */
  size_t pending_byte_count() const;

private:
  // Types.

  /// Short-hand for the pImpl-lite impl type.  This is the reason for the existence of Send_stream.
  using Impl = detail::Send_stream_impl<Quic_stream>;

  // Friends.

  /// Friend of Send_stream.
  template<typename Quic_send_stream_handle2>
  friend std::ostream& operator<<(std::ostream& os, const Send_stream<Quic_send_stream_handle2>& val);

  // Data.

  /// The true implementation of this class, or null if in NULL state.
  boost::movelib::unique_ptr<Impl> m_impl;
}; // class Send_stream

// Free functions: in *_fwd.hpp.

// Template implementations (strict pImpl-idiom style (albeit pImpl-lite due to template-ness)).

template<typename Quic_send_stream_handle>
Send_stream<Quic_send_stream_handle>::Send_stream(Send_stream&&) = default;
template<typename Quic_send_stream_handle>
Send_stream<Quic_send_stream_handle>& Send_stream<Quic_send_stream_handle>::operator=(Send_stream&&) = default;

template<typename Quic_send_stream_handle>
Send_stream<Quic_send_stream_handle>::Send_stream() = default;

template<typename Quic_send_stream_handle>
Send_stream<Quic_send_stream_handle>::Send_stream(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                                  Quic_stream&& stream) :
  m_impl(boost::movelib::make_unique<Impl>(logger_ptr, nickname_str, std::move(stream)))
{
  // Yay.
}

template<typename Quic_send_stream_handle>
Send_stream<Quic_send_stream_handle>::~Send_stream() = default;

template<typename Quic_send_stream_handle>
bool Send_stream<Quic_send_stream_handle>::send_data(util::Blob&& data, Error_code* err_code)
{
  return m_impl ? (m_impl->send_data(std::move(data), err_code), true)
                : false;
}

template<typename Quic_send_stream_handle>
bool Send_stream<Quic_send_stream_handle>::poll_ready(const util::sync_io::Task_ptr& on_active_ev_func,
                                                      Error_code* err_code)
{
  return m_impl ? (m_impl->poll_ready(on_active_ev_func, err_code), true)
                : false;
}

template<typename Quic_send_stream_handle>
bool Send_stream<Quic_send_stream_handle>::poll_finish(const util::sync_io::Task_ptr& on_active_ev_func,
                                                       Error_code* err_code)
{
  return m_impl ? (m_impl->poll_finish(on_active_ev_func, err_code), true)
                : false;
}

template<typename Quic_send_stream_handle>
bool Send_stream<Quic_send_stream_handle>::reset(app_error_code_t code)
{
  return m_impl ? (m_impl->reset(code), true)
                : false;
}

template<typename Quic_send_stream_handle>
stream_id_t Send_stream<Quic_send_stream_handle>::id() const
{
  return m_impl ? m_impl->id() : 0;
}

template<typename Quic_send_stream_handle>
const std::string& Send_stream<Quic_send_stream_handle>::nickname() const
{
  return m_impl ? m_impl->nickname() : util::EMPTY_STRING;
}

template<typename Quic_send_stream_handle>
Error_code Send_stream<Quic_send_stream_handle>::transport_cause() const
{
  return m_impl ? m_impl->transport_cause() : Error_code();
}

template<typename Quic_send_stream_handle>
size_t Send_stream<Quic_send_stream_handle>::pending_byte_count() const
{
  return m_impl ? m_impl->pending_byte_count() : 0;
}

template<typename Quic_send_stream_handle>
std::ostream& operator<<(std::ostream& os, const Send_stream<Quic_send_stream_handle>& val)
{
  if (val.m_impl)
  {
    return os << *val.m_impl;
  }
  // else
  return os << "null";
}

} // namespace h3q::transport
