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

#include "h3q/transport/detail/connection_impl.hpp"
#include <boost/move/make_unique.hpp>

namespace h3q::transport
{

// Types.

/**
 * One QUIC connection, as the HTTP/3 protocol layer sees it: a non-blocking source of streams, both those the
 * opposing side opens (accept) and those we open (open), bidirectional and unidirectional.  The resulting stream
 * adapters (Bidi_stream, Recv_stream, Send_stream) are then used independently of `*this` (though of course they
 * fail if the connection does).
 *
 * ### Use ###
 * Construct it from the QUIC engine's connection handle and its two sources of incoming streams, once the QUIC
 * handshake is complete.  Then, per the `sync_io` pattern (util::sync_io doc header), poll:
 *   - poll_accept_bidi_stream(): next bidirectional stream opened by the opposing side (e.g., a request stream,
 *     if we are the server); or `nullopt` if there shall be no more.
 *   - poll_accept_recv_stream(): next unidirectional stream opened by the opposing side (e.g., its control stream).
 *   - poll_open_bidi_stream(): open a bidirectional stream (e.g., a request stream, if we are the client).
 *   - poll_open_send_stream(): open a unidirectional stream (e.g., our control stream).
 *
 * Each of these may be polled concurrently with the others (in the `sync_io` sense: interleaved, from one thread):
 * they are independent.
 *
 * ### Opening ###
 * QUIC limits the number of streams each side may open; the opposing side raises the limit over time.  So an open
 * may have to wait (would-block).  Each direction has at most one open in flight: polling again while it is
 * would-blocked resumes that same open rather than starting another; once it completes (successfully or not), the
 * next poll starts a new one.  So to open N streams, poll until success N times.
 *
 * ### Errors ###
 * All failures here are connection-level (error::Code::S_CONNECTION_LOST, error::Code::S_CONNECTION_CLOSED,
 * error::Code::S_CONNECTION_TIMED_OUT).  Once one is emitted, every subsequent poll (of any kind) emits the same,
 * without touching the QUIC engine.  transport_cause() has the engine's original code.
 *
 * ### NULL state ###
 * A default-constructed Connection is in NULL state; so is a moved-from one.  In this state all the methods that
 * return `bool` return `false` and no-op; the accessors return default values.
 *
 * ### Thread safety ###
 * The usual: concurrent non-`const` access to one object is not safe.
 *
 * @tparam Quic_connection_handle
 *         Type implementing the quic::Quic_connection_handle concept.  See quic_concepts.hpp.
 */
template<typename Quic_connection_handle>
class Connection
{
private:
  // Types.

  /// Short-hand for the pImpl-lite impl type.  This is the reason for the existence of Connection.
  using Impl = detail::Connection_impl<Quic_connection_handle>;

public:
  // Types.

  /// Short-hand for template parameter.
  using Quic_connection = Quic_connection_handle;

  /// Short-hand for the engine's source of incoming bidirectional streams.
  using Incoming_bidi_streams = typename Impl::Incoming_bidi_streams;

  /// Short-hand for the engine's source of incoming unidirectional streams.
  using Incoming_uni_streams = typename Impl::Incoming_uni_streams;

  /// The bidirectional stream adapter type yielded by `*this`.
  using Bidi = typename Impl::Bidi;

  /// The send-only stream adapter type yielded by `*this`.
  using Send = typename Impl::Send;

  /// The receive-only stream adapter type yielded by `*this`.
  using Recv = typename Impl::Recv;

  // Constructors/destructor.

  /// Constructs object in NULL state.
  Connection();

  /**
   * Constructs object adopting the given QUIC connection.  Nothing is accepted or opened until the user polls.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  The stream adapters created subsequently shall use it as well.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.  The stream adapters' nicknames are derived from it.
   * @param conn
   *        The QUIC connection handle.  Becomes unusable (moved-from).
   * @param incoming_bidi
   *        The QUIC connection's source of bidirectional streams opened by the opposing side.  Becomes unusable
   *        (moved-from).
   * @param incoming_uni
   *        The QUIC connection's source of unidirectional streams opened by the opposing side.  Becomes unusable
   *        (moved-from).
   */
  explicit Connection(flow::log::Logger* logger_ptr, util::String_view nickname_str, Quic_connection&& conn,
                      Incoming_bidi_streams&& incoming_bidi, Incoming_uni_streams&& incoming_uni);

  /**
   * Move-constructs from `src`; `src` becomes as-if default-cted (therefore in NULL state).
   *
   * @param src
   *        See above.
   */
  Connection(Connection&& src);

  /// Copy construction is disallowed.
  Connection(const Connection&) = delete;

  /**
   * Releases the QUIC connection (if not in NULL state), abandoning any in-flight opens.  Stream adapters obtained
   * earlier remain valid objects; what happens to their streams is up to the QUIC engine.
   */
  ~Connection();

  // Methods.

  /**
   * Move-assigns from `src`; `*this` acts as if destructed; `src` becomes as-if default-cted (therefore in NULL state).
   *
   * @param src
   *        See above.
   * @return `*this`.
   */
  Connection& operator=(Connection&& src);

  /// Copy assignment is disallowed.
  Connection& operator=(const Connection&) = delete;

  /**
   * Non-blockingly obtains the next bidirectional stream opened by the opposing side.
   *
   * Outcomes: success with `*stream` set to the new stream; success with `*stream` set to `nullopt` (the opposing
   * side shall open no more, as the connection is closing cleanly); would-block (`*stream` untouched); error
   * (`*stream` untouched).
   *
   * @param on_active_ev_func
   *        Wake-up to be retained by the QUIC engine if would-block.
   * @param stream
   *        See above.  Not null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SYNC_IO_WOULD_BLOCK, error::Code::S_CONNECTION_LOST, error::Code::S_CONNECTION_CLOSED,
   *        error::Code::S_CONNECTION_TIMED_OUT.
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool poll_accept_bidi_stream(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Bidi>* stream,
                               Error_code* err_code = 0);

  /**
   * Non-blockingly opens a bidirectional stream: starts an open, unless one is in flight already, and checks whether
   * it has completed.
   *
   * Outcomes: success with `*stream` set to the new stream; would-block (the open remains in flight; `*stream`
   * untouched); error (`*stream` untouched).
   *
   * @param on_active_ev_func
   *        Wake-up to be retained by the QUIC engine if would-block.
   * @param stream
   *        See above.  Not null.
   * @param err_code
   *        See poll_accept_bidi_stream().
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool poll_open_bidi_stream(const util::sync_io::Task_ptr& on_active_ev_func, Bidi* stream,
                             Error_code* err_code = 0);

  /**
   * Exactly like poll_accept_bidi_stream() but for unidirectional streams (opened by the opposing side, so
   * receive-only for us).
   *
   * @param on_active_ev_func
   *        See poll_accept_bidi_stream().
   * @param stream
   *        See poll_accept_bidi_stream().
   * @param err_code
   *        See poll_accept_bidi_stream().
   * @return See poll_accept_bidi_stream().
   */
  bool poll_accept_recv_stream(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Recv>* stream,
                               Error_code* err_code = 0);

  /**
   * Exactly like poll_open_bidi_stream() but for unidirectional streams (opened by us, so send-only for us).
   * The in-flight open of this kind is independent of that of poll_open_bidi_stream().
   *
   * @param on_active_ev_func
   *        See poll_open_bidi_stream().
   * @param stream
   *        See poll_open_bidi_stream().
   * @param err_code
   *        See poll_open_bidi_stream().
   * @return See poll_open_bidi_stream().
   */
  bool poll_open_send_stream(const util::sync_io::Task_ptr& on_active_ev_func, Send* stream,
                             Error_code* err_code = 0);

  /**
   * Immediately closes the QUIC connection, telling the opposing side the given application error code and reason.
   * Subsequent polls on `*this` and on the connection's streams fail.  A `code` beyond the QUIC varint range is
   * clamped to quic::Var_int::S_MAX_VALUE (and logged).
   *
   * @param code
   *        Application error code.
   * @param reason
   *        Reason phrase (may be empty).
   * @return `false` if and only if `*this` is in NULL state.
   */
  bool close(app_error_code_t code, util::String_view reason);

  /**
   * Returns `true` if and only if a poll_open_bidi_stream() would-blocked, and the open is still in flight.
   * @return See above.
   */
  bool opening_bidi_stream() const;

  /**
   * Returns `true` if and only if a poll_open_send_stream() would-blocked, and the open is still in flight.
   * @return See above.
   */
  bool opening_send_stream() const;

  /**
   * Returns nickname, a brief string suitable for logging.  If this object is in NULL state, returns the empty
   * string.
   *
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Returns the QUIC engine's original code behind the error emitted by a poll, if any; else falsy.
   * Also falsy if in NULL state.
   *
   * @return See above.
   */
  Error_code transport_cause() const;

private:
  // Friends.

  /// Friend of Connection.
  template<typename Quic_connection_handle2>
  friend std::ostream& operator<<(std::ostream& os, const Connection<Quic_connection_handle2>& val);

  // Data.

  /// The true implementation of this class, or null if in NULL state.
  boost::movelib::unique_ptr<Impl> m_impl;
}; // class Connection

// Free functions: in *_fwd.hpp.

// Template implementations (strict pImpl-idiom style (albeit pImpl-lite due to template-ness)).

template<typename Quic_connection_handle>
Connection<Quic_connection_handle>::Connection(Connection&&) = default;
template<typename Quic_connection_handle>
Connection<Quic_connection_handle>& Connection<Quic_connection_handle>::operator=(Connection&&) = default;

template<typename Quic_connection_handle>
Connection<Quic_connection_handle>::Connection() = default;

template<typename Quic_connection_handle>
Connection<Quic_connection_handle>::Connection(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                               Quic_connection&& conn, Incoming_bidi_streams&& incoming_bidi,
                                               Incoming_uni_streams&& incoming_uni) :
  m_impl(boost::movelib::make_unique<Impl>(logger_ptr, nickname_str, std::move(conn),
                                           std::move(incoming_bidi), std::move(incoming_uni)))
{
  // Yay.
}

template<typename Quic_connection_handle>
Connection<Quic_connection_handle>::~Connection() = default;

template<typename Quic_connection_handle>
bool Connection<Quic_connection_handle>::poll_accept_bidi_stream(const util::sync_io::Task_ptr& on_active_ev_func,
                                                                 std::optional<Bidi>* stream, Error_code* err_code)
{
  return m_impl ? (m_impl->poll_accept_bidi_stream(on_active_ev_func, stream, err_code), true)
                : false;
}

template<typename Quic_connection_handle>
bool Connection<Quic_connection_handle>::poll_open_bidi_stream(const util::sync_io::Task_ptr& on_active_ev_func,
                                                               Bidi* stream, Error_code* err_code)
{
  return m_impl ? (m_impl->poll_open_bidi_stream(on_active_ev_func, stream, err_code), true)
                : false;
}

template<typename Quic_connection_handle>
bool Connection<Quic_connection_handle>::poll_accept_recv_stream(const util::sync_io::Task_ptr& on_active_ev_func,
                                                                 std::optional<Recv>* stream, Error_code* err_code)
{
  return m_impl ? (m_impl->poll_accept_recv_stream(on_active_ev_func, stream, err_code), true)
                : false;
}

template<typename Quic_connection_handle>
bool Connection<Quic_connection_handle>::poll_open_send_stream(const util::sync_io::Task_ptr& on_active_ev_func,
                                                               Send* stream, Error_code* err_code)
{
  return m_impl ? (m_impl->poll_open_send_stream(on_active_ev_func, stream, err_code), true)
                : false;
}

template<typename Quic_connection_handle>
bool Connection<Quic_connection_handle>::close(app_error_code_t code, util::String_view reason)
{
  return m_impl ? (m_impl->close(code, reason), true)
                : false;
}

template<typename Quic_connection_handle>
bool Connection<Quic_connection_handle>::opening_bidi_stream() const
{
  return m_impl ? m_impl->opening_bidi_stream() : false;
}

template<typename Quic_connection_handle>
bool Connection<Quic_connection_handle>::opening_send_stream() const
{
  return m_impl ? m_impl->opening_send_stream() : false;
}

template<typename Quic_connection_handle>
const std::string& Connection<Quic_connection_handle>::nickname() const
{
  return m_impl ? m_impl->nickname() : util::EMPTY_STRING;
}

template<typename Quic_connection_handle>
Error_code Connection<Quic_connection_handle>::transport_cause() const
{
  return m_impl ? m_impl->transport_cause() : Error_code();
}

template<typename Quic_connection_handle>
std::ostream& operator<<(std::ostream& os, const Connection<Quic_connection_handle>& val)
{
  if (val.m_impl)
  {
    return os << *val.m_impl;
  }
  // else
  return os << "null";
}

} // namespace h3q::transport
