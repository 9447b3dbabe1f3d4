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

#include "h3q/transport/bidi_stream.hpp"
#include "h3q/transport/error.hpp"
#include "h3q/transport/error_mapping.hpp"
#include "h3q/util/sync_io/sync_io_fwd.hpp"
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/noncopyable.hpp>
#include <optional>
#include <utility>

namespace h3q::transport::detail
{

// Types.

/**
 * Internal, non-movable pImpl-lite implementation of Connection class template.
 *
 * @see All discussion of the public API is in Connection doc header; that class template forwards to this one.
 *
 * ### Impl design ###
 * Accepting is a straight poll of the corresponding incoming-streams source, plus wrapping whatever it yields.
 *
 * Opening is stateful: the QUIC engine's open op is an object that must survive across would-blocks (it may hold a
 * place in the engine's queue of opens awaiting stream-limit credit).  So for each direction there is one slot,
 * #m_opening_bidi and #m_opening_uni.  A poll creates an op in the slot only if the slot is empty; then polls the
 * op; on completion (success or failure) empties the slot.  Therefore no matter how many times the user polls while
 * would-blocked, exactly one open is in flight per direction; and once it completes, the next poll starts a new one.
 *
 * Connection-level errors are terminal: the first one is saved in #m_pending_err_code, and every subsequent poll (of
 * any kind) emits it without touching the engine.
 *
 * @tparam Quic_connection_handle
 *         See Connection.
 */
template<typename Quic_connection_handle>
class Connection_impl :
  public flow::log::Log_context,
  private boost::noncopyable // And non-movable.
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Quic_connection = Quic_connection_handle;

  /// Short-hand for the engine's send-direction stream handle type.
  using Quic_send_stream = typename Quic_connection::Send_stream_handle;

  /// Short-hand for the engine's receive-direction stream handle type.
  using Quic_recv_stream = typename Quic_connection::Recv_stream_handle;

  /// Short-hand for the engine's source of incoming bidirectional streams.
  using Incoming_bidi_streams = typename Quic_connection::Incoming_bidi_streams;

  /// Short-hand for the engine's source of incoming unidirectional streams.
  using Incoming_uni_streams = typename Quic_connection::Incoming_uni_streams;

  /// What the engine yields for one bidirectional stream.
  using Quic_bidi_streams = std::pair<Quic_send_stream, Quic_recv_stream>;

  /// See Connection.
  using Bidi = Bidi_stream<Quic_send_stream, Quic_recv_stream>;

  /// See Connection.
  using Send = Send_stream<Quic_send_stream>;

  /// See Connection.
  using Recv = Recv_stream<Quic_recv_stream>;

  // Constructors/destructor.

  /**
   * See Connection counterpart.
   *
   * @param logger_ptr
   *        See Connection counterpart.
   * @param nickname_str
   *        See Connection counterpart.
   * @param conn
   *        See Connection counterpart.
   * @param incoming_bidi
   *        See Connection counterpart.
   * @param incoming_uni
   *        See Connection counterpart.
   */
  explicit Connection_impl(flow::log::Logger* logger_ptr, util::String_view nickname_str, Quic_connection&& conn,
                           Incoming_bidi_streams&& incoming_bidi, Incoming_uni_streams&& incoming_uni);

  /// See Connection counterpart.
  ~Connection_impl();

  // Methods.

  /**
   * See Connection counterpart.
   *
   * @param on_active_ev_func
   *        See Connection counterpart.
   * @param stream
   *        See Connection counterpart.
   * @param err_code
   *        See Connection counterpart.
   */
  void poll_accept_bidi_stream(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Bidi>* stream,
                               Error_code* err_code);

  /**
   * See Connection counterpart.
   *
   * @param on_active_ev_func
   *        See Connection counterpart.
   * @param stream
   *        See Connection counterpart.
   * @param err_code
   *        See Connection counterpart.
   */
  void poll_open_bidi_stream(const util::sync_io::Task_ptr& on_active_ev_func, Bidi* stream, Error_code* err_code);

  /**
   * See Connection counterpart.
   *
   * @param on_active_ev_func
   *        See Connection counterpart.
   * @param stream
   *        See Connection counterpart.
   * @param err_code
   *        See Connection counterpart.
   */
  void poll_accept_recv_stream(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Recv>* stream,
                               Error_code* err_code);

  /**
   * See Connection counterpart.
   *
   * @param on_active_ev_func
   *        See Connection counterpart.
   * @param stream
   *        See Connection counterpart.
   * @param err_code
   *        See Connection counterpart.
   */
  void poll_open_send_stream(const util::sync_io::Task_ptr& on_active_ev_func, Send* stream, Error_code* err_code);

  /**
   * See Connection counterpart.
   *
   * @param code
   *        See Connection counterpart.
   * @param reason
   *        See Connection counterpart.
   */
  void close(app_error_code_t code, util::String_view reason);

  /**
   * See Connection counterpart.
   * @return See above.
   */
  bool opening_bidi_stream() const;

  /**
   * See Connection counterpart.
   * @return See above.
   */
  bool opening_send_stream() const;

  /**
   * See Connection counterpart.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * See Connection counterpart.
   * @return See above.
   */
  const Error_code& transport_cause() const;

private:
  // Methods.

  /**
   * Returns the nickname for a new stream adapter on this connection.
   *
   * @param id
   *        QUIC stream ID.
   * @return See above.
   */
  std::string stream_nickname(stream_id_t id) const;

  /**
   * If a connection-level error was emitted earlier, emits it again and returns `true`; else returns `false`.
   *
   * @param context
   *        What is being attempted, for logging.
   * @param err_code
   *        Not null.
   * @return See above.
   */
  bool emit_pending_error(util::String_view context, Error_code* err_code) const;

  /**
   * Records a failure reported by the QUIC engine for a connection-level op and emits it.  The connection is terminal
   * thereafter.
   *
   * @param native_err_code
   *        Truthy, non-would-block code from the QUIC engine.
   * @param context
   *        What was being attempted, for logging.
   * @param err_code
   *        Not null.
   */
  void on_connection_error(const Error_code& native_err_code, util::String_view context, Error_code* err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The engine's connection handle.
  Quic_connection m_conn;

  /// Source of bidirectional streams opened by the opposing side.
  Incoming_bidi_streams m_incoming_bidi;

  /// Source of unidirectional streams opened by the opposing side.
  Incoming_uni_streams m_incoming_uni;

  /// The in-flight bidirectional-stream open; or `nullopt` if none.
  std::optional<typename Quic_connection::Open_bidi_op> m_opening_bidi;

  /// The in-flight unidirectional-stream open; or `nullopt` if none.
  std::optional<typename Quic_connection::Open_uni_op> m_opening_uni;

  /// Falsy, or the mapped connection-level error already emitted, to be emitted by any subsequent poll.  Terminal.
  Error_code m_pending_err_code;

  /// See transport_cause().
  Error_code m_transport_cause;
}; // class Connection_impl

// Free functions.

/**
 * Prints string representation of the given Connection_impl to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Quic_connection_handle>
std::ostream& operator<<(std::ostream& os, const Connection_impl<Quic_connection_handle>& val);

// Template implementations.

template<typename Quic_connection_handle>
Connection_impl<Quic_connection_handle>::Connection_impl(flow::log::Logger* logger_ptr,
                                                         util::String_view nickname_str, Quic_connection&& conn,
                                                         Incoming_bidi_streams&& incoming_bidi,
                                                         Incoming_uni_streams&& incoming_uni) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_conn(std::move(conn)),
  m_incoming_bidi(std::move(incoming_bidi)),
  m_incoming_uni(std::move(incoming_uni))
{
  FLOW_LOG_INFO("Connection [" << *this << "]: Created.");
}

template<typename Quic_connection_handle>
Connection_impl<Quic_connection_handle>::~Connection_impl()
{
  FLOW_LOG_INFO("Connection [" << *this << "]: Shutting down.  Abandoning in-flight opens: "
                "bidi? = [" << bool(m_opening_bidi) << "]; uni? = [" << bool(m_opening_uni) << "].");
}

template<typename Quic_connection_handle>
void Connection_impl<Quic_connection_handle>::poll_accept_bidi_stream
       (const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Bidi>* stream, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { poll_accept_bidi_stream(on_active_ev_func, stream, actual_err_code); },
         err_code, "Connection::poll_accept_bidi_stream()"))
  {
    return;
  }
  // else

  assert(stream);

  if (emit_pending_error("accept bidi stream", err_code))
  {
    return;
  }
  // else

  std::optional<Quic_bidi_streams> handles;
  Error_code native_err_code;
  m_incoming_bidi.poll_next(on_active_ev_func, &handles, &native_err_code);

  if (native_err_code == error::Code::S_SYNC_IO_WOULD_BLOCK)
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Accept bidi stream: would-block.");
    *err_code = native_err_code;
    return;
  }
  // else

  if (native_err_code)
  {
    on_connection_error(native_err_code, "accept bidi stream", err_code);
    return;
  }
  // else

  if (!handles)
  {
    FLOW_LOG_INFO("Connection [" << *this << "]: Accept bidi stream: Opposing side shall open no more.");
    stream->reset();
    err_code->clear();
    return;
  }
  // else

  const auto id = handles->first.id();
  FLOW_LOG_INFO("Connection [" << *this << "]: Accepted bidi stream ID [" << id << "].");
  stream->emplace(get_logger(), stream_nickname(id), std::move(handles->first), std::move(handles->second));
  err_code->clear();
} // Connection_impl::poll_accept_bidi_stream()

template<typename Quic_connection_handle>
void Connection_impl<Quic_connection_handle>::poll_open_bidi_stream
       (const util::sync_io::Task_ptr& on_active_ev_func, Bidi* stream, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { poll_open_bidi_stream(on_active_ev_func, stream, actual_err_code); },
         err_code, "Connection::poll_open_bidi_stream()"))
  {
    return;
  }
  // else

  assert(stream);

  if (emit_pending_error("open bidi stream", err_code))
  {
    return;
  }
  // else

  if (m_opening_bidi)
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Open bidi stream: Resuming in-flight open.");
  }
  else
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Open bidi stream: Starting new open.");
    m_opening_bidi.emplace(m_conn.open_bidi());
  }

  std::optional<Quic_bidi_streams> handles;
  Error_code native_err_code;
  m_opening_bidi->poll(on_active_ev_func, &handles, &native_err_code);

  if (native_err_code == error::Code::S_SYNC_IO_WOULD_BLOCK)
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Open bidi stream: would-block; keeping open in flight.");
    *err_code = native_err_code;
    return;
  }
  // else: Done, one way or the other; the next poll shall start a new open.
  m_opening_bidi.reset();

  if (native_err_code)
  {
    on_connection_error(native_err_code, "open bidi stream", err_code);
    return;
  }
  // else

  assert(handles && "QUIC engine open op must yield result on success.");

  const auto id = handles->first.id();
  FLOW_LOG_INFO("Connection [" << *this << "]: Opened bidi stream ID [" << id << "].");
  *stream = Bidi(get_logger(), stream_nickname(id), std::move(handles->first), std::move(handles->second));
  err_code->clear();
} // Connection_impl::poll_open_bidi_stream()

template<typename Quic_connection_handle>
void Connection_impl<Quic_connection_handle>::poll_accept_recv_stream
       (const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Recv>* stream, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { poll_accept_recv_stream(on_active_ev_func, stream, actual_err_code); },
         err_code, "Connection::poll_accept_recv_stream()"))
  {
    return;
  }
  // else

  assert(stream);

  if (emit_pending_error("accept uni stream", err_code))
  {
    return;
  }
  // else

  std::optional<Quic_recv_stream> handle;
  Error_code native_err_code;
  m_incoming_uni.poll_next(on_active_ev_func, &handle, &native_err_code);

  if (native_err_code == error::Code::S_SYNC_IO_WOULD_BLOCK)
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Accept uni stream: would-block.");
    *err_code = native_err_code;
    return;
  }
  // else

  if (native_err_code)
  {
    on_connection_error(native_err_code, "accept uni stream", err_code);
    return;
  }
  // else

  if (!handle)
  {
    FLOW_LOG_INFO("Connection [" << *this << "]: Accept uni stream: Opposing side shall open no more.");
    stream->reset();
    err_code->clear();
    return;
  }
  // else

  const auto id = handle->id();
  FLOW_LOG_INFO("Connection [" << *this << "]: Accepted uni stream ID [" << id << "].");
  stream->emplace(get_logger(), stream_nickname(id), std::move(*handle));
  err_code->clear();
} // Connection_impl::poll_accept_recv_stream()

template<typename Quic_connection_handle>
void Connection_impl<Quic_connection_handle>::poll_open_send_stream
       (const util::sync_io::Task_ptr& on_active_ev_func, Send* stream, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { poll_open_send_stream(on_active_ev_func, stream, actual_err_code); },
         err_code, "Connection::poll_open_send_stream()"))
  {
    return;
  }
  // else

  assert(stream);

  if (emit_pending_error("open uni stream", err_code))
  {
    return;
  }
  // else

  if (m_opening_uni)
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Open uni stream: Resuming in-flight open.");
  }
  else
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Open uni stream: Starting new open.");
    m_opening_uni.emplace(m_conn.open_uni());
  }

  std::optional<Quic_send_stream> handle;
  Error_code native_err_code;
  m_opening_uni->poll(on_active_ev_func, &handle, &native_err_code);

  if (native_err_code == error::Code::S_SYNC_IO_WOULD_BLOCK)
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Open uni stream: would-block; keeping open in flight.");
    *err_code = native_err_code;
    return;
  }
  // else
  m_opening_uni.reset();

  if (native_err_code)
  {
    on_connection_error(native_err_code, "open uni stream", err_code);
    return;
  }
  // else

  assert(handle && "QUIC engine open op must yield result on success.");

  const auto id = handle->id();
  FLOW_LOG_INFO("Connection [" << *this << "]: Opened uni stream ID [" << id << "].");
  *stream = Send(get_logger(), stream_nickname(id), std::move(*handle));
  err_code->clear();
} // Connection_impl::poll_open_send_stream()

template<typename Quic_connection_handle>
void Connection_impl<Quic_connection_handle>::close(app_error_code_t code, util::String_view reason)
{
  const auto quic_code = error_mapping::app_error_code_to_var_int(get_logger(), code, "connection close");

  FLOW_LOG_INFO("Connection [" << *this << "]: Closing with application code [" << quic_code << "] and reason "
                "[" << reason << "].");
  m_conn.close(quic_code, util::Blob_const(reason.data(), reason.size()));
}

template<typename Quic_connection_handle>
bool Connection_impl<Quic_connection_handle>::emit_pending_error(util::String_view context,
                                                                 Error_code* err_code) const
{
  if (!m_pending_err_code)
  {
    return false;
  }
  // else

  FLOW_LOG_TRACE("Connection [" << *this << "]: Wanted to [" << context << "], but connection failed earlier; "
                 "emitting [" << m_pending_err_code << "] [" << m_pending_err_code.message() << "] again.");
  *err_code = m_pending_err_code;
  return true;
}

template<typename Quic_connection_handle>
void Connection_impl<Quic_connection_handle>::on_connection_error(const Error_code& native_err_code,
                                                                  util::String_view context, Error_code* err_code)
{
  m_transport_cause = native_err_code;
  m_pending_err_code = error_mapping::map_connection_error(native_err_code);

  FLOW_LOG_WARNING("Connection [" << *this << "]: Wanted to [" << context << "], but QUIC engine reported native "
                   "error [" << native_err_code << "] [" << native_err_code.message() << "]; emitting "
                   "[" << m_pending_err_code << "] [" << m_pending_err_code.message() << "] now and on any "
                   "subsequent poll; timeout? = [" << error_mapping::is_timeout(m_pending_err_code) << "].");

  *err_code = m_pending_err_code;
}

template<typename Quic_connection_handle>
std::string Connection_impl<Quic_connection_handle>::stream_nickname(stream_id_t id) const
{
  return flow::util::ostream_op_string(m_nickname, "/s", id);
}

template<typename Quic_connection_handle>
bool Connection_impl<Quic_connection_handle>::opening_bidi_stream() const
{
  return bool(m_opening_bidi);
}

template<typename Quic_connection_handle>
bool Connection_impl<Quic_connection_handle>::opening_send_stream() const
{
  return bool(m_opening_uni);
}

template<typename Quic_connection_handle>
const std::string& Connection_impl<Quic_connection_handle>::nickname() const
{
  return m_nickname;
}

template<typename Quic_connection_handle>
const Error_code& Connection_impl<Quic_connection_handle>::transport_cause() const
{
  return m_transport_cause;
}

template<typename Quic_connection_handle>
std::ostream& operator<<(std::ostream& os, const Connection_impl<Quic_connection_handle>& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace h3q::transport::detail
