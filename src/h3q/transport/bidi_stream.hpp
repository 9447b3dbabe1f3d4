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

#include "h3q/transport/send_stream.hpp"
#include "h3q/transport/recv_stream.hpp"
#include <utility>

namespace h3q::transport
{

// Types.

/**
 * A bidirectional QUIC stream, as the HTTP/3 protocol layer sees it: a Send_stream and a Recv_stream on the same
 * stream ID, used together (e.g., a request stream) or split() into the two and used independently.  A Bidi_stream
 * is obtained from Connection::poll_accept_bidi_stream() or Connection::poll_open_bidi_stream().
 *
 * Every method forwards to one of the two halves, so its semantics are documented there; the two directions are
 * independent (e.g., reset() does not affect poll_data()).
 *
 * ### NULL state ###
 * A default-constructed Bidi_stream is in NULL state; so is a moved-from one; and so is one that has been split().
 * In this state all the methods that return `bool` return `false` and no-op; the accessors return default values.
 *
 * @tparam Quic_send_stream_handle
 *         See Send_stream.
 * @tparam Quic_recv_stream_handle
 *         See Recv_stream.
 */
template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
class Bidi_stream
{
public:
  // Types.

  /// The sending half's type.
  using Send_half = Send_stream<Quic_send_stream_handle>;

  /// The receiving half's type.
  using Recv_half = Recv_stream<Quic_recv_stream_handle>;

  // Constructors/destructor.

  /// Constructs object in NULL state.
  Bidi_stream();

  /**
   * Constructs object adopting the two directions of one QUIC stream.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.  Both halves get it.
   * @param send_stream
   *        The QUIC stream handle, send direction.  Becomes unusable (moved-from).
   * @param recv_stream
   *        The QUIC stream handle, receive direction.  Becomes unusable (moved-from).
   */
  explicit Bidi_stream(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                       Quic_send_stream_handle&& send_stream, Quic_recv_stream_handle&& recv_stream);

  /**
   * Move-constructs from `src`; `src` becomes as-if default-cted (therefore in NULL state).
   *
   * @param src
   *        See above.
   */
  Bidi_stream(Bidi_stream&& src);

  /// Copy construction is disallowed.
  Bidi_stream(const Bidi_stream&) = delete;

  /// Destroys both halves (if not in NULL state).
  ~Bidi_stream();

  // Methods.

  /**
   * Move-assigns from `src`; `*this` acts as if destructed; `src` becomes as-if default-cted (therefore in NULL state).
   *
   * @param src
   *        See above.
   * @return `*this`.
   */
  Bidi_stream& operator=(Bidi_stream&& src);

  /// Copy assignment is disallowed.
  Bidi_stream& operator=(const Bidi_stream&) = delete;

  /**
   * Moves the two halves out, for independent use.  `*this` becomes as-if default-cted (therefore in NULL state).
   * If `*this` is in NULL state, both returned halves are as well.
   *
   * @return The sending half and the receiving half.
   */
  std::pair<Send_half, Recv_half> split();

  /**
   * See Recv_stream::poll_data().
   *
   * @param on_active_ev_func
   *        See Recv_stream::poll_data().
   * @param data
   *        See Recv_stream::poll_data().
   * @param err_code
   *        See Recv_stream::poll_data().
   * @return See Recv_stream::poll_data().
   */
  bool poll_data(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<util::Blob>* data,
                 Error_code* err_code = 0);

  /**
   * See Recv_stream::stop_sending().
   *
   * @param code
   *        See Recv_stream::stop_sending().
   * @return See Recv_stream::stop_sending().
   */
  bool stop_sending(app_error_code_t code);

  /**
   * See Send_stream::send_data().
   *
   * @param data
   *        See Send_stream::send_data().
   * @param err_code
   *        See Send_stream::send_data().
   * @return See Send_stream::send_data().
   */
  bool send_data(util::Blob&& data, Error_code* err_code = 0);

  /**
   * See Send_stream::poll_ready().
   *
   * @param on_active_ev_func
   *        See Send_stream::poll_ready().
   * @param err_code
   *        See Send_stream::poll_ready().
   * @return See Send_stream::poll_ready().
   */
  bool poll_ready(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code = 0);

  /**
   * See Send_stream::poll_finish().
   *
   * @param on_active_ev_func
   *        See Send_stream::poll_finish().
   * @param err_code
   *        See Send_stream::poll_finish().
   * @return See Send_stream::poll_finish().
   */
  bool poll_finish(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code = 0);

  /**
   * See Send_stream::reset().
   *
   * @param code
   *        See Send_stream::reset().
   * @return See Send_stream::reset().
   */
  bool reset(app_error_code_t code);

  /**
   * Returns the QUIC stream ID; or 0 if in NULL state.
   * @return See above.
   */
  stream_id_t id() const;

  /**
   * Returns nickname given to ctor; or the empty string if in NULL state.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Read-only access to the sending half.
   * @return See above.
   */
  const Send_half& send_half() const;

  /**
   * Read-only access to the receiving half.
   * @return See above.
   */
  const Recv_half& recv_half() const;

private:
  // Data.

  /// The sending half.  In NULL state if and only if #m_recv is.
  Send_half m_send;

  /// The receiving half.
  Recv_half m_recv;
}; // class Bidi_stream

// Free functions: in *_fwd.hpp.

// Template implementations.

// Move semantics, and the NULL state, come from the halves'.

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::Bidi_stream() = default;

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::Bidi_stream(Bidi_stream&&) = default;

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>&
  Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::operator=(Bidi_stream&&) = default;

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::Bidi_stream
  (flow::log::Logger* logger_ptr, util::String_view nickname_str,
   Quic_send_stream_handle&& send_stream, Quic_recv_stream_handle&& recv_stream) :
  m_send(logger_ptr, nickname_str, std::move(send_stream)),
  m_recv(logger_ptr, nickname_str, std::move(recv_stream))
{
  // Yay.
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::~Bidi_stream() = default;

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
std::pair<typename Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::Send_half,
          typename Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::Recv_half>
  Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::split()
{
  return { std::move(m_send), std::move(m_recv) };
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
bool Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::poll_data
       (const util::sync_io::Task_ptr& on_active_ev_func, std::optional<util::Blob>* data, Error_code* err_code)
{
  return m_recv.poll_data(on_active_ev_func, data, err_code);
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
bool Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::stop_sending(app_error_code_t code)
{
  return m_recv.stop_sending(code);
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
bool Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::send_data(util::Blob&& data,
                                                                              Error_code* err_code)
{
  return m_send.send_data(std::move(data), err_code);
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
bool Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::poll_ready
       (const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code)
{
  return m_send.poll_ready(on_active_ev_func, err_code);
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
bool Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::poll_finish
       (const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code)
{
  return m_send.poll_finish(on_active_ev_func, err_code);
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
bool Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::reset(app_error_code_t code)
{
  return m_send.reset(code);
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
stream_id_t Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::id() const
{
  return m_send.id();
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
const std::string& Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::nickname() const
{
  return m_send.nickname();
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
const typename Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::Send_half&
  Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::send_half() const
{
  return m_send;
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
const typename Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::Recv_half&
  Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>::recv_half() const
{
  return m_recv;
}

template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
std::ostream& operator<<(std::ostream& os,
                         const Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>& val)
{
  return os << "send=" << val.send_half() << " recv=" << val.recv_half();
}

} // namespace h3q::transport
