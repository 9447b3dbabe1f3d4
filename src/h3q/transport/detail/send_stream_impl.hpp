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
#include "h3q/transport/error.hpp"
#include "h3q/transport/error_mapping.hpp"
#include "h3q/util/sync_io/sync_io_fwd.hpp"
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/noncopyable.hpp>
#include <optional>

namespace h3q::transport::detail
{

// Types.

/**
 * Internal, non-movable pImpl-lite implementation of Send_stream class template.
 *
 * @see All discussion of the public API is in Send_stream doc header; that class template forwards to this one.
 *
 * ### Impl design ###
 * The one interesting datum is #m_writing: the single out-queue slot.  send_data() fills it (refusing if it is full);
 * flush() empties it into the QUIC engine, across as many poll_write() partial writes (and would-blocks) as needed,
 * shrinking the Blob from the front via `start_past_prefix_inc()` as bytes are accepted.  poll_ready() is just
 * flush(); poll_finish() is flush() followed by the engine's finish.
 *
 * Terminal states: #m_pending_err_code (a write or finish failed: emitted by any subsequent op), and
 * #m_finishing or #m_reset (user said no more data: send_data() refuses).
 *
 * @tparam Quic_send_stream_handle
 *         See Send_stream.
 */
template<typename Quic_send_stream_handle>
class Send_stream_impl :
  public flow::log::Log_context,
  private boost::noncopyable // And non-movable.
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Quic_stream = Quic_send_stream_handle;

  // Constructors/destructor.

  /**
   * See Send_stream counterpart.
   *
   * @param logger_ptr
   *        See Send_stream counterpart.
   * @param nickname_str
   *        See Send_stream counterpart.
   * @param stream
   *        See Send_stream counterpart.
   */
  explicit Send_stream_impl(flow::log::Logger* logger_ptr, util::String_view nickname_str, Quic_stream&& stream);

  /// See Send_stream counterpart.
  ~Send_stream_impl();

  // Methods.

  /**
   * See Send_stream counterpart.
   *
   * @param data
   *        See Send_stream counterpart.
   * @param err_code
   *        See Send_stream counterpart.
   */
  void send_data(util::Blob&& data, Error_code* err_code);

  /**
   * See Send_stream counterpart.
   *
   * @param on_active_ev_func
   *        See Send_stream counterpart.
   * @param err_code
   *        See Send_stream counterpart.
   */
  void poll_ready(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code);

  /**
   * See Send_stream counterpart.
   *
   * @param on_active_ev_func
   *        See Send_stream counterpart.
   * @param err_code
   *        See Send_stream counterpart.
   */
  void poll_finish(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code);

  /**
   * See Send_stream counterpart.
   * @param code
   *        See Send_stream counterpart.
   */
  void reset(app_error_code_t code);

  /**
   * See Send_stream counterpart.
   * @return See above.
   */
  stream_id_t id() const;

  /**
   * See Send_stream counterpart.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * See Send_stream counterpart.
   * @return See above.
   */
  const Error_code& transport_cause() const;

  /**
   * See Send_stream counterpart.
   * @return See above.
   */
  size_t pending_byte_count() const;

private:
  // Methods.

  /**
   * Writes as much of #m_writing as the QUIC engine will take.  Emits success if and only if #m_writing is then
   * empty (including if it was empty to begin with); else would-block or (new, now-pending) error.
   *
   * @param on_active_ev_func
   *        See poll_ready().
   * @param err_code
   *        Not null.
   */
  void flush(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code);

  /**
   * Records a failure reported by the QUIC engine during flush() or poll_finish() and emits it.  The stream is
   * terminal thereafter.
   *
   * @param native_err_code
   *        Truthy, non-would-block code from the QUIC engine.
   * @param context
   *        What was being done, for logging.
   * @param err_code
   *        Not null.
   */
  void on_write_error(const Error_code& native_err_code, util::String_view context, Error_code* err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The engine's stream handle.
  Quic_stream m_stream;

  /// The not-yet-written remainder of the buffer given to the last send_data(); or `nullopt` if all written.
  std::optional<util::Blob> m_writing;

  /// Whether poll_finish() has been called.
  bool m_finishing;

  /// Whether the QUIC engine reported the finished stream acknowledged.
  bool m_finished;

  /// Whether reset() has been called.
  bool m_reset;

  /// Falsy, or the mapped error already emitted, to be emitted by any subsequent op.  Terminal.
  Error_code m_pending_err_code;

  /// See transport_cause().
  Error_code m_transport_cause;

  /// Total bytes the QUIC engine has accepted via poll_write().  For logging.
  uint64_t m_n_written;
}; // class Send_stream_impl

// Free functions.

/**
 * Prints string representation of the given Send_stream_impl to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Quic_send_stream_handle>
std::ostream& operator<<(std::ostream& os, const Send_stream_impl<Quic_send_stream_handle>& val);

// Template implementations.

template<typename Quic_send_stream_handle>
Send_stream_impl<Quic_send_stream_handle>::Send_stream_impl(flow::log::Logger* logger_ptr,
                                                            util::String_view nickname_str, Quic_stream&& stream) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_stream(std::move(stream)),
  m_finishing(false),
  m_finished(false),
  m_reset(false),
  m_n_written(0)
{
  FLOW_LOG_INFO("Send_stream [" << *this << "]: Created for QUIC stream ID [" << m_stream.id() << "].");
}

template<typename Quic_send_stream_handle>
Send_stream_impl<Quic_send_stream_handle>::~Send_stream_impl()
{
  FLOW_LOG_INFO("Send_stream [" << *this << "]: Shutting down.  Wrote [" << m_n_written << "] bytes; "
                "unwritten bytes = [" << pending_byte_count() << "]; finished? = [" << m_finished << "]; "
                "reset? = [" << m_reset << "]; error? = [" << m_pending_err_code << "].");
}

template<typename Quic_send_stream_handle>
void Send_stream_impl<Quic_send_stream_handle>::send_data(util::Blob&& data, Error_code* err_code)
{
  using flow::util::buffers_dump_string;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_data(std::move(data), actual_err_code); },
         err_code, "Send_stream::send_data()"))
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Send_stream [" << *this << "]: Will send blob of size [" << data.size() << "].");

  if (m_pending_err_code)
  {
    FLOW_LOG_INFO("Send_stream [" << *this << "]: An error was detected earlier and saved for any subsequent send "
                  "attempts like this.  Will not proceed with send.");
    *err_code = m_pending_err_code;
  }
  else if (m_finishing || m_reset)
  {
    *err_code = error::Code::S_SENDS_FINISHED_CANNOT_SEND;
  }
  else if (m_writing)
  {
    *err_code = error::Code::S_SEND_NOT_READY;
  }
  else // if (!m_pending_err_code) && (!m_finishing) && (!m_reset) && (!m_writing)
  {
    FLOW_LOG_DATA("Send_stream [" << *this << "]: Blob contents are "
                  "[\n" << buffers_dump_string(data.const_buffer(), "  ") << "].");
    if (!data.empty())
    {
      m_writing = std::move(data);
    }
    // else { Nothing to write; as-if written instantly. }
    err_code->clear();
    return;
  }

  FLOW_LOG_WARNING("Send_stream [" << *this << "]: Wanted to send blob of size [" << data.size() << "], but "
                   "refused with [" << *err_code << "] [" << err_code->message() << "]; stream hosed? = "
                   "[" << bool(m_pending_err_code) << "]; pending bytes = [" << pending_byte_count() << "].");
} // Send_stream_impl::send_data()

template<typename Quic_send_stream_handle>
void Send_stream_impl<Quic_send_stream_handle>::poll_ready(const util::sync_io::Task_ptr& on_active_ev_func,
                                                           Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { poll_ready(on_active_ev_func, actual_err_code); },
         err_code, "Send_stream::poll_ready()"))
  {
    return;
  }
  // else

  if (m_pending_err_code)
  {
    *err_code = m_pending_err_code;
    return;
  }
  // else

  flush(on_active_ev_func, err_code);
}

template<typename Quic_send_stream_handle>
void Send_stream_impl<Quic_send_stream_handle>::poll_finish(const util::sync_io::Task_ptr& on_active_ev_func,
                                                            Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { poll_finish(on_active_ev_func, actual_err_code); },
         err_code, "Send_stream::poll_finish()"))
  {
    return;
  }
  // else

  if (m_pending_err_code)
  {
    *err_code = m_pending_err_code;
    return;
  }
  // else

  if (m_reset)
  {
    FLOW_LOG_WARNING("Send_stream [" << *this << "]: Asked to finish stream, but it was reset earlier.");
    *err_code = error::Code::S_SENDS_FINISHED_CANNOT_SEND;
    return;
  }
  // else

  if (m_finished)
  {
    err_code->clear();
    return;
  }
  // else

  if (!m_finishing)
  {
    FLOW_LOG_INFO("Send_stream [" << *this << "]: Finishing stream after "
                  "[" << (m_n_written + pending_byte_count()) << "] bytes; no more sends allowed.");
    m_finishing = true;
  }

  // The FIN goes after the data; so the data must all be in the engine first.
  flush(on_active_ev_func, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  Error_code native_err_code;
  m_stream.poll_finish(on_active_ev_func, &native_err_code);
  if (native_err_code == error::Code::S_SYNC_IO_WOULD_BLOCK)
  {
    FLOW_LOG_TRACE("Send_stream [" << *this << "]: Finish not yet acknowledged; would-block.");
    *err_code = native_err_code;
    return;
  }
  // else

  if (native_err_code)
  {
    on_write_error(native_err_code, "finish", err_code);
    return;
  }
  // else

  FLOW_LOG_INFO("Send_stream [" << *this << "]: Finish acknowledged by opposing side.");
  m_finished = true;
  err_code->clear();
} // Send_stream_impl::poll_finish()

template<typename Quic_send_stream_handle>
void Send_stream_impl<Quic_send_stream_handle>::flush(const util::sync_io::Task_ptr& on_active_ev_func,
                                                      Error_code* err_code)
{
  while (m_writing)
  {
    util::Blob& blob = *m_writing;
    assert(!blob.empty());

    size_t n_written = 0;
    Error_code native_err_code;
    m_stream.poll_write(on_active_ev_func, blob.const_buffer(), &n_written, &native_err_code);

    if (native_err_code == error::Code::S_SYNC_IO_WOULD_BLOCK)
    {
      FLOW_LOG_TRACE("Send_stream [" << *this << "]: Flush: Would-block with [" << blob.size() << "] bytes left.");
      *err_code = native_err_code;
      return;
    }
    // else

    if (native_err_code)
    {
      on_write_error(native_err_code, "write", err_code);
      return;
    }
    // else

    assert((n_written != 0) && (n_written <= blob.size()) && "QUIC engine must write at least 1, at most all bytes.");
    m_n_written += n_written;

    if (n_written == blob.size())
    {
      FLOW_LOG_TRACE("Send_stream [" << *this << "]: Flush: Wrote final [" << n_written << "] bytes of pending "
                     "blob; ready for the next one.");
      m_writing.reset();
    }
    else
    {
      FLOW_LOG_TRACE("Send_stream [" << *this << "]: Flush: Wrote [" << n_written << "] of [" << blob.size() << "] "
                     "pending bytes; continuing.");
      blob.start_past_prefix_inc(static_cast<util::Blob::difference_type>(n_written));
    }
  } // while (m_writing)

  err_code->clear();
} // Send_stream_impl::flush()

template<typename Quic_send_stream_handle>
void Send_stream_impl<Quic_send_stream_handle>::on_write_error(const Error_code& native_err_code,
                                                               util::String_view context, Error_code* err_code)
{
  m_transport_cause = native_err_code;
  m_pending_err_code = error_mapping::map_write_error(native_err_code);

  FLOW_LOG_WARNING("Send_stream [" << *this << "]: QUIC engine [" << context << "] failed with native error "
                   "[" << native_err_code << "] [" << native_err_code.message() << "]; emitting "
                   "[" << m_pending_err_code << "] [" << m_pending_err_code.message() << "] now and on any "
                   "subsequent op.  Discarding [" << pending_byte_count() << "] unwritten bytes.");

  m_writing.reset();
  *err_code = m_pending_err_code;
}

template<typename Quic_send_stream_handle>
void Send_stream_impl<Quic_send_stream_handle>::reset(app_error_code_t code)
{
  const auto quic_code = error_mapping::app_error_code_to_var_int(get_logger(), code, "reset");

  FLOW_LOG_INFO("Send_stream [" << *this << "]: Resetting stream with application code [" << quic_code << "]; "
                "discarding [" << pending_byte_count() << "] unwritten bytes.");

  m_writing.reset();
  m_reset = true;

  Error_code native_err_code;
  m_stream.reset(quic_code, &native_err_code);
  if (native_err_code)
  {
    FLOW_LOG_WARNING("Send_stream [" << *this << "]: Reset failed with native error "
                     "[" << native_err_code << "] [" << native_err_code.message() << "].  Ignoring.");
  }
}

template<typename Quic_send_stream_handle>
stream_id_t Send_stream_impl<Quic_send_stream_handle>::id() const
{
  return m_stream.id();
}

template<typename Quic_send_stream_handle>
const std::string& Send_stream_impl<Quic_send_stream_handle>::nickname() const
{
  return m_nickname;
}

template<typename Quic_send_stream_handle>
const Error_code& Send_stream_impl<Quic_send_stream_handle>::transport_cause() const
{
  return m_transport_cause;
}

template<typename Quic_send_stream_handle>
size_t Send_stream_impl<Quic_send_stream_handle>::pending_byte_count() const
{
  return m_writing ? m_writing->size() : 0;
}

template<typename Quic_send_stream_handle>
std::ostream& operator<<(std::ostream& os, const Send_stream_impl<Quic_send_stream_handle>& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace h3q::transport::detail
