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

#include "h3q/transport/reorder_buffer.hpp"
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
 * Internal, non-movable pImpl-lite implementation of Recv_stream class template.  In and of itself it would have been
 * directly and publicly usable; however Recv_stream adds move semantics (and the NULL state that comes with them),
 * which are essential to splitting a Bidi_stream and to handing streams around generally.
 *
 * @see All discussion of the public API is in Recv_stream doc header; that class template forwards to this one.
 *
 * ### Impl design ###
 * All the reordering logic is in #m_reorder_buf; what's here is driving it from the QUIC engine's unordered read.
 * poll_data() first asks #m_reorder_buf for a buffered chunk the cursor has reached; only failing that does it read
 * from the engine; and it keeps reading until it has bytes to emit or the engine says something other than "here is
 * a chunk."  So a would-block emitted to the user always comes straight from the engine, meaning the engine has
 * the user's `on_active_ev_func` and will invoke it.  (If we returned would-block after merely buffering a chunk
 * ahead of the gap, nobody would wake the user: the engine had just given us data, not retained a wake-up.)
 *
 * There are two terminal states: #m_finished (clean end; emitted as such forever after) and truthy
 * #m_pending_err_code (failure; emitted forever after).  Neither touches the engine again.
 *
 * @tparam Quic_recv_stream_handle
 *         See Recv_stream.
 */
template<typename Quic_recv_stream_handle>
class Recv_stream_impl :
  public flow::log::Log_context,
  private boost::noncopyable // And non-movable.
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Quic_stream = Quic_recv_stream_handle;

  // Constructors/destructor.

  /**
   * See Recv_stream counterpart.
   *
   * @param logger_ptr
   *        See Recv_stream counterpart.
   * @param nickname_str
   *        See Recv_stream counterpart.
   * @param stream
   *        See Recv_stream counterpart.
   */
  explicit Recv_stream_impl(flow::log::Logger* logger_ptr, util::String_view nickname_str, Quic_stream&& stream);

  /// See Recv_stream counterpart.
  ~Recv_stream_impl();

  // Methods.

  /**
   * See Recv_stream counterpart.
   *
   * @param on_active_ev_func
   *        See Recv_stream counterpart.
   * @param data
   *        See Recv_stream counterpart.
   * @param err_code
   *        See Recv_stream counterpart.
   */
  void poll_data(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<util::Blob>* data,
                 Error_code* err_code);

  /**
   * See Recv_stream counterpart.
   * @param code
   *        See Recv_stream counterpart.
   */
  void stop_sending(app_error_code_t code);

  /**
   * See Recv_stream counterpart.
   * @return See above.
   */
  stream_id_t id() const;

  /**
   * See Recv_stream counterpart.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * See Recv_stream counterpart.
   * @return See above.
   */
  const Error_code& transport_cause() const;

  /**
   * See Recv_stream counterpart.
   * @return See above.
   */
  Reorder_buffer::offset_t offset() const;

  /**
   * See Recv_stream counterpart.
   * @return See above.
   */
  size_t buffered_chunk_count() const;

private:
  // Methods.

  /**
   * Emits the given non-empty bytes to the user via poll_data() out-args.
   *
   * @param bytes
   *        The bytes.  Becomes unspecified.
   * @param data
   *        See poll_data().
   * @param err_code
   *        See poll_data().  Not null.
   */
  void emit_data(util::Blob&& bytes, std::optional<util::Blob>* data, Error_code* err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The engine's stream handle.
  Quic_stream m_stream;

  /// Turns #m_stream unordered reads into ordered bytes.
  Reorder_buffer m_reorder_buf;

  /// Whether the engine reported the stream's clean end, and we've emitted it.  Terminal.
  bool m_finished;

  /// Falsy, or the mapped error already emitted by poll_data() and to be re-emitted on each subsequent call.  Terminal.
  Error_code m_pending_err_code;

  /// See transport_cause().
  Error_code m_transport_cause;
}; // class Recv_stream_impl

// Free functions.

/**
 * Prints string representation of the given Recv_stream_impl to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Quic_recv_stream_handle>
std::ostream& operator<<(std::ostream& os, const Recv_stream_impl<Quic_recv_stream_handle>& val);

// Template implementations.

template<typename Quic_recv_stream_handle>
Recv_stream_impl<Quic_recv_stream_handle>::Recv_stream_impl(flow::log::Logger* logger_ptr,
                                                            util::String_view nickname_str, Quic_stream&& stream) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_stream(std::move(stream)),
  m_reorder_buf(logger_ptr, m_nickname),
  m_finished(false)
{
  FLOW_LOG_INFO("Recv_stream [" << *this << "]: Created for QUIC stream ID [" << m_stream.id() << "].");
}

template<typename Quic_recv_stream_handle>
Recv_stream_impl<Quic_recv_stream_handle>::~Recv_stream_impl()
{
  FLOW_LOG_INFO("Recv_stream [" << *this << "]: Shutting down.  Yielded [" << m_reorder_buf.offset() << "] bytes; "
                "finished? = [" << m_finished << "]; error? = [" << m_pending_err_code << "].");
  // m_stream dtor will release the engine's resources; it's up to the engine to stop the stream if not finished.
}

template<typename Quic_recv_stream_handle>
void Recv_stream_impl<Quic_recv_stream_handle>::poll_data(const util::sync_io::Task_ptr& on_active_ev_func,
                                                          std::optional<util::Blob>* data, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { poll_data(on_active_ev_func, data, actual_err_code); },
         err_code, "Recv_stream::poll_data()"))
  {
    return;
  }
  // else

  assert(data);

  if (m_pending_err_code)
  {
    FLOW_LOG_TRACE("Recv_stream [" << *this << "]: Poll: An error was emitted earlier; emitting it again "
                   "[" << m_pending_err_code << "] [" << m_pending_err_code.message() << "].");
    *err_code = m_pending_err_code;
    return;
  }
  // else

  if (m_finished)
  {
    FLOW_LOG_TRACE("Recv_stream [" << *this << "]: Poll: Stream already finished; emitting end again.");
    data->reset();
    err_code->clear();
    return;
  }
  // else

  util::Blob bytes(get_logger());

  // Something the cursor has caught up with since last time?  Then no need to bother the engine.
  if (m_reorder_buf.pop_ready(&bytes))
  {
    emit_data(std::move(bytes), data, err_code);
    return;
  }
  // else

  while (true)
  {
    std::optional<quic::Chunk> chunk;
    Error_code native_err_code;
    m_stream.poll_read_unordered(on_active_ev_func, &chunk, &native_err_code);

    if (native_err_code == error::Code::S_SYNC_IO_WOULD_BLOCK)
    {
      FLOW_LOG_TRACE("Recv_stream [" << *this << "]: Poll: Would-block at cursor [" << m_reorder_buf.offset() << "] "
                     "with [" << m_reorder_buf.buffered_chunk_count() << "] chunks stored ahead of it.");
      *err_code = native_err_code;
      return;
    }
    // else

    if (native_err_code)
    {
      m_transport_cause = native_err_code;
      m_pending_err_code = error_mapping::map_read_error(native_err_code);
      FLOW_LOG_WARNING("Recv_stream [" << *this << "]: Poll: Read failed with native error "
                       "[" << native_err_code << "] [" << native_err_code.message() << "]; emitting "
                       "[" << m_pending_err_code << "] [" << m_pending_err_code.message() << "] now and on any "
                       "subsequent poll.  Cursor was at [" << m_reorder_buf.offset() << "].");
      m_reorder_buf.clear();
      *err_code = m_pending_err_code;
      return;
    }
    // else

    if (!chunk)
    {
      if (m_reorder_buf.buffered_chunk_count() != 0)
      {
        FLOW_LOG_WARNING("Recv_stream [" << *this << "]: Poll: QUIC engine reports stream end, but "
                         "[" << m_reorder_buf.buffered_chunk_count() << "] chunks remain stored beyond a gap at "
                         "cursor [" << m_reorder_buf.offset() << "].  Engine bug?  Discarding them.");
        m_reorder_buf.clear();
      }

      FLOW_LOG_INFO("Recv_stream [" << *this << "]: Stream finished after [" << m_reorder_buf.offset() << "] "
                    "bytes.  Emitting end.");
      m_finished = true;
      data->reset();
      err_code->clear();
      return;
    }
    // else

    FLOW_LOG_TRACE("Recv_stream [" << *this << "]: Poll: Got " << *chunk << " from QUIC engine.");

    if (m_reorder_buf.on_chunk(std::move(*chunk), &bytes) && (!bytes.empty()))
    {
      emit_data(std::move(bytes), data, err_code);
      return;
    }
    /* else: Either it was stored (ahead of the gap; the cursor has not moved, so nothing stored became eligible),
     * or it was stale.  Either way nothing to emit; read on until the engine gives us something or would-blocks. */
  } // while (true)
} // Recv_stream_impl::poll_data()

template<typename Quic_recv_stream_handle>
void Recv_stream_impl<Quic_recv_stream_handle>::emit_data(util::Blob&& bytes, std::optional<util::Blob>* data,
                                                          Error_code* err_code)
{
  using flow::util::buffers_dump_string;

  assert(!bytes.empty());

  FLOW_LOG_TRACE("Recv_stream [" << *this << "]: Poll: Emitting [" << bytes.size() << "] bytes; cursor now at "
                 "[" << m_reorder_buf.offset() << "].");
  FLOW_LOG_DATA("Recv_stream [" << *this << "]: Bytes are [\n" << buffers_dump_string(bytes.const_buffer(), "  ")
                << "].");

  *data = std::move(bytes);
  err_code->clear();
}

template<typename Quic_recv_stream_handle>
void Recv_stream_impl<Quic_recv_stream_handle>::stop_sending(app_error_code_t code)
{
  const auto quic_code = error_mapping::app_error_code_to_var_int(get_logger(), code, "stop-sending");

  FLOW_LOG_INFO("Recv_stream [" << *this << "]: Asking opposing side to stop sending with application code "
                "[" << quic_code << "].");

  Error_code native_err_code;
  m_stream.stop(quic_code, &native_err_code);
  if (native_err_code)
  {
    FLOW_LOG_WARNING("Recv_stream [" << *this << "]: Stop-sending failed with native error "
                     "[" << native_err_code << "] [" << native_err_code.message() << "].  Ignoring.");
  }
}

template<typename Quic_recv_stream_handle>
stream_id_t Recv_stream_impl<Quic_recv_stream_handle>::id() const
{
  return m_stream.id();
}

template<typename Quic_recv_stream_handle>
const std::string& Recv_stream_impl<Quic_recv_stream_handle>::nickname() const
{
  return m_nickname;
}

template<typename Quic_recv_stream_handle>
const Error_code& Recv_stream_impl<Quic_recv_stream_handle>::transport_cause() const
{
  return m_transport_cause;
}

template<typename Quic_recv_stream_handle>
Reorder_buffer::offset_t Recv_stream_impl<Quic_recv_stream_handle>::offset() const
{
  return m_reorder_buf.offset();
}

template<typename Quic_recv_stream_handle>
size_t Recv_stream_impl<Quic_recv_stream_handle>::buffered_chunk_count() const
{
  return m_reorder_buf.buffered_chunk_count();
}

template<typename Quic_recv_stream_handle>
std::ostream& operator<<(std::ostream& os, const Recv_stream_impl<Quic_recv_stream_handle>& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace h3q::transport::detail
