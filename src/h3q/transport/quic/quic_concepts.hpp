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

// Not compiled: for documentation only.  Contains concept docs as of this writing.
#ifndef H3Q_DOXYGEN_ONLY
#  error "As of this writing this is a documentation-only "header" (the "source" is for humans and Doxygen only)."
#else // ifdef H3Q_DOXYGEN_ONLY

namespace h3q::transport::quic
{

// Types.

/**
 * A documentation-only *concept* defining the receiving direction of one QUIC stream as H3Q needs it: a handle
 * capable of *unordered* reads, stopping, and reporting its ID.  h3q::transport::Recv_stream is a template on a
 * type satisfying this concept.
 *
 * ### Unordered reads ###
 * A QUIC engine reassembles each stream internally and can hand out bytes strictly in order.  But data may arrive
 * out of order (a lost packet is retransmitted later than its successors arrive); an in-order read must then wait for
 * the retransmission even though the later bytes are already sitting in memory.  Most engines therefore also offer
 * an unordered read: it hands out whatever contiguous run of bytes is available, tagged with its offset.  That is
 * what poll_read_unordered() exposes; Reorder_buffer (inside Recv_stream) then restores order with minimum
 * buffering.  Once a stream was read unordered it may not be read in order
 * (quic::error::Code::S_STREAM_ILLEGAL_ORDERED_READ); that is no concern of ours, as we never read in order.
 *
 * ### Error reporting ###
 * Failures are reported via `Error_code`, preferably drawn from quic::error::Code; any category is tolerated
 * (unknown ones map to generic failures).  Would-block is reported as transport::error::Code::S_SYNC_IO_WOULD_BLOCK.
 *
 * ### Thread safety ###
 * None needed: all methods are invoked from one thread at a time, per H3Q's `sync_io` pattern.
 */
class Quic_recv_stream_handle // Note: movable but not copyable.
{
public:
  // Constructors/destructor.

  /**
   * Move-constructs from `src`; `src` becomes unusable except for destruction and move-assignment.
   * @param src
   *        Moved-from object.
   */
  Quic_recv_stream_handle(Quic_recv_stream_handle&& src);

  /**
   * Releases the engine's resources for this stream direction.  If the stream is not yet finished, the engine should
   * behave as if stop() were called with some code of its choosing (typically 0).
   */
  ~Quic_recv_stream_handle();

  // Methods.

  /**
   * Move-assigns from `src`.
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Quic_recv_stream_handle& operator=(Quic_recv_stream_handle&& src);

  /**
   * Returns the QUIC stream ID.
   * @return See above.
   */
  stream_id_t id() const;

  /**
   * Non-blockingly reads the next available run of bytes (in any offset order), or reports the stream's end or
   * failure, or would-block.
   *
   * Outcomes, reported synchronously:
   *   - Data: `*chunk` is set to the Chunk (non-empty preferred); `*err_code` is success.
   *   - End: the sender finished the stream and every byte has been handed out: `*chunk` is set to `std::nullopt`;
   *     `*err_code` is success.  Subsequent calls keep reporting end.
   *   - Would-block: `*err_code` is transport::error::Code::S_SYNC_IO_WOULD_BLOCK; `*chunk` is untouched; the engine
   *     has retained `on_active_ev_func` (replacing any earlier one for this stream's reads) and shall invoke
   *     `(*on_active_ev_func)()` once a repeat call may report anything else.
   *   - Failure: `*err_code` is truthy; e.g., quic::error::Code::S_STREAM_RESET_BY_PEER, or a connection-level code.
   *
   * @param on_active_ev_func
   *        Wake-up to retain on would-block.
   * @param chunk
   *        See above.  Not null.
   * @param err_code
   *        See above.  Not null.
   */
  void poll_read_unordered(const util::sync_io::Task_ptr& on_active_ev_func,
                           std::optional<Chunk>* chunk, Error_code* err_code);

  /**
   * Asks the opposing side to stop sending on this stream (STOP_SENDING with the given application code), and
   * discards any further incoming data.  Non-blocking.
   *
   * @param error_code
   *        Application error code.
   * @param err_code
   *        Not null.  Failure (e.g., quic::error::Code::S_STREAM_UNKNOWN, as the stream is already finished
   *        or stopped) may be reported here.
   */
  void stop(Var_int error_code, Error_code* err_code);
}; // class Quic_recv_stream_handle

/**
 * A documentation-only *concept* defining the sending direction of one QUIC stream as H3Q needs it: a handle
 * capable of non-blocking partial writes, finishing, resetting, and reporting its ID.  h3q::transport::Send_stream
 * is a template on a type satisfying this concept.
 *
 * Error reporting and thread safety: as for Quic_recv_stream_handle.
 */
class Quic_send_stream_handle // Note: movable but not copyable.
{
public:
  // Constructors/destructor.

  /**
   * Move-constructs from `src`; `src` becomes unusable except for destruction and move-assignment.
   * @param src
   *        Moved-from object.
   */
  Quic_send_stream_handle(Quic_send_stream_handle&& src);

  /**
   * Releases the engine's resources for this stream direction.  If the stream is neither finished nor reset, the
   * engine should behave as if reset() were called with some code of its choosing (typically 0).
   */
  ~Quic_send_stream_handle();

  // Methods.

  /**
   * Move-assigns from `src`.
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Quic_send_stream_handle& operator=(Quic_send_stream_handle&& src);

  /**
   * Returns the QUIC stream ID.
   * @return See above.
   */
  stream_id_t id() const;

  /**
   * Non-blockingly writes a prefix (possibly all) of the given bytes into the stream, in order after all bytes
   * written earlier.
   *
   * Outcomes:
   *   - Success: `*n_written` (at least 1, at most `data.size()`) is set; `*err_code` is success.
   *   - Would-block (no flow-control credit or buffer space): `*err_code` is
   *     transport::error::Code::S_SYNC_IO_WOULD_BLOCK; the engine retains `on_active_ev_func` (replacing any earlier
   *     one for this stream's writes and finish) and shall invoke it once a repeat call may write at least 1 byte.
   *   - Failure: `*err_code` is truthy; e.g., quic::error::Code::S_STREAM_STOPPED_BY_PEER, or a connection-level code.
   *
   * @param on_active_ev_func
   *        Wake-up to retain on would-block.
   * @param data
   *        Bytes to write; `data.size() >= 1`.
   * @param n_written
   *        See above.  Not null.
   * @param err_code
   *        See above.  Not null.
   */
  void poll_write(const util::sync_io::Task_ptr& on_active_ev_func,
                  const util::Blob_const& data, size_t* n_written, Error_code* err_code);

  /**
   * Non-blockingly marks the stream finished (FIN: no more bytes shall follow) if not already so marked, then reports
   * whether the opposing side has acknowledged all of it.  Outcomes: success (acknowledged); would-block (as for
   * poll_write()); or failure.
   *
   * @param on_active_ev_func
   *        Wake-up to retain on would-block.
   * @param err_code
   *        See above.  Not null.
   */
  void poll_finish(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code);

  /**
   * Abruptly terminates the sending direction (RESET_STREAM with the given application code).  Non-blocking.
   *
   * @param error_code
   *        Application error code.
   * @param err_code
   *        Not null.  Failure (e.g., quic::error::Code::S_STREAM_UNKNOWN) may be reported here.
   */
  void reset(Var_int error_code, Error_code* err_code);
}; // class Quic_send_stream_handle

/**
 * A documentation-only *concept* defining one in-flight "open a new outgoing stream" operation on a QUIC connection,
 * whose result (when it completes) is of type `Result`.  QUIC limits how many streams each side may open (the
 * opposing side raises the limit over time); so opening may have to wait; hence this is a pollable operation.
 * It is obtained from Quic_connection_handle::open_bidi() or `open_uni()`.
 *
 * Once poll() reported success or failure, the object is not polled again (it is destroyed).  Destroying it before
 * completion abandons the open.
 *
 * @tparam Result
 *         For `open_bidi()`: `std::pair<Send_stream_handle, Recv_stream_handle>`.  For `open_uni()`:
 *         `Send_stream_handle`.
 */
template<typename Result>
class Quic_open_op // Note: movable but not copyable.
{
public:
  // Methods.

  /**
   * Non-blockingly attempts to complete the open.  Outcomes: success (`*result` is set; `*err_code` is success);
   * would-block (`*err_code` is transport::error::Code::S_SYNC_IO_WOULD_BLOCK; `on_active_ev_func` retained and
   * invoked once a repeat poll may succeed); or failure (`*err_code` truthy, typically a connection-level code).
   *
   * @param on_active_ev_func
   *        Wake-up to retain on would-block.
   * @param result
   *        See above.  Not null.
   * @param err_code
   *        See above.  Not null.
   */
  void poll(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Result>* result, Error_code* err_code);
}; // class Quic_open_op

/**
 * A documentation-only *concept* defining a source of streams opened by the opposing side in one direction
 * (bidirectional or unidirectional) on a QUIC connection.  Connection's constructor takes one of each.
 *
 * @tparam Stream
 *         For the bidirectional source: `std::pair<Send_stream_handle, Recv_stream_handle>`.  For the unidirectional
 *         source: `Recv_stream_handle`.
 */
template<typename Stream>
class Quic_incoming_streams // Note: movable but not copyable.
{
public:
  // Methods.

  /**
   * Non-blockingly obtains the next stream opened by the opposing side.
   *
   * Outcomes:
   *   - Stream: `*stream` is set to it; `*err_code` is success.
   *   - Exhausted: no further stream shall ever be accepted (the connection is closing cleanly): `*stream` is set
   *     to `std::nullopt`; `*err_code` is success.
   *   - Would-block: `*err_code` is transport::error::Code::S_SYNC_IO_WOULD_BLOCK; `*stream` is untouched;
   *     `on_active_ev_func` retained and invoked once the opposing side opens a stream (or the connection ends).
   *   - Failure: `*err_code` truthy, a connection-level code.
   *
   * @param on_active_ev_func
   *        Wake-up to retain on would-block.
   * @param stream
   *        See above.  Not null.
   * @param err_code
   *        See above.  Not null.
   */
  void poll_next(const util::sync_io::Task_ptr& on_active_ev_func,
                 std::optional<Stream>* stream, Error_code* err_code);
}; // class Quic_incoming_streams

/**
 * A documentation-only *concept* defining a QUIC connection handle as H3Q needs it: the factory of open operations,
 * plus closing; and, as nested types, the other concepts' implementations for this engine.
 * h3q::transport::Connection is a template on a type satisfying this concept.
 */
class Quic_connection_handle // Note: movable but not copyable.
{
public:
  // Types.

  /// Implements Quic_send_stream_handle concept for this engine.
  using Send_stream_handle = unspecified;

  /// Implements Quic_recv_stream_handle concept for this engine.
  using Recv_stream_handle = unspecified;

  /// Implements Quic_open_op concept with `Result = std::pair<Send_stream_handle, Recv_stream_handle>`.
  using Open_bidi_op = unspecified;

  /// Implements Quic_open_op concept with `Result = Send_stream_handle`.
  using Open_uni_op = unspecified;

  /// Implements Quic_incoming_streams concept with `Stream = std::pair<Send_stream_handle, Recv_stream_handle>`.
  using Incoming_bidi_streams = unspecified;

  /// Implements Quic_incoming_streams concept with `Stream = Recv_stream_handle`.
  using Incoming_uni_streams = unspecified;

  // Methods.

  /**
   * Begins opening a bidirectional stream.  Does not block.
   * @return The operation; to be polled until it completes.
   */
  Open_bidi_op open_bidi();

  /**
   * Begins opening a unidirectional (send-only) stream.  Does not block.
   * @return The operation; to be polled until it completes.
   */
  Open_uni_op open_uni();

  /**
   * Immediately closes the connection (CONNECTION_CLOSE with the given application code and reason phrase).
   * Afterwards every op on the connection, its streams and its incoming sources fails with a connection-level
   * code (typically quic::error::Code::S_CONN_LOCALLY_CLOSED).  Does not block; cannot fail.
   *
   * @param error_code
   *        Application error code.
   * @param reason
   *        Reason phrase; may be empty.
   */
  void close(Var_int error_code, const util::Blob_const& reason);
}; // class Quic_connection_handle

} // namespace h3q::transport::quic

#endif // H3Q_DOXYGEN_ONLY
