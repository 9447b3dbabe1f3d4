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

#include "h3q/transport/quic/chunk.hpp"
#include "h3q/transport/quic/var_int.hpp"
#include "h3q/util/sync_io/sync_io_fwd.hpp"
#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

/**
 * A scripted, in-memory QUIC engine, implementing the concepts in quic_concepts.hpp, for unit tests.  Nothing goes
 * over any network: the test plays the opposing side (and the engine's internals) by manipulating the shared
 * Test_stream_state and Test_connection_state objects directly, while the H3Q adapters under test talk to the
 * handles.
 *
 * Every would-block retains the `on_active_ev_func`; the state-mutating helpers (push_chunk(), add_write_credit(),
 * ...) invoke the retained one, as a real engine would upon the corresponding network event.
 */
namespace h3q::test
{

// Types.

/**
 * Both directions of one scripted QUIC stream, plus counters of what the handles were asked to do.  Shared by the
 * handles (one or two) and the test.
 */
struct Test_stream_state
{
  // Constructors/destructor.

  /**
   * Constructs stream state with nothing incoming, unlimited write credit, finish auto-acknowledged.
   * @param id Stream ID.
   */
  explicit Test_stream_state(transport::quic::stream_id_t id);

  // Methods.

  /**
   * Queues a chunk for the next read and wakes a waiting reader.
   *
   * @param offset Stream offset of first byte.
   * @param data The bytes.
   */
  void push_chunk(transport::quic::stream_offset_t offset, util::String_view data);

  /// After the queued chunks are read, reads shall report end; wakes a waiting reader.
  void finish_incoming();

  /**
   * Reads shall fail with the given code from now on; wakes a waiting reader.
   * @param err_code Failure code.
   */
  void fail_reads(const Error_code& err_code);

  /**
   * Allows `n` more bytes to be written; wakes a waiting writer.
   * @param n Byte count.
   */
  void add_write_credit(size_t n);

  /**
   * Writes and finish shall fail with the given code from now on; wakes a waiting writer.
   * @param err_code Failure code.
   */
  void fail_writes(const Error_code& err_code);

  /// Acknowledges the finish; wakes a waiting writer.
  void ack_finish();

  // Data.

  /// Stream ID.
  transport::quic::stream_id_t m_id;

  /// Chunks the next reads shall return, in this order.
  std::deque<transport::quic::Chunk> m_incoming;

  /// Whether reads shall report end once #m_incoming is empty.
  bool m_incoming_finished;

  /// If truthy, every read fails with this.
  Error_code m_read_err_code;

  /// Number of `poll_read_unordered()` calls.
  size_t m_n_reads;

  /// Retained wake-up from the last would-blocked read.
  util::sync_io::Task_ptr m_read_waiter;

  /// Code given to the last `stop()`, if any.
  std::optional<transport::quic::Var_int> m_stop_code;

  /// If truthy, `stop()` fails with this.
  Error_code m_stop_err_code;

  /// All bytes written so far.
  std::string m_written;

  /// How many more bytes writes may accept before would-block.
  size_t m_write_credit;

  /// At most this many bytes are accepted per `poll_write()`.
  size_t m_max_write_per_poll;

  /// If truthy, every write and finish fails with this.
  Error_code m_write_err_code;

  /// Number of `poll_write()` calls.
  size_t m_n_writes;

  /// Retained wake-up from the last would-blocked write or finish.
  util::sync_io::Task_ptr m_write_waiter;

  /// Whether `poll_finish()` was called at least once.
  bool m_finish_called;

  /// Whether the finish is acknowledged (or, if #m_finish_called is `false`, will be as soon as requested).
  bool m_finish_acked;

  /// Code given to the last `reset()`, if any.
  std::optional<transport::quic::Var_int> m_reset_code;

  /// If truthy, `reset()` fails with this.
  Error_code m_reset_err_code;

  /// Bytes written after the finish or reset; a correct adapter keeps this 0.
  size_t m_n_written_after_end;
}; // struct Test_stream_state

/// Implements transport::quic::Quic_recv_stream_handle concept over a Test_stream_state.
class Test_recv_stream_handle
{
public:
  /**
   * Constructs handle.
   * @param state The stream.
   */
  explicit Test_recv_stream_handle(std::shared_ptr<Test_stream_state> state);

  /// Moves.
  Test_recv_stream_handle(Test_recv_stream_handle&&) = default;

  /// Moves.
  Test_recv_stream_handle& operator=(Test_recv_stream_handle&&) = default;

  /**
   * See concept.
   * @return See concept.
   */
  transport::quic::stream_id_t id() const;

  /**
   * See concept.
   * @param on_active_ev_func See concept.
   * @param chunk See concept.
   * @param err_code See concept.
   */
  void poll_read_unordered(const util::sync_io::Task_ptr& on_active_ev_func,
                           std::optional<transport::quic::Chunk>* chunk, Error_code* err_code);

  /**
   * See concept.
   * @param error_code See concept.
   * @param err_code See concept.
   */
  void stop(transport::quic::Var_int error_code, Error_code* err_code);

private:
  /// The stream.
  std::shared_ptr<Test_stream_state> m_state;
}; // class Test_recv_stream_handle

/// Implements transport::quic::Quic_send_stream_handle concept over a Test_stream_state.
class Test_send_stream_handle
{
public:
  /**
   * Constructs handle.
   * @param state The stream.
   */
  explicit Test_send_stream_handle(std::shared_ptr<Test_stream_state> state);

  /// Moves.
  Test_send_stream_handle(Test_send_stream_handle&&) = default;

  /// Moves.
  Test_send_stream_handle& operator=(Test_send_stream_handle&&) = default;

  /**
   * See concept.
   * @return See concept.
   */
  transport::quic::stream_id_t id() const;

  /**
   * See concept.
   * @param on_active_ev_func See concept.
   * @param data See concept.
   * @param n_written See concept.
   * @param err_code See concept.
   */
  void poll_write(const util::sync_io::Task_ptr& on_active_ev_func,
                  const util::Blob_const& data, size_t* n_written, Error_code* err_code);

  /**
   * See concept.
   * @param on_active_ev_func See concept.
   * @param err_code See concept.
   */
  void poll_finish(const util::sync_io::Task_ptr& on_active_ev_func, Error_code* err_code);

  /**
   * See concept.
   * @param error_code See concept.
   * @param err_code See concept.
   */
  void reset(transport::quic::Var_int error_code, Error_code* err_code);

private:
  /// The stream.
  std::shared_ptr<Test_stream_state> m_state;
}; // class Test_send_stream_handle

/// Short-hand for what the engine yields for one bidirectional stream.
using Test_bidi_stream_handles = std::pair<Test_send_stream_handle, Test_recv_stream_handle>;

/**
 * One scripted QUIC connection: the streams the opposing side has opened (and we have not yet accepted), how many
 * more we may open, and a record of what the connection handle was asked to do.
 */
struct Test_connection_state
{
  // Constructors/destructor.

  /// Constructs connection state with nothing incoming and no credit to open streams.
  Test_connection_state();

  // Methods.

  /**
   * Has the opposing side open a bidirectional stream; wakes a waiting acceptor.
   *
   * @param id Stream ID.
   * @return The new stream.
   */
  std::shared_ptr<Test_stream_state> add_incoming_bidi(transport::quic::stream_id_t id);

  /**
   * Has the opposing side open a unidirectional stream; wakes a waiting acceptor.
   *
   * @param id Stream ID.
   * @return The new stream.
   */
  std::shared_ptr<Test_stream_state> add_incoming_uni(transport::quic::stream_id_t id);

  /// After the queued incoming streams are accepted, accepts shall report exhaustion; wakes waiting acceptors.
  void exhaust_incoming();

  /**
   * Allows `n` more bidirectional opens to complete; wakes a waiting opener.
   * @param n Open count.
   */
  void grant_bidi_opens(size_t n);

  /**
   * Allows `n` more unidirectional opens to complete; wakes a waiting opener.
   * @param n Open count.
   */
  void grant_uni_opens(size_t n);

  /**
   * Every connection-level op shall fail with the given code from now on; wakes all waiters.
   * @param err_code Failure code.
   */
  void fail(const Error_code& err_code);

  // Data.

  /// Incoming bidirectional streams not yet accepted.
  std::deque<std::shared_ptr<Test_stream_state>> m_incoming_bidi;

  /// Incoming unidirectional streams not yet accepted.
  std::deque<std::shared_ptr<Test_stream_state>> m_incoming_uni;

  /// Whether accepts shall report exhaustion once the corresponding queue is empty.
  bool m_incoming_exhausted;

  /// If truthy, every connection-level op fails with this.
  Error_code m_err_code;

  /// Remaining bidirectional opens that may complete.
  size_t m_bidi_open_credit;

  /// Remaining unidirectional opens that may complete.
  size_t m_uni_open_credit;

  /// Number of `open_bidi()` calls: how many open ops were created.
  size_t m_n_open_bidi_calls;

  /// Number of `open_uni()` calls.
  size_t m_n_open_uni_calls;

  /// Number of open-op polls, both kinds.
  size_t m_n_open_polls;

  /// ID for the next bidirectional stream we open (client-initiated: 0, 4, 8, ...).
  transport::quic::stream_id_t m_next_bidi_id;

  /// ID for the next unidirectional stream we open (client-initiated: 2, 6, 10, ...).
  transport::quic::stream_id_t m_next_uni_id;

  /// Streams we opened, by ID.
  std::map<transport::quic::stream_id_t, std::shared_ptr<Test_stream_state>> m_opened;

  /// Retained wake-ups.
  util::sync_io::Task_ptr m_accept_bidi_waiter;

  /// Retained wake-ups.
  util::sync_io::Task_ptr m_accept_uni_waiter;

  /// Retained wake-ups.
  util::sync_io::Task_ptr m_open_bidi_waiter;

  /// Retained wake-ups.
  util::sync_io::Task_ptr m_open_uni_waiter;

  /// Code given to `close()`, if called.
  std::optional<transport::quic::Var_int> m_close_code;

  /// Reason given to `close()`.
  std::string m_close_reason;
}; // struct Test_connection_state

/// Implements transport::quic::Quic_open_op concept for bidirectional streams.
class Test_open_bidi_op
{
public:
  /**
   * Constructs op.
   * @param state The connection.
   */
  explicit Test_open_bidi_op(std::shared_ptr<Test_connection_state> state);

  /**
   * See concept.
   * @param on_active_ev_func See concept.
   * @param result See concept.
   * @param err_code See concept.
   */
  void poll(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Test_bidi_stream_handles>* result,
            Error_code* err_code);

private:
  /// The connection.
  std::shared_ptr<Test_connection_state> m_state;
}; // class Test_open_bidi_op

/// Implements transport::quic::Quic_open_op concept for unidirectional streams.
class Test_open_uni_op
{
public:
  /**
   * Constructs op.
   * @param state The connection.
   */
  explicit Test_open_uni_op(std::shared_ptr<Test_connection_state> state);

  /**
   * See concept.
   * @param on_active_ev_func See concept.
   * @param result See concept.
   * @param err_code See concept.
   */
  void poll(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Test_send_stream_handle>* result,
            Error_code* err_code);

private:
  /// The connection.
  std::shared_ptr<Test_connection_state> m_state;
}; // class Test_open_uni_op

/// Implements transport::quic::Quic_incoming_streams concept for bidirectional streams.
class Test_incoming_bidi_streams
{
public:
  /**
   * Constructs source.
   * @param state The connection.
   */
  explicit Test_incoming_bidi_streams(std::shared_ptr<Test_connection_state> state);

  /**
   * See concept.
   * @param on_active_ev_func See concept.
   * @param stream See concept.
   * @param err_code See concept.
   */
  void poll_next(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Test_bidi_stream_handles>* stream,
                 Error_code* err_code);

private:
  /// The connection.
  std::shared_ptr<Test_connection_state> m_state;
}; // class Test_incoming_bidi_streams

/// Implements transport::quic::Quic_incoming_streams concept for unidirectional streams.
class Test_incoming_uni_streams
{
public:
  /**
   * Constructs source.
   * @param state The connection.
   */
  explicit Test_incoming_uni_streams(std::shared_ptr<Test_connection_state> state);

  /**
   * See concept.
   * @param on_active_ev_func See concept.
   * @param stream See concept.
   * @param err_code See concept.
   */
  void poll_next(const util::sync_io::Task_ptr& on_active_ev_func, std::optional<Test_recv_stream_handle>* stream,
                 Error_code* err_code);

private:
  /// The connection.
  std::shared_ptr<Test_connection_state> m_state;
}; // class Test_incoming_uni_streams

/// Implements transport::quic::Quic_connection_handle concept over a Test_connection_state.
class Test_connection_handle
{
public:
  // Types.

  /// See concept.
  using Send_stream_handle = Test_send_stream_handle;

  /// See concept.
  using Recv_stream_handle = Test_recv_stream_handle;

  /// See concept.
  using Open_bidi_op = Test_open_bidi_op;

  /// See concept.
  using Open_uni_op = Test_open_uni_op;

  /// See concept.
  using Incoming_bidi_streams = Test_incoming_bidi_streams;

  /// See concept.
  using Incoming_uni_streams = Test_incoming_uni_streams;

  // Constructors/destructor.

  /**
   * Constructs handle.
   * @param state The connection.
   */
  explicit Test_connection_handle(std::shared_ptr<Test_connection_state> state);

  // Methods.

  /**
   * See concept.
   * @return See concept.
   */
  Open_bidi_op open_bidi();

  /**
   * See concept.
   * @return See concept.
   */
  Open_uni_op open_uni();

  /**
   * See concept.  Subsequent connection-level ops fail with transport::quic::error::Code::S_CONN_LOCALLY_CLOSED.
   *
   * @param error_code See concept.
   * @param reason See concept.
   */
  void close(transport::quic::Var_int error_code, const util::Blob_const& reason);

private:
  /// The connection.
  std::shared_ptr<Test_connection_state> m_state;
}; // class Test_connection_handle

// Free functions.

/**
 * If `*waiter` is not null, nullifies it and invokes the retained function.
 * @param waiter Wake-up slot.
 */
void wake(util::sync_io::Task_ptr* waiter);

} // namespace h3q::test
