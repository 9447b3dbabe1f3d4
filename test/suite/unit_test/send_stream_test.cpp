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
#include "h3q/transport/send_stream.hpp"
#include "h3q/transport/quic/error.hpp"
#include "h3q/test/test_quic_engine.hpp"
#include "h3q/test/test_common_util.hpp"
#include "h3q/test/test_logger.hpp"
#include <gtest/gtest.h>

namespace h3q::transport::test
{

namespace
{

using h3q::test::Test_logger;
using h3q::test::Test_stream_state;
using h3q::test::Test_send_stream_handle;
using h3q::test::to_blob;
using h3q::test::to_string;
using h3q::test::make_pattern;
using h3q::test::make_counting_task;
using Send = Send_stream<Test_send_stream_handle>;
using std::make_shared;

} // namespace (anon)

TEST(Send_stream_test, One_buffer_at_a_time)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(2);
  Send stream(&logger, "send", Test_send_stream_handle(state));
  EXPECT_EQ(stream.id(), 2u);

  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;

  // Nothing pending: ready at once, without touching the engine.
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_n_writes, 0u);

  EXPECT_TRUE(stream.send_data(to_blob("hello"), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(stream.pending_byte_count(), 5u);
  EXPECT_EQ(state->m_n_writes, 0u);

  // Second buffer before the first is written: refused; nothing else changes.
  auto second = to_blob("world");
  EXPECT_TRUE(stream.send_data(std::move(second), &err_code));
  EXPECT_EQ(err_code, error::Code::S_SEND_NOT_READY);
  EXPECT_EQ(to_string(second), "world");
  EXPECT_EQ(stream.pending_byte_count(), 5u);
  EXPECT_EQ(state->m_n_writes, 0u);
  EXPECT_EQ(state->m_written, "");

  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_written, "hello");
  EXPECT_EQ(stream.pending_byte_count(), 0u);

  EXPECT_TRUE(stream.send_data(std::move(second), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_written, "helloworld");

  // Misuse with null err_code: thrown.
  EXPECT_TRUE(stream.send_data(to_blob("a")));
  EXPECT_THROW(stream.send_data(to_blob("b")), flow::error::Runtime_error);
}

TEST(Send_stream_test, Partial_writes_and_would_block)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(0);
  state->m_max_write_per_poll = 3;
  state->m_write_credit = 4;
  Send stream(&logger, "send", Test_send_stream_handle(state));

  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;
  const auto pattern = make_pattern(11);

  EXPECT_TRUE(stream.send_data(to_blob(pattern), &err_code));
  EXPECT_FALSE(err_code);

  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);
  EXPECT_EQ(state->m_written, pattern.substr(0, 4));
  EXPECT_EQ(stream.pending_byte_count(), 7u);

  // Still pending: still refused.
  EXPECT_TRUE(stream.send_data(to_blob("x"), &err_code));
  EXPECT_EQ(err_code, error::Code::S_SEND_NOT_READY);

  state->add_write_credit(100);
  EXPECT_EQ(n_wakeups, 1u);

  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_written, pattern);
  EXPECT_EQ(stream.pending_byte_count(), 0u);
  // 3 + 1, would-block, then 3 + 3 + 1.
  EXPECT_EQ(state->m_n_writes, 6u);
}

TEST(Send_stream_test, Empty_buffer)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(0);
  Send stream(&logger, "send", Test_send_stream_handle(state));
  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;

  EXPECT_TRUE(stream.send_data(util::Blob(), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(stream.pending_byte_count(), 0u);
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_n_writes, 0u);
}

TEST(Send_stream_test, Finish_flushes_first)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(0);
  state->m_write_credit = 0;
  state->m_finish_acked = false;
  Send stream(&logger, "send", Test_send_stream_handle(state));
  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;

  EXPECT_TRUE(stream.send_data(to_blob("last words"), &err_code));
  EXPECT_FALSE(err_code);

  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);
  EXPECT_FALSE(state->m_finish_called);

  // No more sends once finishing began.
  EXPECT_TRUE(stream.send_data(to_blob("more"), &err_code));
  EXPECT_EQ(err_code, error::Code::S_SENDS_FINISHED_CANNOT_SEND);

  state->add_write_credit(100);
  EXPECT_EQ(n_wakeups, 1u);
  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);
  EXPECT_TRUE(state->m_finish_called);
  EXPECT_EQ(state->m_written, "last words");

  state->ack_finish();
  EXPECT_EQ(n_wakeups, 2u);
  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);

  // Idempotent.
  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_n_written_after_end, 0u);
}

TEST(Send_stream_test, Write_failure_is_terminal)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(0);
  state->m_write_credit = 2;
  Send stream(&logger, "send", Test_send_stream_handle(state));
  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;

  EXPECT_TRUE(stream.send_data(to_blob("abcdef"), &err_code));
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);

  state->fail_writes(quic::error::Code::S_STREAM_STOPPED_BY_PEER);
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_STREAM_STOPPED_BY_PEER);
  EXPECT_EQ(stream.transport_cause(), quic::error::Code::S_STREAM_STOPPED_BY_PEER);
  EXPECT_EQ(stream.pending_byte_count(), 0u);

  const auto n_writes = state->m_n_writes;
  EXPECT_TRUE(stream.send_data(to_blob("x"), &err_code));
  EXPECT_EQ(err_code, error::Code::S_STREAM_STOPPED_BY_PEER);
  err_code.clear();
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_STREAM_STOPPED_BY_PEER);
  err_code.clear();
  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_STREAM_STOPPED_BY_PEER);
  EXPECT_EQ(state->m_n_writes, n_writes);
  EXPECT_FALSE(state->m_finish_called);
}

TEST(Send_stream_test, Connection_loss_during_finish)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(0);
  state->m_finish_acked = false;
  Send stream(&logger, "send", Test_send_stream_handle(state));
  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;

  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);

  state->fail_writes(quic::error::Code::S_CONN_APPLICATION_CLOSED);
  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_CONNECTION_CLOSED);
}

TEST(Send_stream_test, Reset)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(0);
  state->m_write_credit = 0;
  Send stream(&logger, "send", Test_send_stream_handle(state));
  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;

  EXPECT_TRUE(stream.send_data(to_blob("doomed"), &err_code));
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);

  EXPECT_TRUE(stream.reset(9));
  ASSERT_TRUE(state->m_reset_code);
  EXPECT_EQ(state->m_reset_code->value(), 9u);
  EXPECT_EQ(stream.pending_byte_count(), 0u);

  state->add_write_credit(100);
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_written, "");

  EXPECT_TRUE(stream.send_data(to_blob("x"), &err_code));
  EXPECT_EQ(err_code, error::Code::S_SENDS_FINISHED_CANNOT_SEND);
  err_code.clear();
  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SENDS_FINISHED_CANNOT_SEND);
  EXPECT_FALSE(state->m_finish_called);

  // Clamped; and engine failure is ignored.
  state->m_reset_err_code = quic::error::Code::S_STREAM_UNKNOWN;
  EXPECT_NO_THROW(stream.reset(quic::Var_int::S_MAX_VALUE + 1));
  EXPECT_EQ(*state->m_reset_code, quic::Var_int::S_MAX);
}

TEST(Send_stream_test, Null_state)
{
  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;

  Send stream;
  EXPECT_FALSE(stream.send_data(to_blob("x"), &err_code));
  EXPECT_FALSE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_FALSE(stream.reset(1));
  EXPECT_EQ(stream.id(), 0u);
  EXPECT_EQ(stream.pending_byte_count(), 0u);
  EXPECT_FALSE(stream.transport_cause());
  EXPECT_EQ(flow::util::ostream_op_string(stream), "null");
}

} // namespace h3q::transport::test
