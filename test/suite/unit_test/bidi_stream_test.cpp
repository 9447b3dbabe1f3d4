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
#include "h3q/transport/bidi_stream.hpp"
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
using h3q::test::Test_recv_stream_handle;
using h3q::test::to_blob;
using h3q::test::to_string;
using h3q::test::make_counting_task;
using Bidi = Bidi_stream<Test_send_stream_handle, Test_recv_stream_handle>;
using std::make_shared;

} // namespace (anon)

TEST(Bidi_stream_test, Both_directions)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(4);
  Bidi stream(&logger, "bidi", Test_send_stream_handle(state), Test_recv_stream_handle(state));
  EXPECT_EQ(stream.id(), 4u);
  EXPECT_EQ(stream.nickname(), "bidi");

  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;
  std::optional<util::Blob> data;

  EXPECT_TRUE(stream.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);

  state->push_chunk(0, "GET /");
  state->finish_incoming();
  EXPECT_EQ(n_wakeups, 1u);

  EXPECT_TRUE(stream.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(data);
  EXPECT_EQ(to_string(*data), "GET /");
  EXPECT_TRUE(stream.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(data);

  EXPECT_TRUE(stream.send_data(to_blob("200 OK"), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(stream.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(stream.poll_finish(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_written, "200 OK");
  EXPECT_TRUE(state->m_finish_called);

  EXPECT_EQ(stream.send_half().pending_byte_count(), 0u);
  EXPECT_EQ(stream.recv_half().offset(), 5u);
}

TEST(Bidi_stream_test, Directions_are_independent)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(0);
  Bidi stream(&logger, "bidi", Test_send_stream_handle(state), Test_recv_stream_handle(state));

  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;
  std::optional<util::Blob> data;

  // Resetting the send side leaves the receive side intact.
  EXPECT_TRUE(stream.reset(3));
  ASSERT_TRUE(state->m_reset_code);
  EXPECT_EQ(state->m_reset_code->value(), 3u);
  EXPECT_FALSE(state->m_stop_code);

  state->push_chunk(0, "still here");
  EXPECT_TRUE(stream.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(data);
  EXPECT_EQ(to_string(*data), "still here");

  EXPECT_TRUE(stream.send_data(to_blob("x"), &err_code));
  EXPECT_EQ(err_code, error::Code::S_SENDS_FINISHED_CANNOT_SEND);

  // And vice versa.
  auto state2 = make_shared<Test_stream_state>(8);
  Bidi stream2(&logger, "bidi2", Test_send_stream_handle(state2), Test_recv_stream_handle(state2));
  EXPECT_TRUE(stream2.stop_sending(5));
  ASSERT_TRUE(state2->m_stop_code);
  EXPECT_EQ(state2->m_stop_code->value(), 5u);
  EXPECT_FALSE(state2->m_reset_code);

  EXPECT_TRUE(stream2.send_data(to_blob("reply"), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(stream2.poll_ready(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state2->m_written, "reply");
}

TEST(Bidi_stream_test, Split)
{
  Test_logger logger;
  auto state = make_shared<Test_stream_state>(12);
  Bidi stream(&logger, "bidi", Test_send_stream_handle(state), Test_recv_stream_handle(state));

  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;
  std::optional<util::Blob> data;

  auto halves = stream.split();
  auto& send = halves.first;
  auto& recv = halves.second;
  EXPECT_EQ(send.id(), 12u);
  EXPECT_EQ(recv.id(), 12u);
  EXPECT_EQ(send.nickname(), "bidi");
  EXPECT_EQ(recv.nickname(), "bidi");

  // The original is left in NULL state.
  EXPECT_FALSE(stream.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_FALSE(stream.send_data(to_blob("x"), &err_code));
  EXPECT_FALSE(stream.reset(1));
  EXPECT_EQ(stream.id(), 0u);
  EXPECT_EQ(flow::util::ostream_op_string(stream), "send=null recv=null");

  // Each half usable on its own; and finishing one does not affect the other.
  EXPECT_TRUE(send.send_data(to_blob("abc"), &err_code));
  EXPECT_TRUE(send.poll_finish(on_active_ev_func, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(state->m_written, "abc");

  state->push_chunk(3, "def");
  state->push_chunk(0, "abc");
  EXPECT_TRUE(recv.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(data);
  EXPECT_EQ(to_string(*data), "abc");
  EXPECT_TRUE(recv.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(data);
  EXPECT_EQ(to_string(*data), "def");

  // Moving a half keeps it working.
  auto recv2 = std::move(recv);
  EXPECT_FALSE(recv.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_TRUE(recv2.poll_data(on_active_ev_func, &data, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SYNC_IO_WOULD_BLOCK);
}

TEST(Bidi_stream_test, Split_halves_reset_and_stop_independently)
{
  Test_logger logger;
  size_t n_wakeups = 0;
  const auto on_active_ev_func = make_counting_task(&n_wakeups);
  Error_code err_code;
  std::optional<util::Blob> data;

  // Reset the send half: the receive half still reads.
  {
    auto state = make_shared<Test_stream_state>(16);
    Bidi stream(&logger, "bidi", Test_send_stream_handle(state), Test_recv_stream_handle(state));
    auto halves = stream.split();
    auto& send = halves.first;
    auto& recv = halves.second;

    EXPECT_TRUE(send.send_data(to_blob("never sent"), &err_code));
    EXPECT_TRUE(send.reset(0x10b));
    ASSERT_TRUE(state->m_reset_code);
    EXPECT_EQ(state->m_reset_code->value(), 0x10bu);
    EXPECT_FALSE(state->m_stop_code);

    state->push_chunk(0, "body");
    state->finish_incoming();
    EXPECT_TRUE(recv.poll_data(on_active_ev_func, &data, &err_code));
    EXPECT_FALSE(err_code);
    ASSERT_TRUE(data);
    EXPECT_EQ(to_string(*data), "body");
    EXPECT_TRUE(recv.poll_data(on_active_ev_func, &data, &err_code));
    EXPECT_FALSE(err_code);
    EXPECT_FALSE(data);
    EXPECT_FALSE(recv.transport_cause());
    EXPECT_EQ(state->m_written, "");
  }

  // Stop the receive half: the send half still writes and finishes.
  {
    auto state = make_shared<Test_stream_state>(20);
    Bidi stream(&logger, "bidi", Test_send_stream_handle(state), Test_recv_stream_handle(state));
    auto halves = stream.split();
    auto& send = halves.first;
    auto& recv = halves.second;

    EXPECT_TRUE(recv.stop_sending(0x10c));
    ASSERT_TRUE(state->m_stop_code);
    EXPECT_EQ(state->m_stop_code->value(), 0x10cu);
    EXPECT_FALSE(state->m_reset_code);

    EXPECT_TRUE(send.send_data(to_blob("response"), &err_code));
    EXPECT_FALSE(err_code);
    EXPECT_TRUE(send.poll_ready(on_active_ev_func, &err_code));
    EXPECT_FALSE(err_code);
    EXPECT_TRUE(send.poll_finish(on_active_ev_func, &err_code));
    EXPECT_FALSE(err_code);
    EXPECT_EQ(state->m_written, "response");
    EXPECT_TRUE(state->m_finish_called);
    EXPECT_FALSE(send.transport_cause());
  }
}

} // namespace h3q::transport::test
