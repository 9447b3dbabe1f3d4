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


#include <h3q/transport/connection.hpp>
#include <h3q/transport/reorder_buffer.hpp>
#include <h3q/test/test_quic_engine.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <boost/make_shared.hpp>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing. */
int main(int argc, char const * const * argv)
{
  using h3q::transport::Connection;
  using h3q::transport::Reorder_buffer;
  using h3q::transport::quic::Chunk;
  using h3q::test::Test_connection_state;
  using h3q::test::Test_connection_handle;
  using h3q::test::Test_incoming_bidi_streams;
  using h3q::test::Test_incoming_uni_streams;
  using h3q::util::Blob;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;
  using std::optional;

  const string LOG_FILE = "h3q_core_link_test.log";
  const int BAD_EXIT = 1;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not?  Normally, one derives from
   * Log_context to do this very trivially, but we just have the one function, main(), so far so: */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the H3Q/Flow logging will go into this file.
  const string log_file((argc >= 2) ? string(argv[1]) : LOG_FILE);
  FLOW_LOG_INFO("Opening log file [" << log_file << "] for H3Q/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<h3q::Log_component>(2000, 999);
  log_config.init_component_names<h3q::Log_component>(h3q::S_H3Q_LOG_COMPONENT_NAME_MAP, false, "h3q-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  Async_file_logger log_logger(nullptr, &log_config, log_file, false /* No rotation; we're no serious business. */);

  try
  {
    /* Use a compiled thing (Reorder_buffer) directly; and the Connection/stream templates over the scripted
     * in-memory QUIC engine (no network here).  We're ensuring stuff built OK more or less. */
    Reorder_buffer reorder_buf(&log_logger, "link_test");
    Blob ready;
    reorder_buf.on_chunk(Chunk{ 5, Blob(&log_logger, 5) }, &ready);
    if (!reorder_buf.on_chunk(Chunk{ 0, Blob(&log_logger, 5) }, &ready))
    {
      FLOW_LOG_WARNING("In-order chunk not yielded; unexpected!");
      return BAD_EXIT;
    }
    // else
    reorder_buf.pop_ready(&ready);
    FLOW_LOG_INFO("Reorder buffer cursor now at [" << reorder_buf.offset() << "] (expected 10).");

    auto state = std::make_shared<Test_connection_state>();
    Connection<Test_connection_handle> conn(&log_logger, "conn", Test_connection_handle(state),
                                           Test_incoming_bidi_streams(state), Test_incoming_uni_streams(state));
    const auto stream_state = state->add_incoming_bidi(0);
    const string PAYLOAD = "Hello, world!";
    stream_state->push_chunk(0, PAYLOAD);
    stream_state->finish_incoming();

    const auto on_active_ev_func = boost::make_shared<h3q::util::Task>([]() {});
    optional<Connection<Test_connection_handle>::Bidi> stream;
    conn.poll_accept_bidi_stream(on_active_ev_func, &stream);
    optional<Blob> data;
    stream->poll_data(on_active_ev_func, &data);
    FLOW_LOG_INFO("Received message sent by opposing side: "
                  "[" << string(reinterpret_cast<const char*>(data->const_data()), data->size()) << "].");

    stream->send_data(Blob(&log_logger, 100));
    stream->poll_finish(on_active_ev_func);
    FLOW_LOG_INFO("Sent [" << stream_state->m_written.size() << "] bytes in reply; finished.");

    conn.close(0, "done");
    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
