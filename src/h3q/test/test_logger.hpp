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

#include "h3q/test/test_config.hpp"
#include <h3q/common.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <optional>

namespace h3q::test
{

// Types.

/**
 * The `flow::log::Config` of a Test_logger, in a base class of its own so that it is fully set up (component
 * names, per-component verbosity) before the `Simple_ostream_logger` base is handed a pointer to it.
 */
class Test_log_config
{
protected:
  // Constructors/destructor.

  /**
   * Sets up the config: H3Q and Flow component names; default verbosity; optionally a different verbosity for
   * Log_component::S_TRANSPORT.
   *
   * @param min_severity
   *        Least severe message logged by default.
   * @param transport_severity
   *        If set, least severe message logged for Log_component::S_TRANSPORT.
   */
  explicit Test_log_config(flow::log::Sev min_severity, const std::optional<flow::log::Sev>& transport_severity);

  // Data.

  /// The config.
  flow::log::Config m_log_config;
}; // class Test_log_config

/**
 * Console `Logger` for the test programs: a `Simple_ostream_logger` whose verbosity comes from Test_config by
 * default.  Its component names are prefixed `h3q-` and `flow-`.
 *
 * The transport adapters log every poll at TRACE; to follow them in a failing test without drowning in everything
 * else, set `H3Q_TEST_TRANSPORT_LOG_SEVERITY=TRACE` (see Test_config), or pass `transport_severity` explicitly.
 */
class Test_logger :
  private Test_log_config,
  public flow::log::Simple_ostream_logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger writing to `cout` and `cerr`.
   *
   * @param min_severity
   *        See Test_log_config.
   * @param transport_severity
   *        See Test_log_config.
   */
  explicit Test_logger(flow::log::Sev min_severity = Test_config::get_singleton().m_sev,
                       const std::optional<flow::log::Sev>& transport_severity
                         = Test_config::get_singleton().m_transport_sev);
}; // class Test_logger

} // namespace h3q::test
