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

#include <flow/log/log.hpp>
#include <optional>

namespace h3q::test
{

/**
 * Process-wide settings for the test programs, taken from the environment once, at first use.
 *
 * Environment variables (each a `flow::log::Sev` name such as `INFO` or `TRACE`, case-insensitive; an
 * unrecognized value is reported to `stderr` and ignored):
 *   - `H3Q_TEST_MIN_LOG_SEVERITY`: the default Test_logger verbosity.  Default: `WARNING`.
 *   - `H3Q_TEST_TRANSPORT_LOG_SEVERITY`: verbosity for Log_component::S_TRANSPORT alone, overriding the former
 *     for the adapters' messages (e.g., `TRACE` to follow every poll while keeping the rest quiet).  Default: none.
 */
class Test_config
{
public:
  // Methods.

  /**
   * Returns the singleton.
   * @return See above.
   */
  static const Test_config& get_singleton();

  // Data.

  /// Minimum severity that Test_logger lets through by default.
  flow::log::Sev m_sev;

  /// If set, minimum severity that Test_logger lets through for Log_component::S_TRANSPORT.
  std::optional<flow::log::Sev> m_transport_sev;

private:
  // Constructors.

  /// Loads settings from the environment.
  Test_config();
}; // class Test_config

} // namespace h3q::test
