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

#include <flow/util/util.hpp>

#include "h3q/detail/common.hpp"

/* The APIs and header-inlined stuff (templates, mostly; this library is template-heavy, since it adapts whatever
 * QUIC engine the user plugs in) require C++17 or newer; and that applies to the linking user's `#include`ing .cpp
 * file(s)!  Therefore enforce it by failing compile unless compiler's C++17 or newer mode is in use. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any h3q/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the H3Q project: a library/API in modern C++17 adapting a QUIC connection (any QUIC
 * engine satisfying a small set of compile-time concepts) into the stream/connection abstractions an HTTP/3
 * protocol layer consumes.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in H3Q: The absolute most basic, commonly used symbols (such as the alias
 *     h3q::Error_code).  There should be only a handful of these, and they are likely to be small.
 *     - In particular this includes `enum class` h3q::Log_component which defines the set of possible
 *       `flow::log::Component` values logged from within all modules of H3Q.  See end of common.hpp.
 *   - Sub-namespaces (like h3q::transport, h3q::util), each of which represents an H3Q *module* providing
 *     certain grouped functionality.
 *
 * H3Q modules overview
 * --------------------
 *   - *h3q::util*: Miscellaneous items, notably the `sync_io`-pattern wake-up task type
 *     h3q::util::sync_io::Task_ptr and the blob (byte buffer) aliases.
 *   - *h3q::transport*: The point of H3Q.
 *     - h3q::transport::quic: What we require of the QUIC engine (concepts documented in quic_concepts.hpp);
 *       the native error code set such an engine reports (h3q::transport::quic::error); and the QUIC
 *       variable-length integer h3q::transport::quic::Var_int in which application error codes travel.
 *     - h3q::transport::Reorder_buffer: turns out-of-order chunk delivery back into an in-order byte sequence.
 *     - h3q::transport::Recv_stream, h3q::transport::Send_stream, h3q::transport::Bidi_stream: the per-stream
 *       adapters.
 *     - h3q::transport::Connection: the connection adapter from which streams are accepted and opened.
 *     - h3q::transport::error and h3q::transport::error_mapping: the error taxonomy reported to the protocol layer
 *       and the translation of native transport errors into it.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * H3Q requires Flow and Boost, not only for internal implementation purposes but also in its APIs.
 * `flow::log` is the assumed logging system; `flow::Error_code` and related conventions are used for error
 * reporting; `flow::util::Blob` carries stream bytes.
 *
 * Using H3Q modules
 * -----------------
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow.  Therefore, see the
 * `namespace flow` doc header's "Error reporting" section.  In short: a method that can fail takes a trailing
 * `Error_code* err_code` arg; if null, failure throws `flow::error::Runtime_error`; else the result is stored there.
 *
 * ### Logging ###
 * We use the Flow log module, in `flow::log` namespace, for logging.  The H3Q user must supply a
 * `flow::log::Logger` into the various constructors in order to enable logging.  (Worst-case, passing
 * `Logger == null` will make it log nowhere.)
 *
 * ### Non-blocking operation ###
 * Every operation is a *poll*: it completes synchronously, fails synchronously, or emits
 * transport::error::Code::S_SYNC_IO_WOULD_BLOCK.  In the last case the caller-supplied wake-up task has been
 * handed to the QUIC engine, which will invoke it once a repeat poll might make progress.  This is the `sync_io`
 * pattern in the sense of Flow-IPC; there are no threads or locks inside H3Q.
 */
namespace h3q
{

// Types.  They're outside of `namespace ::h3q::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef H3Q_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by H3Q internal logging.
 * Internal H3Q code specifies members thereof when indicating the log component for each particular piece of
 * logging code.  H3Q user specifies it, albeit very rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are not documented right here, because they are generated via macro magic;
 * see the source file `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /**
   * CAUTION -- see h3q::Log_component doc header for directions to find actual members of this
   * `enum class`.  This entry is a placeholder for Doxygen purposes only.
   */
  S_END_SENTINEL
};

// Constants.

/**
 * The map that maps each enumerated value in h3q::Log_component to its string representation as used in log
 * output and verbosity config.  H3Q user specifies it, albeit very rarely, when configuring their program's logging
 * via `flow::log::Config::init_component_names()`.
 *
 * If the component `enum` member is called `S_SOME_NAME`, then its string counterpart in this map is `"SOME_NAME"`
 * (optionally prepended with a prefix as supplied to `flow::log::Config::init_component_names()`).
 *
 * @see h3q::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_H3Q_LOG_COMPONENT_NAME_MAP;

#endif // H3Q_DOXYGEN_ONLY

} // namespace h3q
