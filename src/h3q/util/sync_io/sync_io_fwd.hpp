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

#include "h3q/util/util_fwd.hpp"
#include <boost/shared_ptr.hpp>

/**
 * Contains common code, as well as important explanatory documentation, for the `sync_io` pattern as H3Q
 * applies it.
 *
 * ### The pattern in H3Q ###
 * Every H3Q operation that may have to wait is a *poll*.  The caller invokes `poll_x(on_active_ev_func, ...)`
 * and one of three things happens synchronously:
 *   - The op completes: the out-arg is filled and the `Error_code` is falsy.
 *   - The op fails: the `Error_code` is truthy and not transport::error::Code::S_SYNC_IO_WOULD_BLOCK.
 *   - The op cannot complete now: the `Error_code` is transport::error::Code::S_SYNC_IO_WOULD_BLOCK.  In this case
 *     the QUIC engine has taken (a copy of) `on_active_ev_func`; it will invoke `(*on_active_ev_func)()` once
 *     something happened that may let a repeat poll make progress (data arrived, flow-control credit opened, the
 *     peer opened a stream, ...).  The caller must then poll again; until then nothing happens in the background.
 *
 * So *you* control what happens in what thread; and everything can happen in *your* single thread, if you
 * so desire.  `(*on_active_ev_func)()` is invoked from whatever context the QUIC engine is driven in, typically
 * right inside the caller's own event-loop processing of the UDP socket; it should usually just schedule a repeat
 * poll (e.g., `post()` it onto the loop).  It must not re-enter the H3Q object synchronously.
 *
 * One `on_active_ev_func` may be shared among many ops; or each op may get its own.  The engine retains only the
 * most recently supplied task per pending op.
 */
namespace h3q::util::sync_io
{

// Types.

/**
 * Short-hand for ref-counted pointer to a `Function<>` that takes no arguments and returns nothing; in particular
 * used for `on_active_ev_func` arguments on `sync_io` poll methods: the wake-up handed to the QUIC engine when an
 * op would-block.
 *
 * ### Rationale ###
 * This is a `shared_ptr`, so that the QUIC engine can cheaply retain it beyond the poll call, possibly in several
 * places (say, the stream's read-waiter and the connection's accept-waiter), without copying the functor.
 */
using Task_ptr = boost::shared_ptr<Task>;

} // namespace h3q::util::sync_io
