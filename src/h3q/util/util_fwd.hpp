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

#include "h3q/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <flow/util/blob.hpp>
#include <boost/asio/buffer.hpp>

/**
 * Flow-style utilities used throughout H3Q.  This is a small module: mostly aliases, so that the rest of H3Q
 * need not spell out the Flow and boost.asio names each time.
 */
namespace h3q::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/**
 * A contiguous, owned, movable run of bytes; the unit in which stream data enters and exits H3Q.  A received
 * chunk is one of these (possibly with a prefix already trimmed off via `start_past_prefix_inc()`); so is a
 * buffer handed to a send stream for transmission.
 *
 * It is `flow::util::Blob`, so it can log its allocations at TRACE severity, if given a `Logger`.
 */
using Blob = flow::util::Blob;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 *
 * ### How to use ###
 * We provide this alias as a stand-in for a boost.asio `const_buffer`, which is exactly what it is.
 * Construct it via `Blob_const(ptr, size)` or `boost::asio::buffer(...)`; access via `.data()` and `.size()`;
 * or see blob_data() for a `uint8_t*` view.
 */
using Blob_const = boost::asio::const_buffer;

// Constants.

/// A default-constructed `string`; returned by reference by accessors of objects in NULL state.
extern const std::string EMPTY_STRING;

// Free functions.

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

} // namespace h3q::util
