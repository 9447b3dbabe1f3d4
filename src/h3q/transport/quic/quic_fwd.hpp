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

/**
 * What H3Q requires of, and shares with, the QUIC engine it adapts.  The engine itself is outside H3Q: the user
 * wraps their QUIC library of choice in a few small classes satisfying the concepts documented in
 * quic_concepts.hpp; h3q::transport::Connection and friends are templates on those classes.
 */
namespace h3q::transport::quic
{

// Types.

// Find doc headers near the bodies of these compound types.

class Var_int;
struct Chunk;

/// QUIC stream ID: a 62-bit integer whose 2 low bits encode the initiator and the directionality.
using stream_id_t = uint64_t;

/// Byte offset within a QUIC stream.
using stream_offset_t = uint64_t;

// Free functions.

/**
 * Prints string representation of the given Chunk to the given `ostream`: its offset range, not its bytes.
 *
 * @relatesalso Chunk
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Chunk& val);

} // namespace h3q::transport::quic
