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

#include "h3q/transport/quic/quic_fwd.hpp"

namespace h3q::transport::quic
{

/**
 * A contiguous run of bytes of a QUIC stream, as delivered by the engine's unordered read primitive, tagged with
 * the byte offset (within the stream) of its first byte.  Chunks of one stream may arrive in any offset order;
 * they may also overlap each other (retransmissions), though an engine will rarely do that.
 *
 * Typically moved around, not copied: copying would copy the bytes.
 */
struct Chunk
{
  // Data.

  /// Offset of `m_data.begin()` within the stream.
  stream_offset_t m_offset;

  /// The bytes; `m_data.size() == 0` is allowed albeit pointless.
  util::Blob m_data;
}; // struct Chunk

} // namespace h3q::transport::quic
