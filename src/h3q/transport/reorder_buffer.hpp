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

#include "h3q/transport/transport_fwd.hpp"
#include "h3q/transport/quic/chunk.hpp"
#include <flow/log/log.hpp>
#include <map>

namespace h3q::transport
{

// Types.

/**
 * Converts chunks of one QUIC stream, delivered in any byte-offset order, into the stream's bytes in strict offset
 * order, buffering only what arrived ahead of the first gap.  Recv_stream owns one and feeds it from the QUIC
 * engine's unordered read primitive; it is a separate class so that its logic can be reasoned about (and tested)
 * without any engine.
 *
 * ### How it works ###
 * The *cursor*, offset(), is the offset of the next byte the consumer has not yet been given; initially 0.
 * Each incoming chunk is given to on_chunk():
 *   - It starts at or before the cursor (the common, in-order case): it is trimmed of the bytes before the cursor
 *     (already given to the consumer; this includes the entire chunk if it is a stale duplicate), and the rest is
 *     handed right back for the consumer, the cursor advancing past it.  Nothing is buffered.
 *   - It starts after the cursor (arrived ahead of a gap): it is stored, keyed by its start offset.
 *
 * Then pop_ready() yields any stored chunk that the cursor has since caught up with, trimmed in the same way.
 * Repeating the two yields the stream's bytes contiguously from 0, regardless of arrival order.
 *
 * Overlapping chunks are never merged: each is trimmed against the cursor at the time it becomes eligible.  If two
 * stored chunks start at the same offset only the longer one is kept; the shorter covers nothing extra.
 *
 * ### Relationship to reassembly in TCP-like stacks ###
 * This is the receive-side "packets with gaps" structure of a reliable-stream receiver (compare
 * `flow::net_flow::Peer_socket` and its map of received-but-not-deliverable packets keyed by sequence number),
 * minus acknowledgments and windowing: the QUIC engine below does those.  What remains is the ordered map keyed by
 * offset and the in-order fast path.
 *
 * ### Thread safety ###
 * The usual: concurrent non-`const` access to one object is not safe.
 */
class Reorder_buffer :
  public flow::log::Log_context
{
public:
  // Types.

  /// Byte offset within the stream.
  using offset_t = quic::stream_offset_t;

  // Constructors/destructor.

  /**
   * Constructs empty buffer with cursor at 0.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname of the owning stream, as used in logging.
   */
  explicit Reorder_buffer(flow::log::Logger* logger_ptr, util::String_view nickname);

  // Methods.

  /**
   * The cursor: offset of the next byte not yet yielded to the consumer; equivalently, the total number of bytes
   * yielded so far.
   *
   * @return See above.
   */
  offset_t offset() const;

  /**
   * The number of chunks currently stored (arrived ahead of the cursor).
   * @return See above.
   */
  size_t buffered_chunk_count() const;

  /**
   * The total size of chunks currently stored.  Overlapping bytes are counted once per chunk containing them.
   * @return See above.
   */
  size_t buffered_byte_count() const;

  /**
   * Accepts a chunk newly read from the QUIC engine.  If it starts at or before offset(), its not-yet-yielded suffix
   * is moved into `*ready_bytes`, offset() advances by that suffix's size, and `true` is returned.  The suffix may be
   * empty (the chunk lay entirely before offset()); offset() is then unchanged.  Otherwise the chunk is stored, and
   * `false` is returned; `*ready_bytes` is untouched.
   *
   * @param chunk
   *        The chunk.  It becomes unspecified.
   * @param ready_bytes
   *        See above.  Not null.
   * @return See above.
   */
  bool on_chunk(quic::Chunk&& chunk, util::Blob* ready_bytes);

  /**
   * If a stored chunk has become eligible (starts at or before offset()), removes it, moves its not-yet-yielded
   * suffix into `*ready_bytes`, advances offset() past it, and returns `true`.  Eligible chunks whose suffix would be
   * empty are discarded along the way, so `*ready_bytes` is never set to an empty Blob.  Returns `false` if no
   * stored chunk yields anything; `*ready_bytes` is then untouched.
   *
   * @param ready_bytes
   *        See above.  Not null.
   * @return See above.
   */
  bool pop_ready(util::Blob* ready_bytes);

  /// Discards all stored chunks.  offset() is unchanged.
  void clear();

  /**
   * The nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for #m_chunks_with_gaps type.
  using Chunk_map = std::map<offset_t, util::Blob>;

  // Methods.

  /**
   * Trims from `*bytes`, which start at stream offset `start <= offset()`, the bytes before offset(), and advances
   * offset() by the remaining size.
   *
   * @param start
   *        Stream offset of `bytes->begin()`.
   * @param bytes
   *        The bytes.  Not null.
   */
  void trim_and_advance(offset_t start, util::Blob* bytes);

  // Data.

  /// See nickname().
  std::string m_nickname;

  /// See offset().
  offset_t m_offset;

  /**
   * The chunks that arrived ahead of #m_offset, keyed by start offset.  Invariant: between public method calls
   * on this object, no key is `<= m_offset` unless pop_ready() would now yield (or discard) it; in practice
   * pop_ready() is invoked after each on_chunk() or cursor advance, so the map holds only chunks beyond the gap.
   */
  Chunk_map m_chunks_with_gaps;

  /// See buffered_byte_count().
  size_t m_buffered_size;
}; // class Reorder_buffer

} // namespace h3q::transport
