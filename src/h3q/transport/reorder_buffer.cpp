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
#include "h3q/transport/reorder_buffer.hpp"

namespace h3q::transport
{

// Implementations.

Reorder_buffer::Reorder_buffer(flow::log::Logger* logger_ptr, util::String_view nickname) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname),
  m_offset(0),
  m_buffered_size(0)
{
  // Nothing else.
}

Reorder_buffer::offset_t Reorder_buffer::offset() const
{
  return m_offset;
}

size_t Reorder_buffer::buffered_chunk_count() const
{
  return m_chunks_with_gaps.size();
}

size_t Reorder_buffer::buffered_byte_count() const
{
  return m_buffered_size;
}

const std::string& Reorder_buffer::nickname() const
{
  return m_nickname;
}

bool Reorder_buffer::on_chunk(quic::Chunk&& chunk, util::Blob* ready_bytes)
{
  assert(ready_bytes);

  if (chunk.m_offset <= m_offset)
  {
    // In-order (or stale): no buffering.
    trim_and_advance(chunk.m_offset, &chunk.m_data);
    FLOW_LOG_TRACE("Reorder_buffer [" << *this << "]: Got " << chunk << " at/before cursor; yielding "
                   "[" << chunk.m_data.size() << "] bytes; cursor now at [" << m_offset << "].");
    *ready_bytes = std::move(chunk.m_data);
    return true;
  }
  // else: Arrived ahead of the gap at m_offset.  Store it.

  const auto chunk_size = chunk.m_data.size();
  const auto it = m_chunks_with_gaps.find(chunk.m_offset);
  if (it == m_chunks_with_gaps.end())
  {
    FLOW_LOG_TRACE("Reorder_buffer [" << *this << "]: Got " << chunk << " ahead of cursor [" << m_offset << "]; "
                   "storing.");
    m_buffered_size += chunk_size;
    m_chunks_with_gaps.emplace(chunk.m_offset, std::move(chunk.m_data));
  }
  else if (it->second.size() < chunk_size)
  {
    FLOW_LOG_TRACE("Reorder_buffer [" << *this << "]: Got " << chunk << " ahead of cursor [" << m_offset << "]; "
                   "it starts where a stored chunk of [" << it->second.size() << "] bytes starts but is longer; "
                   "replacing the latter.");
    m_buffered_size = m_buffered_size - it->second.size() + chunk_size;
    it->second = std::move(chunk.m_data);
  }
  else
  {
    FLOW_LOG_TRACE("Reorder_buffer [" << *this << "]: Got " << chunk << " ahead of cursor [" << m_offset << "]; "
                   "a stored chunk of [" << it->second.size() << "] bytes already covers it; dropping.");
  }

  return false;
} // Reorder_buffer::on_chunk()

bool Reorder_buffer::pop_ready(util::Blob* ready_bytes)
{
  assert(ready_bytes);

  /* The smallest key is the only candidate worth checking: if it is beyond the cursor, all are.  Loop only to
   * skip eligible chunks that are entirely stale (possible only with overlapping chunks). */
  while ((!m_chunks_with_gaps.empty()) && (m_chunks_with_gaps.begin()->first <= m_offset))
  {
    const auto it = m_chunks_with_gaps.begin();
    const auto start = it->first;
    util::Blob bytes(std::move(it->second));
    m_buffered_size -= bytes.size();
    m_chunks_with_gaps.erase(it);

    trim_and_advance(start, &bytes);
    if (bytes.empty())
    {
      FLOW_LOG_TRACE("Reorder_buffer [" << *this << "]: Stored chunk starting at [" << start << "] lies entirely "
                     "before cursor [" << m_offset << "]; discarding.");
      continue;
    }
    // else

    FLOW_LOG_TRACE("Reorder_buffer [" << *this << "]: Stored chunk starting at [" << start << "] now eligible; "
                   "yielding [" << bytes.size() << "] bytes; cursor now at [" << m_offset << "]; "
                   "[" << m_chunks_with_gaps.size() << "] chunks remain stored.");
    *ready_bytes = std::move(bytes);
    return true;
  }

  return false;
} // Reorder_buffer::pop_ready()

void Reorder_buffer::clear()
{
  if (!m_chunks_with_gaps.empty())
  {
    FLOW_LOG_INFO("Reorder_buffer [" << *this << "]: Discarding [" << m_chunks_with_gaps.size() << "] stored "
                  "chunks ([" << m_buffered_size << "] bytes).");
  }
  m_chunks_with_gaps.clear();
  m_buffered_size = 0;
}

void Reorder_buffer::trim_and_advance(offset_t start, util::Blob* bytes)
{
  assert((start <= m_offset) && "Only chunks at or before the cursor may be trimmed.");

  const auto n_seen = m_offset - start;
  if (n_seen >= bytes->size())
  {
    bytes->clear();
    return;
  }
  // else

  if (n_seen != 0)
  {
    bytes->start_past_prefix_inc(static_cast<util::Blob::difference_type>(n_seen));
  }
  m_offset += bytes->size();
}

std::ostream& operator<<(std::ostream& os, const Reorder_buffer& val)
{
  return os << val.nickname() << '@' << static_cast<const void*>(&val);
}

} // namespace h3q::transport
