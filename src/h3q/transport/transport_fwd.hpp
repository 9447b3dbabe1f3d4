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
#include "h3q/util/sync_io/sync_io_fwd.hpp"

/**
 * H3Q module providing the adapters between a QUIC connection and an HTTP/3 protocol layer.  The protocol layer
 * holds a Connection (one per QUIC connection) from which it accepts and opens streams: Bidi_stream,
 * Recv_stream (incoming unidirectional) and Send_stream (outgoing unidirectional).  A Bidi_stream can be split
 * into a Send_stream and a Recv_stream.  Everything is non-blocking, in the `sync_io` pattern
 * (see h3q::util::sync_io).
 *
 * The QUIC engine is a template parameter: see quic_concepts.hpp for what it must provide.
 */
namespace h3q::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Reorder_buffer;
template<typename Quic_recv_stream_handle>
class Recv_stream;
template<typename Quic_send_stream_handle>
class Send_stream;
template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
class Bidi_stream;
template<typename Quic_connection_handle>
class Connection;

/// Convenience alias for the commonly used type quic::stream_id_t.
using stream_id_t = quic::stream_id_t;

/// Application-level numeric error code, as used by the protocol layer for reset, stop-sending and close.
using app_error_code_t = uint64_t;

// Free functions.

/**
 * Prints string representation of the given Reorder_buffer to the given `ostream`.
 *
 * @relatesalso Reorder_buffer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Reorder_buffer& val);

/**
 * Prints string representation of the given Recv_stream to the given `ostream`.
 *
 * @relatesalso Recv_stream
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Quic_recv_stream_handle>
std::ostream& operator<<(std::ostream& os, const Recv_stream<Quic_recv_stream_handle>& val);

/**
 * Prints string representation of the given Send_stream to the given `ostream`.
 *
 * @relatesalso Send_stream
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Quic_send_stream_handle>
std::ostream& operator<<(std::ostream& os, const Send_stream<Quic_send_stream_handle>& val);

/**
 * Prints string representation of the given Bidi_stream to the given `ostream`.
 *
 * @relatesalso Bidi_stream
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Quic_send_stream_handle, typename Quic_recv_stream_handle>
std::ostream& operator<<(std::ostream& os,
                         const Bidi_stream<Quic_send_stream_handle, Quic_recv_stream_handle>& val);

/**
 * Prints string representation of the given Connection to the given `ostream`.
 *
 * @relatesalso Connection
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Quic_connection_handle>
std::ostream& operator<<(std::ostream& os, const Connection<Quic_connection_handle>& val);

} // namespace h3q::transport
