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
#include "h3q/transport/quic/chunk.hpp"
#include <ostream>

namespace h3q::transport::quic
{

std::ostream& operator<<(std::ostream& os, const Chunk& val)
{
  return os << "chunk[" << val.m_offset << ", " << (val.m_offset + val.m_data.size()) << ")";
}

} // namespace h3q::transport::quic
