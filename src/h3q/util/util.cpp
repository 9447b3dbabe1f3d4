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
#include "h3q/util/util_fwd.hpp"

namespace h3q::util
{

// Static initializations.

const std::string EMPTY_STRING;

// Implementations.

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

} // namespace h3q::util
