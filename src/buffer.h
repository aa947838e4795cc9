// Copyright 2026 The lexconv Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "lexconv.h"

#include <cstdio>
#include <cstdlib>

namespace lexconv {
namespace impl {

// Aborts the process if a destination buffer of `capacity` bytes cannot hold
// `required` bytes.
inline void RequireCapacity(const char* function, size_t capacity, size_t required)
{
    if (capacity >= required)
        return;

    std::fprintf(stderr, "lexconv::%s: buffer too small (required %zu bytes, got %zu)\n", function, required, capacity);
    std::fflush(stderr);
    std::abort();
}

// Same as above for the range [first, last).
inline void RequireCapacity(const char* function, const char* first, const char* last, size_t required)
{
    RequireCapacity(function, (last < first) ? 0 : static_cast<size_t>(last - first), required);
}

} // namespace impl
} // namespace lexconv
