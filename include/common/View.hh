/*
 * Copyright 2023-2025 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file View.hh
 * @brief Logical timestamps and their join-semilattice
 *
 * @details
 * A View is a position in the global event log: "ordered no earlier than the
 * event with this timestamp". Timestamp 0 means "before any event" (initial
 * memory). join() is max and meet() is min.
 *
 * @code{.cpp}
 * View vpre = join(vaddr, vbob, viio);
 * View bound = meet(walkDeadline, VIEW_INFINITY);
 * @endcode
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>

namespace promsim {

/** @brief Logical time attached to a value or effect */
using View = uint64_t;

/** @brief Position of an event in Memory (1-based; 0 is the initial state) */
using Timestamp = uint64_t;

/** @brief Deadline value meaning "never invalidated" */
constexpr View VIEW_INFINITY = std::numeric_limits<View>::max();

constexpr View join(View _a, View _b) { return std::max(_a, _b); }

template <typename... Views>
constexpr View join(View _a, View _b, Views... _rest) {
	return join(join(_a, _b), _rest...);
}

constexpr View meet(View _a, View _b) { return std::min(_a, _b); }

/** @brief Raise a monotone counter in place */
inline void joinInto(View& _counter, View _v) { _counter = join(_counter, _v); }

}  // namespace promsim
