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
 * @file Memory.hh
 * @brief Append-only global event log with promise/fulfill support
 *
 * @details
 * Memory is the single shared history of one execution path. Events are only
 * ever appended; an event's timestamp is the length of the log right after it
 * was inserted, so timestamps are the dense integers 1..N and timestamp 0 denotes
 * the initial memory. Truncated views of the log are taken with cutBefore() and
 * cutAfter(), which never copy.
 *
 * Forks of an execution path copy Memory by value.
 *
 * **Read semantics:**
 * @code
 *   timestamps:   1      2      3      4      5
 *   events:     W(x,1) W(y,7) W(x,2) W(x,3) TLBI
 *
 *   read(x, v=3)  ->  { (3, 4), (2, 3) }       // newer writes, then coherent-before-v
 *   read(x, v=0)  ->  { (1,1), (2,3), (3,4), (init, 0) }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "common/View.hh"
#include "memory/Event.hh"
#include "utils/HashableType.hh"

namespace promsim {

/** @brief One value a read may return, with the timestamp of the write it came from */
struct ReadCandidate {
	uint64_t  value     = 0;
	Timestamp timestamp = 0;

	bool operator==(const ReadCandidate& _other) const = default;
};

/** @brief Value of every location before any event (timestamp 0) */
using InitialMemory = std::function<uint64_t(Location)>;

/**
 * @brief VA range and context of a cached translation, used for invalidation checks
 */
struct TranslationRegion {
	uint64_t            vaLo = 0;
	uint64_t            vaHi = 0;
	std::optional<Asid> asid;
	bool                leaf = true;
};

/**
 * @brief Non-owning window (lo, hi] over a Memory's event log
 */
class MemoryCut {
public:
	MemoryCut(const std::vector<Event>& _events, Timestamp _lo, Timestamp _hi)
	    : events(&_events), lo(_lo), hi(_hi) {}

	/** @brief Timestamps strictly greater than this are in the cut */
	Timestamp lowerBound() const { return this->lo; }

	/** @brief Largest timestamp in the cut */
	Timestamp upperBound() const { return this->hi; }

	bool contains(Timestamp _t) const { return _t > this->lo && _t <= this->hi; }

	const Event& at(Timestamp _t) const { return (*this->events)[_t - 1]; }

	/** @brief Newest write to `_loc` inside the cut, if any */
	std::optional<ReadCandidate> findLastWrite(Location _loc) const;

	/** @brief Every write to `_loc` inside the cut, oldest first */
	std::vector<ReadCandidate> findAllWrites(Location _loc) const;

	/**
	 * @brief Atomicity check of an exclusive pair
	 *
	 * True iff the event at `_v` is a write to `_loc` (or `_v` is 0, the initial
	 * value) and no thread other than `_tid` writes `_loc` at a timestamp in (_v, hi].
	 */
	bool exclusive(Location _loc, Timestamp _v, uint32_t _tid) const;

	/** @brief First TLBI in the cut that covers `_region`, if any */
	std::optional<Timestamp> findCoveringTlbi(const TranslationRegion& _region) const;

private:
	const std::vector<Event>* events;
	Timestamp                 lo;
	Timestamp                 hi;
};

class Memory : virtual public HashableType {
public:
	/**
	 * @brief Construct an empty log
	 *
	 * @param _initial Initial value of every location (defaults to all zeros)
	 */
	Memory(InitialMemory _initial = nullptr);

	/** @brief Number of events, equal to the newest timestamp */
	Timestamp size() const { return this->events.size(); }

	/** @brief Event with timestamp `_t` (1-based, bounds-checked) */
	const Event& at(Timestamp _t) const;

	uint64_t initialValue(Location _loc) const { return this->initial(_loc); }

	/** @brief Events with timestamp <= `_v` */
	MemoryCut cutBefore(View _v) const;

	/** @brief Events with timestamp > `_v` */
	MemoryCut cutAfter(View _v) const;

	/** @brief The whole log */
	MemoryCut all() const { return MemoryCut(this->events, 0, this->size()); }

	/**
	 * @brief Newest write to `_loc`, else the initial value at timestamp 0
	 */
	ReadCandidate readLast(Location _loc) const;

	/**
	 * @brief Newest write to `_loc` with timestamp <= `_v`, else the initial value
	 *
	 * Used for sequential point-in-time reads such as instruction fetch.
	 */
	ReadCandidate readAt(Location _loc, View _v) const;

	/**
	 * @brief Every value a weak read of `_loc` at view `_v` may return
	 *
	 * The result holds every write to `_loc` newer than `_v` (oldest first)
	 * followed by readAt(_loc, _v). It is never empty.
	 */
	std::vector<ReadCandidate> read(Location _loc, View _v) const;

	/**
	 * @brief Append `_event` and return its timestamp
	 */
	Timestamp promise(const Event& _event);

	/**
	 * @brief Find the promise an effect should fulfil
	 *
	 * @param _event     The event program order now wants to perform
	 * @param _promises  The calling thread's pending promise timestamps
	 * @return The oldest pending promise whose event equals `_event`, or nullopt
	 *         when a fresh promise must be created instead
	 *
	 * @note Matching a newer promise would leave older promises of the same event
	 *       permanently unfulfillable, so the oldest match is always taken.
	 */
	std::optional<Timestamp> fulfill(const Event& _event, const std::vector<Timestamp>& _promises) const;

	/** @brief exclusive() over the events up to and including `_cut` */
	bool exclusive(Location _loc, Timestamp _v, uint32_t _tid, View _cut) const;

	/**
	 * @brief Last view at which a page-table value read at `_t` is still current
	 *
	 * If a later write to `_loc` exists, the first TLBI covering `_region` after
	 * that write invalidates the translation; the deadline is one below it.
	 * Otherwise the translation never goes stale and VIEW_INFINITY is returned.
	 */
	View invalidationDeadline(Location _loc, Timestamp _t, const TranslationRegion& _region) const;

	/**
	 * @brief Flatten the log into an address -> byte map
	 *
	 * Covers every location written in the log and every location in
	 * `_footprint`, 8 little-endian bytes per location.
	 *
	 * @param _initial Initial memory; the log's own initial memory when null
	 */
	std::map<uint64_t, uint8_t> snapshot(const std::set<Location>& _footprint = {},
	                                     const InitialMemory&       _initial   = nullptr) const;

	const std::vector<Event>& getEvents() const { return this->events; }

private:
	std::vector<Event> events;
	InitialMemory      initial;
};

}  // namespace promsim
