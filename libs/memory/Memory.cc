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

#include "memory/Memory.hh"

#include <string>

#include "utils/Logging.hh"

namespace promsim {

std::optional<ReadCandidate> MemoryCut::findLastWrite(Location _loc) const {
	for (Timestamp t = this->hi; t > this->lo; --t) {
		const auto* w = std::get_if<WriteEvent>(&this->at(t));
		if (w && w->location == _loc) return ReadCandidate{w->value, t};
	}
	return std::nullopt;
}

std::vector<ReadCandidate> MemoryCut::findAllWrites(Location _loc) const {
	std::vector<ReadCandidate> writes;
	for (Timestamp t = this->lo + 1; t <= this->hi; ++t) {
		const auto* w = std::get_if<WriteEvent>(&this->at(t));
		if (w && w->location == _loc) writes.push_back(ReadCandidate{w->value, t});
	}
	return writes;
}

bool MemoryCut::exclusive(Location _loc, Timestamp _v, uint32_t _tid) const {
	if (_v != 0) {
		if (!this->contains(_v)) return false;
		const auto* source = std::get_if<WriteEvent>(&this->at(_v));
		if (!source || source->location != _loc) return false;
	}

	for (Timestamp t = std::max(_v, this->lo) + 1; t <= this->hi; ++t) {
		const auto* w = std::get_if<WriteEvent>(&this->at(t));
		if (w && w->location == _loc && w->tid != _tid) return false;
	}
	return true;
}

std::optional<Timestamp> MemoryCut::findCoveringTlbi(const TranslationRegion& _region) const {
	for (Timestamp t = this->lo + 1; t <= this->hi; ++t) {
		const auto* tlbi = std::get_if<TlbiEvent>(&this->at(t));
		if (tlbi && tlbi->descriptor.covers(_region.vaLo, _region.vaHi, _region.asid, _region.leaf)) return t;
	}
	return std::nullopt;
}

Memory::Memory(InitialMemory _initial) : initial(std::move(_initial)) {
	if (!this->initial) this->initial = [](Location) -> uint64_t { return 0; };
}

const Event& Memory::at(Timestamp _t) const {
	CLASS_ASSERT_MSG(_t >= 1 && _t <= this->size(),
	                 "Timestamp " + std::to_string(_t) + " is outside the log [1, " + std::to_string(this->size()) + "]");
	return this->events[_t - 1];
}

MemoryCut Memory::cutBefore(View _v) const {
	return MemoryCut(this->events, 0, std::min<Timestamp>(_v, this->size()));
}

MemoryCut Memory::cutAfter(View _v) const {
	return MemoryCut(this->events, std::min<Timestamp>(_v, this->size()), this->size());
}

ReadCandidate Memory::readLast(Location _loc) const {
	return this->all().findLastWrite(_loc).value_or(ReadCandidate{this->initial(_loc), 0});
}

ReadCandidate Memory::readAt(Location _loc, View _v) const {
	return this->cutBefore(_v).findLastWrite(_loc).value_or(ReadCandidate{this->initial(_loc), 0});
}

std::vector<ReadCandidate> Memory::read(Location _loc, View _v) const {
	std::vector<ReadCandidate> candidates = this->cutAfter(_v).findAllWrites(_loc);
	candidates.push_back(this->readAt(_loc, _v));
	return candidates;
}

Timestamp Memory::promise(const Event& _event) {
	this->events.push_back(_event);
	VERBOSE_CLASS_INFO << "Promised " << _event << " at t=" << this->size();
	return this->size();
}

std::optional<Timestamp> Memory::fulfill(const Event& _event, const std::vector<Timestamp>& _promises) const {
	std::optional<Timestamp> oldest;
	for (Timestamp t : _promises) {
		if (t == 0 || t > this->size()) continue;
		if (this->events[t - 1] == _event && (!oldest || t < *oldest)) oldest = t;
	}
	return oldest;
}

bool Memory::exclusive(Location _loc, Timestamp _v, uint32_t _tid, View _cut) const {
	return this->cutBefore(_cut).exclusive(_loc, _v, _tid);
}

View Memory::invalidationDeadline(Location _loc, Timestamp _t, const TranslationRegion& _region) const {
	auto overwrites = this->cutAfter(_t).findAllWrites(_loc);
	if (overwrites.empty()) return VIEW_INFINITY;

	auto tlbi = this->cutAfter(overwrites.front().timestamp).findCoveringTlbi(_region);
	return tlbi ? *tlbi - 1 : VIEW_INFINITY;
}

std::map<uint64_t, uint8_t> Memory::snapshot(const std::set<Location>& _footprint,
                                             const InitialMemory&       _initial) const {
	const InitialMemory& init = _initial ? _initial : this->initial;

	std::set<Location> locations;
	for (Location loc : _footprint) locations.insert(toLocation(loc));
	for (const auto& event : this->events) {
		if (const auto* w = std::get_if<WriteEvent>(&event)) locations.insert(w->location);
	}

	std::map<uint64_t, uint8_t> bytes;
	for (Location loc : locations) {
		auto     last  = this->all().findLastWrite(loc);
		uint64_t value = last ? last->value : init(loc);
		for (unsigned i = 0; i < 8; ++i) { bytes[loc + i] = uint8_t(value >> (8 * i)); }
	}
	return bytes;
}

}  // namespace promsim
