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

#include "thread/TranslationCache.hh"

#include <string>

#include "common/Errors.hh"

namespace promsim {

TranslationCache::TranslationCache(const TranslationParams& _params) : params(_params), levels(_params.levels) {
	// va_bits stays below 64 so every region's end address is representable.
	if (_params.levels == 0 || _params.granuleBits <= 3 || _params.vaBits >= 64 ||
	    _params.levelShift(0) >= _params.vaBits) {
		throw StructuralError("invalid translation scheme: levels=" + std::to_string(_params.levels) +
		                      " granule_bits=" + std::to_string(_params.granuleBits) +
		                      " va_bits=" + std::to_string(_params.vaBits));
	}
}

void TranslationCache::checkLevel(uint32_t _level) const {
	if (_level >= this->levels.size()) {
		throw StructuralError("page-table level " + std::to_string(_level) + " out of range [0, " +
		                      std::to_string(this->levels.size()) + ")");
	}
}

const std::set<TranslationEntry>& TranslationCache::get(uint32_t _level, const TranslationKey& _key) const {
	static const std::set<TranslationEntry> empty;

	this->checkLevel(_level);
	auto iter = this->levels[_level].find(_key);
	return iter == this->levels[_level].end() ? empty : iter->second;
}

void TranslationCache::insert(uint32_t _level, const TranslationKey& _key, const TranslationEntry& _entry) {
	this->checkLevel(_level);
	this->levels[_level][_key].insert(_entry);
}

TranslationCache& TranslationCache::unionWith(const TranslationCache& _other) {
	if (_other.levels.size() != this->levels.size() || _other.params.granuleBits != this->params.granuleBits ||
	    _other.params.vaBits != this->params.vaBits) {
		throw StructuralError("cannot merge translation caches of different translation schemes");
	}

	for (uint32_t level = 0; level < this->levels.size(); ++level) {
		for (const auto& [key, entries] : _other.levels[level]) {
			this->levels[level][key].insert(entries.begin(), entries.end());
		}
	}
	return *this;
}

TranslationCache TranslationCache::unite(const TranslationCache& _a, const TranslationCache& _b) {
	TranslationCache result = _a;
	result.unionWith(_b);
	return result;
}

uint64_t TranslationCache::vaPrefix(uint64_t _va, uint32_t _level) const {
	this->checkLevel(_level);
	uint64_t mask = (uint64_t(1) << this->params.vaBits) - 1;
	return (_va & mask) >> this->params.levelShift(_level);
}

TranslationRegion TranslationCache::region(uint64_t _va, uint32_t _level, std::optional<Asid> _asid,
                                           bool _leaf) const {
	uint32_t shift  = this->params.levelShift(_level);
	uint64_t prefix = this->vaPrefix(_va, _level);
	return TranslationRegion{prefix << shift, (prefix + 1) << shift, _asid, _leaf};
}

std::vector<CachedWalk> TranslationCache::lookup(uint64_t _va, Asid _asid) const {
	std::vector<CachedWalk> found;

	// Bounded by the number of levels; the leaf level is visited first.
	for (uint32_t i = 0; i < this->levels.size(); ++i) {
		uint32_t level  = uint32_t(this->levels.size()) - 1 - i;
		uint64_t prefix = this->vaPrefix(_va, level);

		for (std::optional<Asid> asid : {std::optional<Asid>(_asid), std::optional<Asid>()}) {
			for (const auto& entry : this->get(level, TranslationKey{prefix, asid})) {
				found.push_back(CachedWalk{level, asid, entry});
			}
		}
	}
	return found;
}

TranslationCache TranslationCache::fromWalk(uint64_t _va, Asid _asid, const std::vector<uint64_t>& _descriptors,
                                            View _view, bool _complete) const {
	TranslationCache walk(this->params);
	if (_descriptors.empty()) return walk;

	if (_descriptors.size() > this->levels.size()) {
		throw StructuralError("translation walk of " + std::to_string(_descriptors.size()) +
		                      " descriptors exceeds the " + std::to_string(this->levels.size()) + "-level scheme");
	}

	bool global = _complete && ((_descriptors.back() >> DESCRIPTOR_NG_BIT) & 1) == 0;

	std::optional<Asid> tag = global ? std::nullopt : std::optional<Asid>(_asid);
	for (uint32_t level = 0; level < _descriptors.size(); ++level) {
		TranslationEntry entry;
		entry.descriptors.assign(_descriptors.begin(), _descriptors.begin() + level + 1);
		entry.view     = _view;
		entry.complete = _complete && level + 1 == _descriptors.size();
		walk.insert(level, TranslationKey{this->vaPrefix(_va, level), tag}, entry);
	}
	return walk;
}

size_t TranslationCache::size() const {
	size_t total = 0;
	for (const auto& level : this->levels) {
		for (const auto& [_, entries] : level) total += entries.size();
	}
	return total;
}

}  // namespace promsim
