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
 * @file TranslationCache.hh
 * @brief Per-level cache of page-table-walk results
 *
 * @details
 * The cache holds, for every page-table level, a map from a translation context
 * (VA prefix at that level, optional ASID) to a *set* of walk results. A set is
 * kept instead of a single value because a thread may still legitimately use a
 * stale translation until an invalidation and synchronization reach it.
 *
 * Levels are runtime indices 0..levels-1 with bounds checking; one bounded loop
 * (lookup()) replaces per-level specialised code.
 *
 * **Prefix layout (4 levels, 4KB granule, 48-bit VA):**
 * @code
 *   level 0: va[47:39]     level 1: va[47:30]
 *   level 2: va[47:21]     level 3: va[47:12]   (leaf)
 * @endcode
 *
 * Entries only ever grow, through unionWith(); staleness is decided at use time
 * against the TLBI events in Memory.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "common/View.hh"
#include "memory/Event.hh"
#include "memory/Memory.hh"
#include "utils/HashableType.hh"

namespace promsim {

/** @brief Shape of the translation scheme */
struct TranslationParams {
	uint32_t levels      = 4;
	uint32_t granuleBits = 12;
	uint32_t vaBits      = 48;

	/** @brief VA bits resolved per level (a table holds 2^(granuleBits-3) descriptors) */
	uint32_t bitsPerLevel() const { return this->granuleBits - 3; }

	/** @brief Lowest VA bit that still selects the level's table entry */
	uint32_t levelShift(uint32_t _level) const {
		return this->granuleBits + this->bitsPerLevel() * (this->levels - 1 - _level);
	}
};

/** @brief Context a walk result is cached under */
struct TranslationKey {
	uint64_t            vaPrefix = 0;
	std::optional<Asid> asid;

	auto operator<=>(const TranslationKey& _other) const = default;
};

/**
 * @brief One cached walk: descriptors from level 0 down to the key's level
 */
struct TranslationEntry {
	std::vector<uint64_t> descriptors;
	View                  view     = 0;      ///< view of the walk that produced it
	bool                  complete = false;  ///< ends in a page or block descriptor

	auto operator<=>(const TranslationEntry& _other) const = default;
};

/** @brief An entry found by lookup(), together with where it was found */
struct CachedWalk {
	uint32_t            level = 0;
	std::optional<Asid> asid;
	TranslationEntry    entry;
};

class TranslationCache : virtual public HashableType {
public:
	/** @brief nG (not global) bit of a page or block descriptor */
	static constexpr uint32_t DESCRIPTOR_NG_BIT = 11;

	TranslationCache(const TranslationParams& _params = TranslationParams());

	/** @brief An empty cache for the given translation scheme */
	static TranslationCache init(const TranslationParams& _params) { return TranslationCache(_params); }

	const TranslationParams& getParams() const { return this->params; }

	uint32_t getLevels() const { return this->params.levels; }

	/**
	 * @brief Cached entries for a context (possibly empty)
	 *
	 * @throws StructuralError if `_level` is not a valid level index
	 */
	const std::set<TranslationEntry>& get(uint32_t _level, const TranslationKey& _key) const;

	/** @brief Add one entry */
	void insert(uint32_t _level, const TranslationKey& _key, const TranslationEntry& _entry);

	/**
	 * @brief Level-wise and context-wise set union with `_other`
	 *
	 * @throws StructuralError if the two caches use different translation schemes
	 */
	TranslationCache& unionWith(const TranslationCache& _other);

	/** @brief Union of two caches as a new value */
	static TranslationCache unite(const TranslationCache& _a, const TranslationCache& _b);

	/** @brief VA prefix identifying `_va`'s table entry at `_level` */
	uint64_t vaPrefix(uint64_t _va, uint32_t _level) const;

	/** @brief VA range covered by a cached entry of `_va` at `_level` */
	TranslationRegion region(uint64_t _va, uint32_t _level, std::optional<Asid> _asid, bool _leaf) const;

	/**
	 * @brief Every cached walk usable for translating `_va` under `_asid`
	 *
	 * Walks the levels from the leaf up to level 0, returning both ASID-tagged
	 * and global entries; deeper (more complete) walks come first.
	 */
	std::vector<CachedWalk> lookup(uint64_t _va, Asid _asid) const;

	/**
	 * @brief Build the single-walk cache a finished walk contributes
	 *
	 * Every prefix of `_descriptors` is recorded at its level. The entries are
	 * tagged with `_asid` unless the final descriptor has the nG bit clear.
	 */
	TranslationCache fromWalk(uint64_t _va, Asid _asid, const std::vector<uint64_t>& _descriptors, View _view,
	                          bool _complete) const;

	/** @brief Total number of entries over all levels and contexts */
	size_t size() const;

	bool operator==(const TranslationCache& _other) const {
		return this->params.levels == _other.params.levels && this->params.granuleBits == _other.params.granuleBits &&
		       this->params.vaBits == _other.params.vaBits && this->levels == _other.levels;
	}

private:
	void checkLevel(uint32_t _level) const;

	TranslationParams                                                     params;
	std::vector<std::map<TranslationKey, std::set<TranslationEntry>>> levels;
};

}  // namespace promsim
