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
 * @file Event.hh
 * @brief Immutable entries of the global event log
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <variant>

namespace promsim {

/** @brief 8-byte aligned physical address of a memory cell */
using Location = uint64_t;

/** @brief Address-space identifier */
using Asid = uint16_t;

/** @brief Clear the low three bits of a physical address */
inline Location toLocation(uint64_t _pa) { return _pa & ~uint64_t(7); }

enum class TlbiScope {
	ALL,             ///< every ASID, every VA
	BY_ASID,         ///< every VA of one ASID (non-global entries only)
	BY_VA_ALL_ASID,  ///< one VA page, any ASID
	BY_VA_BY_ASID    ///< one VA page of one ASID (non-global entries only)
};

/**
 * @brief Typed description of a TLB maintenance operation
 *
 * `va` is stored page-aligned; `asid` is only meaningful for the ASID scopes.
 */
struct TlbiDescriptor {
	TlbiScope scope         = TlbiScope::ALL;
	Asid      asid          = 0;
	uint64_t  va            = 0;
	bool      lastLevelOnly = false;

	bool operator==(const TlbiDescriptor& _other) const = default;

	/**
	 * @brief Does this operation invalidate a cached translation?
	 *
	 * @param _vaLo     First VA covered by the cached entry
	 * @param _vaHi     One past the last VA covered by the cached entry
	 * @param _asid     ASID the entry was cached under (nullopt for global entries)
	 * @param _leaf     Whether the entry holds a complete (leaf-level) walk
	 */
	bool covers(uint64_t _vaLo, uint64_t _vaHi, std::optional<Asid> _asid, bool _leaf) const;

	/**
	 * @brief Canonical form compared by promise fulfilment
	 *
	 * Page-aligns `va` to `_granuleBits` and zeroes the fields the scope ignores
	 * (`asid` unless the scope is ASID-based, `va` unless it is VA-based).
	 */
	TlbiDescriptor normalized(uint32_t _granuleBits) const;
};

/** @brief A data write of one 8-byte cell */
struct WriteEvent {
	uint32_t tid      = 0;
	Location location = 0;
	uint64_t value    = 0;

	bool operator==(const WriteEvent& _other) const = default;
};

/** @brief A broadcast TLB invalidation */
struct TlbiEvent {
	TlbiDescriptor descriptor;

	bool operator==(const TlbiEvent& _other) const = default;
};

using Event = std::variant<WriteEvent, TlbiEvent>;

std::ostream& operator<<(std::ostream& _os, const TlbiDescriptor& _desc);
std::ostream& operator<<(std::ostream& _os, const Event& _event);

}  // namespace promsim
