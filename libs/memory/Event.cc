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

#include "memory/Event.hh"

#include <iomanip>

namespace promsim {

bool TlbiDescriptor::covers(uint64_t _vaLo, uint64_t _vaHi, std::optional<Asid> _asid, bool _leaf) const {
	if (this->lastLevelOnly && !_leaf) return false;

	// ASID-scoped maintenance leaves global entries alone.
	bool asidMatches = true;
	if (this->scope == TlbiScope::BY_ASID || this->scope == TlbiScope::BY_VA_BY_ASID) {
		asidMatches = _asid.has_value() && *_asid == this->asid;
	}

	bool vaMatches = true;
	if (this->scope == TlbiScope::BY_VA_ALL_ASID || this->scope == TlbiScope::BY_VA_BY_ASID) {
		vaMatches = this->va >= _vaLo && this->va < _vaHi;
	}

	return asidMatches && vaMatches;
}

TlbiDescriptor TlbiDescriptor::normalized(uint32_t _granuleBits) const {
	bool byAsid = this->scope == TlbiScope::BY_ASID || this->scope == TlbiScope::BY_VA_BY_ASID;
	bool byVa   = this->scope == TlbiScope::BY_VA_ALL_ASID || this->scope == TlbiScope::BY_VA_BY_ASID;

	uint64_t pageMask = (uint64_t(1) << _granuleBits) - 1;
	return TlbiDescriptor{this->scope, byAsid ? this->asid : Asid(0), byVa ? (this->va & ~pageMask) : 0,
	                      this->lastLevelOnly};
}

std::ostream& operator<<(std::ostream& _os, const TlbiDescriptor& _desc) {
	switch (_desc.scope) {
		case TlbiScope::ALL: _os << "TLBI ALL"; break;
		case TlbiScope::BY_ASID: _os << "TLBI ASID=" << _desc.asid; break;
		case TlbiScope::BY_VA_ALL_ASID: _os << "TLBI VAA=0x" << std::hex << _desc.va << std::dec; break;
		case TlbiScope::BY_VA_BY_ASID:
			_os << "TLBI VA=0x" << std::hex << _desc.va << std::dec << " ASID=" << _desc.asid;
			break;
	}
	if (_desc.lastLevelOnly) _os << " (last level)";
	return _os;
}

std::ostream& operator<<(std::ostream& _os, const Event& _event) {
	if (const auto* w = std::get_if<WriteEvent>(&_event)) {
		_os << "W[T" << w->tid << "] 0x" << std::hex << w->location << " = 0x" << w->value << std::dec;
	} else {
		_os << std::get<TlbiEvent>(_event).descriptor;
	}
	return _os;
}

}  // namespace promsim
