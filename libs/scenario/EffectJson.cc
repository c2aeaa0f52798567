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

#include "scenario/EffectJson.hh"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Errors.hh"

namespace promsim {

using json = nlohmann::json;

namespace {

template <typename T>
T numberField(const json& _j, const char* _key, T _default) {
	if (!_j.contains(_key)) return _default;
	uint64_t value = parseNumber(_j.at(_key));
	if (value > std::numeric_limits<T>::max()) {
		throw StructuralError(std::string("value of '") + _key + "' out of range");
	}
	return static_cast<T>(value);
}

template <typename T>
T requiredNumber(const json& _j, const char* _key) {
	if (!_j.contains(_key)) throw StructuralError(std::string("missing field '") + _key + "'");
	return numberField<T>(_j, _key, T());
}

// The serialize-enum macro maps unknown strings to the first enumerator, so the
// value is encoded back and compared to catch typos.
template <typename E>
E enumField(const json& _j, const char* _key, E _default) {
	if (!_j.contains(_key)) return _default;
	E value = _j.at(_key).get<E>();
	if (json(value) != _j.at(_key)) {
		throw StructuralError(std::string("unknown value ") + _j.at(_key).dump() + " for '" + _key + "'");
	}
	return value;
}

bool boolField(const json& _j, const char* _key, bool _default) {
	return _j.contains(_key) ? _j.at(_key).get<bool>() : _default;
}

Deps depsField(const json& _j, const char* _key) { return _j.contains(_key) ? parseDeps(_j.at(_key)) : Deps(); }

AccessKind accessKind(const json& _j) {
	return AccessKind{enumField(_j, "strength", AccessStrength::PLAIN), boolField(_j, "exclusive", false)};
}

std::string requiredString(const json& _j, const char* _key) {
	if (!_j.contains(_key)) throw StructuralError(std::string("missing field '") + _key + "'");
	return _j.at(_key).get<std::string>();
}

Effect parseEffectUnchecked(const json& _j) {
	std::string kind = requiredString(_j, "kind");

	if (kind == "RegRead") {
		return RegRead{requiredString(_j, "reg"), enumField(_j, "class", RegisterClass::APPLICATION),
		               boolField(_j, "direct", true), boolField(_j, "relaxed", false)};
	}
	if (kind == "RegWrite") {
		return RegWrite{requiredString(_j, "reg"), numberField<uint64_t>(_j, "value", 0),
		                enumField(_j, "class", RegisterClass::APPLICATION), boolField(_j, "direct", true),
		                depsField(_j, "deps")};
	}
	if (kind == "MemRead") {
		return MemRead{requiredNumber<uint64_t>(_j, "pa"),
		               numberField<uint32_t>(_j, "size", 8),
		               accessKind(_j),
		               enumField(_j, "purpose", ReadPurpose::DATA),
		               numberField<uint64_t>(_j, "va", 0),
		               depsField(_j, "addr_deps")};
	}
	if (kind == "MemWrite") {
		return MemWrite{requiredNumber<uint64_t>(_j, "pa"), numberField<uint32_t>(_j, "size", 8),
		                numberField<uint64_t>(_j, "value", 0),  accessKind(_j),
		                depsField(_j, "addr_deps"),             depsField(_j, "data_deps")};
	}
	if (kind == "MemAtomic") return MemAtomic{requiredNumber<uint64_t>(_j, "pa"), numberField<uint32_t>(_j, "size", 8)};
	if (kind == "Barrier") {
		return Barrier{enumField(_j, "type", BarrierType::DMB), enumField(_j, "scope", BarrierScope::SY),
		               enumField(_j, "domain", Shareability::FULL_SYSTEM)};
	}
	if (kind == "Tlbi") {
		return Tlbi{enumField(_j, "scope", TlbiScope::ALL),
		            numberField<Asid>(_j, "asid", 0),
		            numberField<uint64_t>(_j, "va", 0),
		            boolField(_j, "last_level_only", false),
		            enumField(_j, "domain", Shareability::INNER),
		            enumField(_j, "regime", Regime::EL10),
		            depsField(_j, "deps")};
	}
	if (kind == "BranchAnnounce") return BranchAnnounce{depsField(_j, "deps")};
	if (kind == "TranslationStart") {
		return TranslationStart{requiredNumber<uint64_t>(_j, "va"), numberField<Asid>(_j, "asid", 0),
		                        depsField(_j, "deps")};
	}
	if (kind == "TranslationEnd") return TranslationEnd{requiredNumber<uint64_t>(_j, "va"), boolField(_j, "fault", false)};
	if (kind == "ExceptionReturn") return ExceptionReturn{};
	if (kind == "Terminate") return Terminate{};
	if (kind == "Choose") return Choose{numberField<uint32_t>(_j, "bits", 1)};
	if (kind == "Discard") return Discard{};

	throw StructuralError("unknown effect kind '" + kind + "'");
}

}  // namespace

uint64_t parseNumber(const json& _j) {
	if (_j.is_number_unsigned()) return _j.get<uint64_t>();
	if (_j.is_number_integer()) {
		if (_j.get<int64_t>() < 0) throw StructuralError("negative number " + _j.dump());
		return _j.get<uint64_t>();
	}
	if (_j.is_string()) {
		const std::string& s = _j.get_ref<const std::string&>();
		try {
			size_t   used  = 0;
			uint64_t value = std::stoull(s, &used, 0);
			if (used == s.size()) return value;
		} catch (const std::logic_error&) {}
		throw StructuralError("malformed number \"" + s + "\"");
	}
	throw StructuralError("expected a number, got " + _j.dump());
}

Deps parseDeps(const json& _j) {
	if (_j.is_string() && _j.get<std::string>() == "all") return ImplicitAll{};
	if (!_j.is_object()) throw StructuralError("malformed dependencies " + _j.dump());

	ExplicitDeps deps;
	if (_j.contains("registers")) deps.registers = _j.at("registers").get<std::vector<std::string>>();
	if (_j.contains("reads")) {
		for (const auto& index : _j.at("reads")) deps.reads.push_back(static_cast<size_t>(parseNumber(index)));
	}
	return deps;
}

Effect parseEffect(const json& _j) {
	if (!_j.is_object()) throw StructuralError("effect is not an object: " + _j.dump());
	try {
		return parseEffectUnchecked(_j);
	} catch (const json::exception& e) { throw StructuralError("malformed effect " + _j.dump() + ": " + e.what()); }
}

Event parseEvent(const json& _j) {
	if (!_j.is_object()) throw StructuralError("event is not an object: " + _j.dump());
	try {
		std::string kind = requiredString(_j, "kind");
		if (kind == "write") {
			return WriteEvent{numberField<uint32_t>(_j, "tid", 0), requiredNumber<Location>(_j, "location"),
			                  numberField<uint64_t>(_j, "value", 0)};
		}
		if (kind == "tlbi") {
			return TlbiEvent{TlbiDescriptor{enumField(_j, "scope", TlbiScope::ALL), numberField<Asid>(_j, "asid", 0),
			                                numberField<uint64_t>(_j, "va", 0),
			                                boolField(_j, "last_level_only", false)}};
		}
		throw StructuralError("unknown event kind '" + kind + "'");
	} catch (const json::exception& e) { throw StructuralError("malformed event " + _j.dump() + ": " + e.what()); }
}

}  // namespace promsim
