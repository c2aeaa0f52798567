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
 * @file Effect.hh
 * @brief The abstract effects an instruction's semantics emits, one at a time
 *
 * @details
 * An external instruction-semantics component turns each instruction into a
 * stream of these effects. The EffectInterpreter consumes them one by one and
 * hands back a result for the stream to continue with.
 *
 * | Effect           | Result value                               |
 * |------------------|--------------------------------------------|
 * | RegRead          | register value                             |
 * | MemRead          | value read                                 |
 * | MemWrite         | 1 when the (exclusive) store is performed  |
 * | Choose           | the chosen value                           |
 * | everything else  | 0                                          |
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "memory/Event.hh"

namespace promsim {

/* ----------------------------- dependencies ----------------------------- */

/** @brief Depend on every register read and every memory read of the instruction so far */
struct ImplicitAll {
	bool operator==(const ImplicitAll&) const = default;
};

/** @brief Depend on the named registers and on the n-th memory reads of the instruction */
struct ExplicitDeps {
	std::vector<std::string> registers;
	std::vector<size_t>      reads;

	bool operator==(const ExplicitDeps&) const = default;
};

using Deps = std::variant<ImplicitAll, ExplicitDeps>;

/** @brief Shorthand for an explicit dependency set */
inline Deps explicitDeps(std::vector<std::string> _registers = {}, std::vector<size_t> _reads = {}) {
	return ExplicitDeps{std::move(_registers), std::move(_reads)};
}

/** @brief Depends on nothing */
inline Deps noDeps() { return ExplicitDeps{}; }

/* ------------------------------ attributes ------------------------------ */

enum class RegisterClass { APPLICATION, SYSTEM };

enum class AccessStrength {
	PLAIN,
	ACQUIRE_PC,  ///< weak (RCpc) acquire
	ACQUIRE,     ///< strong (RCsc) acquire
	RELEASE
};

struct AccessKind {
	AccessStrength strength  = AccessStrength::PLAIN;
	bool           exclusive = false;

	bool isPlain() const { return this->strength == AccessStrength::PLAIN && !this->exclusive; }
};

enum class ReadPurpose {
	DATA,
	IFETCH,      ///< instruction fetch, 4 or 8 bytes
	TRANSLATION  ///< page-table-walk read
};

enum class BarrierType { DMB, DSB, ISB };

enum class BarrierScope { SY, LD, ST };

enum class Shareability { NON_SHAREABLE, INNER, OUTER, FULL_SYSTEM };

/** @brief Translation regime a TLBI targets */
enum class Regime { EL10, EL2, EL3 };

/* -------------------------------- effects -------------------------------- */

struct RegRead {
	std::string   reg;
	RegisterClass cls     = RegisterClass::APPLICATION;
	bool          direct  = true;
	bool          relaxed = false;  ///< system register read on behalf of the MMU
};

struct RegWrite {
	std::string   reg;
	uint64_t      value  = 0;
	RegisterClass cls    = RegisterClass::APPLICATION;
	bool          direct = true;
	Deps          deps;
};

struct MemRead {
	uint64_t    pa   = 0;
	uint32_t    size = 8;
	AccessKind  kind;
	ReadPurpose purpose = ReadPurpose::DATA;
	uint64_t    va      = 0;  ///< translated address, for TRANSLATION reads
	Deps        addrDeps;
};

struct MemWrite {
	uint64_t   pa    = 0;
	uint32_t   size  = 8;
	uint64_t   value = 0;
	AccessKind kind;
	Deps       addrDeps;
	Deps       dataDeps;
};

/** @brief Atomic read-modify-write; always unsupported */
struct MemAtomic {
	uint64_t pa   = 0;
	uint32_t size = 8;
};

struct Barrier {
	BarrierType  type   = BarrierType::DMB;
	BarrierScope scope  = BarrierScope::SY;
	Shareability domain = Shareability::FULL_SYSTEM;
};

struct Tlbi {
	TlbiScope    scope         = TlbiScope::ALL;
	Asid         asid          = 0;
	uint64_t     va            = 0;
	bool         lastLevelOnly = false;
	Shareability domain        = Shareability::INNER;
	Regime       regime        = Regime::EL10;
	Deps         deps;
};

/** @brief Resolution of a branch condition */
struct BranchAnnounce {
	Deps deps;
};

/** @brief Start translating `va` */
struct TranslationStart {
	uint64_t va   = 0;
	Asid     asid = 0;
	Deps     deps;
};

/** @brief Finish translating `va`; a faulting walk is not cached */
struct TranslationEnd {
	uint64_t va    = 0;
	bool     fault = false;
};

struct ExceptionReturn {};

struct Terminate {};

/** @brief Nondeterministic `bits`-wide value */
struct Choose {
	uint32_t bits = 1;
};

struct Discard {};

using Effect = std::variant<RegRead, RegWrite, MemRead, MemWrite, MemAtomic, Barrier, Tlbi, BranchAnnounce,
                            TranslationStart, TranslationEnd, ExceptionReturn, Terminate, Choose, Discard>;

/** @brief Short human-readable name of an effect's kind ("MemRead", ...) */
const char* effectName(const Effect& _effect);

}  // namespace promsim
