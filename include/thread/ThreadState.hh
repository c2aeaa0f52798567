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
 * @file ThreadState.hh
 * @brief Per-thread architectural and view-tracking state
 *
 * @details
 * ThreadState holds everything one logical thread carries from instruction to
 * instruction:
 * - the pending promise list (timestamps in Memory not yet justified by program order)
 * - the application register file, as (value, view) pairs, over an immutable
 *   initial register snapshot
 * - the system-register write history with its synchronization cursor
 * - per-location coherence views and forwarding records
 * - the monotone view counters (ViewKind)
 * - the outstanding exclusive-load marker
 * - the TLBI -> synchronization cursor record and the thread's TranslationCache
 *
 * All operations are plain field updates; forks copy the whole object.
 */

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/View.hh"
#include "memory/Event.hh"
#include "thread/TranslationCache.hh"
#include "utils/HashableType.hh"

namespace promsim {

/** @brief A register value together with the view it became available at */
struct RegisterValue {
	uint64_t value = 0;
	View     view  = 0;

	bool operator==(const RegisterValue& _other) const = default;
};

/** @brief One entry of the system-register write history */
struct SysregWrite {
	std::string reg;
	uint64_t    value = 0;
	View        view  = 0;
};

/**
 * @brief Forwarding record: the thread's newest write to a location
 */
struct FwdItem {
	Timestamp time        = 0;
	View      view        = 0;  ///< address and data view of the write
	bool      isExclusive = false;

	bool operator==(const FwdItem& _other) const = default;
};

/** @brief Outstanding exclusive load, waiting for its exclusive store */
struct ExclusiveMarker {
	Timestamp time     = 0;  ///< timestamp of the write the load read from
	View      view     = 0;  ///< post-view of the load
	Location  location = 0;  ///< cell the load read

	bool operator==(const ExclusiveMarker& _other) const = default;
};

/**
 * @brief The monotone view counters of a thread
 */
enum class ViewKind : size_t {
	READ = 0,  ///< max view of any read
	WRITE,     ///< max view of any write
	DMB,       ///< DMB SY / DMB LD floor for later reads and writes
	DMB_ST,    ///< DMB ST floor for later writes
	DSB,       ///< DSB floor for everything that follows
	ISB,       ///< instruction synchronization barrier
	SPEC,      ///< speculative operands (addresses, branch conditions)
	CSE,       ///< last context synchronization event
	TLBI,      ///< TLB maintenance
	MSR,       ///< system-register writes
	ACQ,       ///< acquire accesses
	REL,       ///< release accesses
	COUNT
};

const char* toString(ViewKind _kind);

using RegisterMap = std::map<std::string, uint64_t>;

class ThreadState : virtual public HashableType {
public:
	/**
	 * @brief Construct a thread with its initial registers
	 *
	 * @param _tid          Thread identifier written into its WriteEvents
	 * @param _initialRegs  Initial value of every application and system register
	 *                      the thread may read before writing it
	 * @param _translation  Translation scheme of the thread's TranslationCache
	 */
	ThreadState(uint32_t _tid, const RegisterMap& _initialRegs = {},
	            const TranslationParams& _translation = TranslationParams());

	uint32_t getTid() const { return this->tid; }

	/* ---------------------------- promises ---------------------------- */

	const std::vector<Timestamp>& getPromises() const { return this->promises; }

	void addPromise(Timestamp _t) { this->promises.push_back(_t); }

	/** @brief Drop `_t` from the promise list (no-op if absent) */
	void removePromise(Timestamp _t);

	/** @brief The thread may only terminate once this holds */
	bool hasNoPendingPromises() const { return this->promises.empty(); }

	/* ---------------------- application registers ---------------------- */

	/**
	 * @brief Current value and view of an application register
	 *
	 * Falls back to the initial snapshot (view 0) for registers never written.
	 *
	 * @throws StructuralError if the register is unknown
	 */
	RegisterValue readRegister(const std::string& _reg) const;

	void setRegister(const std::string& _reg, uint64_t _value, View _view);

	/** @brief View-stripped register file, initial snapshot overlaid with writes */
	RegisterMap getRegisterValues() const;

	/* ------------------------ system registers ------------------------ */

	/**
	 * @brief Last value of `_reg` visible at synchronization point `_s`
	 *
	 * Only the first `_s` history entries are considered, newest first; the
	 * initial snapshot is the fallback.
	 *
	 * @throws StructuralError if the register is unknown
	 */
	RegisterValue readSysregAt(const std::string& _reg, size_t _s) const;

	/**
	 * @brief Every value of `_reg` possibly visible given synchronization `_s`
	 *
	 * readSysregAt(_reg, _s) followed by every later write to `_reg`.
	 */
	std::vector<RegisterValue> readSysregAll(const std::string& _reg, size_t _s) const;

	/** @brief Append a system-register write and raise the MSR counter */
	void writeSysreg(const std::string& _reg, uint64_t _value, View _view);

	const std::vector<SysregWrite>& getSysregHistory() const { return this->sysregHistory; }

	/** @brief History length at the last context synchronization */
	size_t getSyncCursor() const { return this->syncCursor; }

	/**
	 * @brief Record a context synchronization event
	 *
	 * The cursor moves to the end of the system-register history and the CSE
	 * counter is raised to `_v`.
	 */
	void recordContextSync(View _v);

	/**
	 * @brief Record that the TLBI at `_t` completed with the current cursor
	 */
	void recordTlbiVisibility(Timestamp _t);

	const std::map<Timestamp, size_t>& getCseAtTlbi() const { return this->cseAtTlbi; }

	/* ------------------------------ views ------------------------------ */

	View getView(ViewKind _kind) const { return this->views[static_cast<size_t>(_kind)]; }

	/** @brief counter := counter ⊔ `_v` */
	void updateView(ViewKind _kind, View _v);

	View getCoherence(Location _loc) const;

	void updateCoherence(Location _loc, View _v);

	/* --------------------------- forwarding --------------------------- */

	std::optional<FwdItem> getFwd(Location _loc) const;

	void setFwd(Location _loc, const FwdItem& _item) { this->fwdb[_loc] = _item; }

	/* ---------------------------- exclusives ---------------------------- */

	const std::optional<ExclusiveMarker>& getExclusiveMarker() const { return this->xclb; }

	void setExclusiveMarker(const ExclusiveMarker& _marker) { this->xclb = _marker; }

	void clearExclusiveMarker() { this->xclb.reset(); }

	/* ------------------------------- TLB ------------------------------- */

	TranslationCache&       getTranslationCache() { return this->tlbCache; }
	const TranslationCache& getTranslationCache() const { return this->tlbCache; }

private:
	uint32_t tid;

	std::vector<Timestamp> promises;

	std::map<std::string, RegisterValue> regs;

	// Shared between forks; never modified after construction.
	std::shared_ptr<const RegisterMap> initialRegs;

	std::vector<SysregWrite> sysregHistory;
	size_t                   syncCursor = 0;

	std::map<Location, View> coherence;

	std::array<View, static_cast<size_t>(ViewKind::COUNT)> views{};

	std::map<Location, FwdItem> fwdb;

	std::optional<ExclusiveMarker> xclb;

	std::map<Timestamp, size_t> cseAtTlbi;

	TranslationCache tlbCache;
};

}  // namespace promsim
