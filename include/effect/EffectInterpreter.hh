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
 * @file EffectInterpreter.hh
 * @brief Executes abstract instruction effects against the promising model
 *
 * @details
 * EffectInterpreter is the orchestrator of the model. Each call to step()
 * takes one Effect and updates the current instruction's InstructionState,
 * the executing thread's ThreadState (including its TranslationCache) and the
 * shared Memory in place. The caller copies those objects before a step when it
 * wants to fork the path.
 *
 * Every step yields one of three outcomes:
 *
 * | Status    | Meaning                                               |
 * |-----------|-------------------------------------------------------|
 * | SUCCESS   | effect performed; `value` feeds the instruction stream |
 * | DISCARD   | this path breaks a model rule and must be abandoned    |
 * | FAILURE   | unsupported effect or malformed input (`errorKind`)    |
 *
 * A discarded or failed step may leave the state partially updated; the harness
 * drops that state.
 *
 * **Typical driver loop:**
 * @code{.cpp}
 * promsim::ScriptedOracle    oracle({1});
 * promsim::EffectInterpreter interp(promsim::ModelParams(), oracle);
 * promsim::InstructionState  iis;
 * for (const auto& effect : instruction) {
 *     auto result = interp.step(effect, iis, thread, memory);
 *     if (result.status != promsim::StepStatus::SUCCESS) break;
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "common/Errors.hh"
#include "common/View.hh"
#include "effect/ChoiceOracle.hh"
#include "effect/Effect.hh"
#include "effect/InstructionState.hh"
#include "memory/Memory.hh"
#include "thread/ThreadState.hh"
#include "thread/TranslationCache.hh"
#include "utils/HashableType.hh"

namespace promsim {

/** @brief Model parameters the interpreter runs with */
struct ModelParams {
	uint32_t          paBits             = 48;
	uint32_t          maxPendingPromises = 0;  ///< 0 = unlimited
	bool              enableForwarding   = true;
	bool              traceEffects       = false;
	TranslationParams translation;
};

enum class StepStatus { SUCCESS, DISCARD, FAILURE };

const char* toString(StepStatus _status);

struct StepResult {
	StepStatus  status    = StepStatus::SUCCESS;
	uint64_t    value     = 0;
	ErrorKind   errorKind = ErrorKind::NONE;
	std::string message;

	bool isSuccess() const { return this->status == StepStatus::SUCCESS; }

	static StepResult success(uint64_t _value = 0) { return StepResult{StepStatus::SUCCESS, _value}; }
	static StepResult discard(const std::string& _reason) {
		return StepResult{StepStatus::DISCARD, 0, ErrorKind::NONE, _reason};
	}
	static StepResult failure(ErrorKind _kind, const std::string& _message) {
		return StepResult{StepStatus::FAILURE, 0, _kind, _message};
	}
};

/** @brief Result of one explicit read */
struct ReadOutcome {
	bool          discarded = false;
	ReadCandidate candidate;
	View          postView = 0;
};

/** @brief Last view at which a read candidate may be observed */
using DeadlineFn = std::function<View(const ReadCandidate&)>;

class EffectInterpreter : virtual public HashableType {
public:
	/**
	 * @param _params  Model parameters
	 * @param _oracle  Resolves nondeterministic choices; must outlive the interpreter
	 */
	EffectInterpreter(const ModelParams& _params, ChoiceOracle& _oracle);

	const ModelParams& getParams() const { return this->params; }

	/**
	 * @brief Execute one effect of the instruction `_iis` on thread `_ts`
	 *
	 * UnsupportedError and StructuralError raised while executing are reported as
	 * StepStatus::FAILURE; path violations as StepStatus::DISCARD.
	 */
	StepResult step(const Effect& _effect, InstructionState& _iis, ThreadState& _ts, Memory& _mem);

	/**
	 * @brief Harness-side promise: append `_event` and make it pending on `_ts`
	 *
	 * @return The new timestamp, or nullopt once max_pending_promises is reached
	 * @throws StructuralError if a write event names another thread
	 */
	std::optional<Timestamp> promise(ThreadState& _ts, Memory& _mem, const Event& _event) const;

	/**
	 * @brief Dependency view of `_deps` within the current instruction
	 */
	View resolveDeps(const Deps& _deps, const InstructionState& _iis, const ThreadState& _ts) const;

	/* -------------------------- memory access -------------------------- */

	/**
	 * @brief Weak read of `_loc` with address view `_vaddr`
	 *
	 * The candidate observed is chosen by the oracle. Data reads raise coherence,
	 * the READ/ACQ/SPEC counters and record exclusive markers; translation reads
	 * (`_purpose` TRANSLATION) skip the coherence floor, forwarding and every
	 * thread-state update.
	 *
	 * @param _deadline  Invalidation bound per candidate; nullptr means none
	 */
	ReadOutcome readMemExplicit(InstructionState& _iis, ThreadState& _ts, const Memory& _mem, Location _loc,
	                            const AccessKind& _kind, ReadPurpose _purpose, View _vaddr,
	                            const DeadlineFn& _deadline = nullptr);

	/** @brief Plain or release write; exclusive kinds go through writeMemXcl() */
	StepResult writeMem(InstructionState& _iis, ThreadState& _ts, Memory& _mem, Location _loc, uint64_t _value,
	                    const AccessKind& _kind, View _vaddr, View _vdata) const;

	/** @brief Exclusive write paired with the outstanding exclusive load */
	StepResult writeMemXcl(InstructionState& _iis, ThreadState& _ts, Memory& _mem, Location _loc, uint64_t _value,
	                       const AccessKind& _kind, View _vaddr, View _vdata) const;

	/* ----------------------- barriers and TLB ops ----------------------- */

	void runBarrier(InstructionState& _iis, ThreadState& _ts, const Barrier& _barrier) const;

	StepResult runTlbi(InstructionState& _iis, ThreadState& _ts, Memory& _mem, const Tlbi& _tlbi) const;

	/** @brief Full context synchronization (ISB, exception return, termination) */
	void contextSync(ThreadState& _ts) const;

	/**
	 * @brief Is a cached walk still usable by `_ts`?
	 *
	 * It is not once a TLBI covering it lies in (entry.view, CSE ⊔ TLBI].
	 */
	bool isCachedWalkValid(const ThreadState& _ts, const Memory& _mem, uint64_t _va, const CachedWalk& _walk) const;

	/**
	 * @throws StructuralError if `_pa` lies beyond the physical address width
	 */
	void checkPhysicalAddress(uint64_t _pa) const;

private:
	StepResult execRegRead(const RegRead& _e, InstructionState& _iis, ThreadState& _ts);
	StepResult execRegWrite(const RegWrite& _e, InstructionState& _iis, ThreadState& _ts) const;
	StepResult execMemRead(const MemRead& _e, InstructionState& _iis, ThreadState& _ts, Memory& _mem);
	StepResult execMemWrite(const MemWrite& _e, InstructionState& _iis, ThreadState& _ts, Memory& _mem) const;
	StepResult execIfetch(const MemRead& _e, InstructionState& _iis, ThreadState& _ts, const Memory& _mem) const;
	StepResult execTranslationRead(const MemRead& _e, InstructionState& _iis, ThreadState& _ts, const Memory& _mem);
	StepResult execTranslationStart(const TranslationStart& _e, InstructionState& _iis, ThreadState& _ts,
	                                const Memory& _mem);
	StepResult execTranslationEnd(const TranslationEnd& _e, InstructionState& _iis, ThreadState& _ts) const;
	StepResult execChoose(const Choose& _e);

	StepResult dispatch(const Effect& _effect, InstructionState& _iis, ThreadState& _ts, Memory& _mem);

	/** @brief Oracle call skipped for a single candidate */
	size_t choose(ChoicePoint _point, size_t _count);

	void checkDataAccess(uint64_t _pa, uint32_t _size) const;

	View readBarrierFloor(const ThreadState& _ts, const AccessKind& _kind) const;
	View writeBarrierFloor(const ThreadState& _ts, const AccessKind& _kind) const;

	ModelParams   params;
	ChoiceOracle& oracle;
};

}  // namespace promsim
