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

#include "effect/EffectInterpreter.hh"

#include <algorithm>
#include <deque>
#include <sstream>
#include <string>
#include <vector>

#include "utils/Logging.hh"
#include "utils/Overloaded.hh"

namespace promsim {

namespace {

std::string hex(uint64_t _value) {
	std::stringstream ss;
	ss << "0x" << std::hex << _value;
	return ss.str();
}

// Page or block descriptor: the last level, or a non-table entry above it.
bool isLeafDescriptor(uint32_t _level, uint32_t _levels, uint64_t _descriptor) {
	return _level + 1 == _levels || (_descriptor & 0x3) == 0x1;
}

}  // namespace

const char* toString(StepStatus _status) {
	switch (_status) {
		case StepStatus::SUCCESS: return "SUCCESS";
		case StepStatus::DISCARD: return "DISCARD";
		case StepStatus::FAILURE: return "FAILURE";
		default: return "UNKNOWN";
	}
}

EffectInterpreter::EffectInterpreter(const ModelParams& _params, ChoiceOracle& _oracle)
    : params(_params), oracle(_oracle) {
	if (this->params.paBits == 0 || this->params.paBits > 64) {
		throw StructuralError("physical address width of " + std::to_string(this->params.paBits) + " bits");
	}
}

StepResult EffectInterpreter::step(const Effect& _effect, InstructionState& _iis, ThreadState& _ts, Memory& _mem) {
	StepResult result;
	try {
		result = this->dispatch(_effect, _iis, _ts, _mem);
	} catch (const PromSimError& e) { result = StepResult::failure(e.getKind(), e.what()); }

	if (this->params.traceEffects) {
		LABELED_INFO("Thread " + std::to_string(_ts.getTid()))
		    << effectName(_effect) << " -> " << toString(result.status) << " value=" << hex(result.value)
		    << (result.message.empty() ? "" : " (" + result.message + ")");
	}
	return result;
}

StepResult EffectInterpreter::dispatch(const Effect& _effect, InstructionState& _iis, ThreadState& _ts,
                                       Memory& _mem) {
	return std::visit(
	    overloaded{
	        [&](const RegRead& _e) { return this->execRegRead(_e, _iis, _ts); },
	        [&](const RegWrite& _e) { return this->execRegWrite(_e, _iis, _ts); },
	        [&](const MemRead& _e) { return this->execMemRead(_e, _iis, _ts, _mem); },
	        [&](const MemWrite& _e) { return this->execMemWrite(_e, _iis, _ts, _mem); },
	        [&](const MemAtomic& _e) -> StepResult {
		        throw UnsupportedError("atomic read-modify-write at " + hex(_e.pa));
	        },
	        [&](const Barrier& _e) {
		        this->runBarrier(_iis, _ts, _e);
		        return StepResult::success();
	        },
	        [&](const Tlbi& _e) { return this->runTlbi(_iis, _ts, _mem, _e); },
	        [&](const BranchAnnounce& _e) {
		        _ts.updateView(ViewKind::SPEC, this->resolveDeps(_e.deps, _iis, _ts));
		        return StepResult::success();
	        },
	        [&](const TranslationStart& _e) { return this->execTranslationStart(_e, _iis, _ts, _mem); },
	        [&](const TranslationEnd& _e) { return this->execTranslationEnd(_e, _iis, _ts); },
	        [&](const ExceptionReturn&) {
		        this->contextSync(_ts);
		        return StepResult::success();
	        },
	        [&](const Terminate&) {
		        this->contextSync(_ts);
		        return StepResult::success();
	        },
	        [&](const Choose& _e) { return this->execChoose(_e); },
	        [&](const Discard&) { return StepResult::discard("discarded by the instruction semantics"); }},
	    _effect);
}

std::optional<Timestamp> EffectInterpreter::promise(ThreadState& _ts, Memory& _mem, const Event& _event) const {
	if (this->params.maxPendingPromises != 0 && _ts.getPromises().size() >= this->params.maxPendingPromises) {
		return std::nullopt;
	}
	if (const auto* write = std::get_if<WriteEvent>(&_event)) {
		if (write->tid != _ts.getTid()) {
			throw StructuralError("thread " + std::to_string(_ts.getTid()) + " cannot promise a write of thread " +
			                      std::to_string(write->tid));
		}
		this->checkPhysicalAddress(write->location);
		if (write->location != toLocation(write->location)) {
			throw StructuralError("promised write to unaligned location " + hex(write->location));
		}
	}

	Event event = _event;
	if (auto* tlbi = std::get_if<TlbiEvent>(&event)) {
		tlbi->descriptor = tlbi->descriptor.normalized(this->params.translation.granuleBits);
	}
	Timestamp t = _mem.promise(event);
	_ts.addPromise(t);
	return t;
}

View EffectInterpreter::resolveDeps(const Deps& _deps, const InstructionState& _iis, const ThreadState& _ts) const {
	return std::visit(overloaded{[&](const ImplicitAll&) { return _iis.implicitDepsView(); },
	                             [&](const ExplicitDeps& _explicit) {
		                             View v = 0;
		                             for (const auto& reg : _explicit.registers) joinInto(v, _ts.readRegister(reg).view);
		                             for (size_t index : _explicit.reads) joinInto(v, _iis.getReadView(index));
		                             return v;
	                             }},
	                  _deps);
}

/* ------------------------------ validation ------------------------------ */

void EffectInterpreter::checkPhysicalAddress(uint64_t _pa) const {
	if (this->params.paBits < 64 && (_pa >> this->params.paBits) != 0) {
		throw StructuralError("physical address " + hex(_pa) + " beyond the " + std::to_string(this->params.paBits) +
		                      "-bit physical address space");
	}
}

void EffectInterpreter::checkDataAccess(uint64_t _pa, uint32_t _size) const {
	this->checkPhysicalAddress(_pa);
	if (_size != 8) throw UnsupportedError(std::to_string(_size) + "-byte access at " + hex(_pa));
	if (_pa % 8 != 0) throw UnsupportedError("misaligned access at " + hex(_pa));
}

size_t EffectInterpreter::choose(ChoicePoint _point, size_t _count) {
	return _count <= 1 ? 0 : this->oracle.chooseIndex(_point, _count);
}

/* -------------------------------- views -------------------------------- */

View EffectInterpreter::readBarrierFloor(const ThreadState& _ts, const AccessKind& _kind) const {
	View v = join(_ts.getView(ViewKind::DMB), _ts.getView(ViewKind::DSB), _ts.getView(ViewKind::ISB),
	              _ts.getView(ViewKind::ACQ));
	// RCsc acquire loads are ordered after earlier release stores.
	if (_kind.strength == AccessStrength::ACQUIRE) joinInto(v, _ts.getView(ViewKind::REL));
	return v;
}

View EffectInterpreter::writeBarrierFloor(const ThreadState& _ts, const AccessKind& _kind) const {
	View v = join(_ts.getView(ViewKind::DMB), _ts.getView(ViewKind::DSB), _ts.getView(ViewKind::ISB),
	              _ts.getView(ViewKind::ACQ), _ts.getView(ViewKind::DMB_ST));
	if (_kind.strength == AccessStrength::RELEASE) {
		joinInto(v, join(_ts.getView(ViewKind::READ), _ts.getView(ViewKind::WRITE)));
	}
	return v;
}

/* ---------------------------- memory access ---------------------------- */

ReadOutcome EffectInterpreter::readMemExplicit(InstructionState& _iis, ThreadState& _ts, const Memory& _mem,
                                               Location _loc, const AccessKind& _kind, ReadPurpose _purpose,
                                               View _vaddr, const DeadlineFn& _deadline) {
	bool translation = _purpose == ReadPurpose::TRANSLATION;

	View vpre  = join(_vaddr, this->readBarrierFloor(_ts, _kind), _iis.getNonRegView());
	View vread = translation ? vpre : join(vpre, _ts.getCoherence(_loc));

	std::vector<ReadCandidate> candidates = _mem.read(_loc, vread);
	ReadCandidate              chosen     = candidates[this->choose(ChoicePoint::READ_CANDIDATE, candidates.size())];

	View vrd = chosen.timestamp;
	if (!translation && this->params.enableForwarding) {
		if (auto fwd = _ts.getFwd(_loc); fwd && fwd->time == chosen.timestamp) {
			vrd = (fwd->isExclusive && !_kind.isPlain()) ? fwd->time : fwd->view;
		}
	}

	ReadOutcome outcome{false, chosen, join(vpre, vrd)};
	if (_deadline && outcome.postView > _deadline(chosen)) {
		outcome.discarded = true;
		return outcome;
	}

	_iis.addReadView(outcome.postView);
	_iis.addNonReg(outcome.postView);
	if (translation) return outcome;

	_ts.updateCoherence(_loc, chosen.timestamp);
	_ts.updateView(ViewKind::READ, outcome.postView);
	if (_kind.strength != AccessStrength::PLAIN) _ts.updateView(ViewKind::ACQ, outcome.postView);
	_ts.updateView(ViewKind::SPEC, _vaddr);
	if (_kind.exclusive) _ts.setExclusiveMarker(ExclusiveMarker{chosen.timestamp, outcome.postView, _loc});
	return outcome;
}

StepResult EffectInterpreter::writeMem(InstructionState& _iis, ThreadState& _ts, Memory& _mem, Location _loc,
                                       uint64_t _value, const AccessKind& _kind, View _vaddr, View _vdata) const {
	Event event = WriteEvent{_ts.getTid(), _loc, _value};

	std::optional<Timestamp> fulfilled = _mem.fulfill(event, _ts.getPromises());
	Timestamp                t         = fulfilled ? *fulfilled : _mem.size() + 1;

	View vpre = join(_vaddr, _vdata, _ts.getView(ViewKind::SPEC), this->writeBarrierFloor(_ts, _kind),
	                 _iis.getNonRegView());
	if (join(vpre, _ts.getCoherence(_loc)) >= t) {
		return StepResult::discard("write to " + hex(_loc) + " at t=" + std::to_string(t) +
		                           " is not after its pre-view");
	}

	if (fulfilled) {
		_ts.removePromise(t);
	} else {
		_mem.promise(event);
	}

	_ts.updateCoherence(_loc, t);
	_ts.updateView(ViewKind::WRITE, t);
	if (_kind.strength == AccessStrength::RELEASE) _ts.updateView(ViewKind::REL, t);
	_ts.setFwd(_loc, FwdItem{t, join(_vaddr, _vdata), _kind.exclusive});
	_iis.addNonReg(t);
	return StepResult::success(1);
}

StepResult EffectInterpreter::writeMemXcl(InstructionState& _iis, ThreadState& _ts, Memory& _mem, Location _loc,
                                          uint64_t _value, const AccessKind& _kind, View _vaddr,
                                          View _vdata) const {
	const auto& marker = _ts.getExclusiveMarker();
	if (!marker) return StepResult::discard("exclusive store to " + hex(_loc) + " without an exclusive load");
	if (marker->location != _loc) {
		return StepResult::discard("exclusive store to " + hex(_loc) + " paired with a load of " +
		                           hex(marker->location));
	}

	Event                    event     = WriteEvent{_ts.getTid(), _loc, _value};
	std::optional<Timestamp> fulfilled = _mem.fulfill(event, _ts.getPromises());
	Timestamp                t         = fulfilled ? *fulfilled : _mem.size() + 1;

	if (!_mem.exclusive(_loc, marker->time, _ts.getTid(), t)) {
		return StepResult::discard("exclusive pair on " + hex(_loc) + " interrupted by another thread");
	}

	AccessKind kind = _kind;
	kind.exclusive  = true;
	StepResult result = this->writeMem(_iis, _ts, _mem, _loc, _value, kind, _vaddr, _vdata);
	if (result.isSuccess()) _ts.clearExclusiveMarker();
	return result;
}

/* ----------------------------- barriers, TLB ----------------------------- */

void EffectInterpreter::contextSync(ThreadState& _ts) const {
	_ts.recordContextSync(join(_ts.getView(ViewKind::SPEC), _ts.getView(ViewKind::CSE), _ts.getView(ViewKind::DSB),
	                           _ts.getView(ViewKind::MSR)));
}

void EffectInterpreter::runBarrier(InstructionState& _iis, ThreadState& _ts, const Barrier& _barrier) const {
	if (_barrier.domain == Shareability::NON_SHAREABLE) throw UnsupportedError("non-shareable barrier");

	View vRead  = _ts.getView(ViewKind::READ);
	View vWrite = _ts.getView(ViewKind::WRITE);
	View vCse   = _ts.getView(ViewKind::CSE);
	View vDsb   = _ts.getView(ViewKind::DSB);

	View v = 0;
	switch (_barrier.type) {
		case BarrierType::DMB:
			switch (_barrier.scope) {
				case BarrierScope::SY:
					v = join(vRead, vWrite, vCse, vDsb);
					_ts.updateView(ViewKind::DMB, v);
					break;
				case BarrierScope::LD:
					v = join(vRead, vCse, vDsb);
					_ts.updateView(ViewKind::DMB, v);
					break;
				case BarrierScope::ST:
					v = join(vWrite, vCse, vDsb);
					_ts.updateView(ViewKind::DMB_ST, v);
					break;
			}
			break;
		case BarrierType::DSB: {
			View vTlbi = _ts.getView(ViewKind::TLBI);
			switch (_barrier.scope) {
				case BarrierScope::SY: v = join(vRead, vWrite, vTlbi, _ts.getView(ViewKind::MSR), vCse); break;
				case BarrierScope::LD: v = join(vRead, vCse); break;
				case BarrierScope::ST: v = join(vWrite, vTlbi, vCse); break;
			}
			_ts.updateView(ViewKind::DSB, v);
			break;
		}
		case BarrierType::ISB:
			this->contextSync(_ts);
			v = _ts.getView(ViewKind::CSE);
			_ts.updateView(ViewKind::ISB, v);
			break;
	}
	_iis.addNonReg(v);
}

StepResult EffectInterpreter::runTlbi(InstructionState& _iis, ThreadState& _ts, Memory& _mem,
                                      const Tlbi& _tlbi) const {
	if (_tlbi.domain != Shareability::INNER && _tlbi.domain != Shareability::FULL_SYSTEM) {
		throw UnsupportedError("TLBI outside the inner shareable domain");
	}
	if (_tlbi.regime != Regime::EL10) throw UnsupportedError("TLBI for the EL2 or EL3 translation regime");

	View vdeps = this->resolveDeps(_tlbi.deps, _iis, _ts);

	Event event = TlbiEvent{TlbiDescriptor{_tlbi.scope, _tlbi.asid, _tlbi.va, _tlbi.lastLevelOnly}.normalized(
	    this->params.translation.granuleBits)};

	std::optional<Timestamp> fulfilled = _mem.fulfill(event, _ts.getPromises());
	Timestamp                t         = fulfilled ? *fulfilled : _mem.size() + 1;

	View vpre = join(_ts.getView(ViewKind::CSE), _ts.getView(ViewKind::DSB), _iis.getNonRegView(), vdeps);
	if (vpre >= t) return StepResult::discard("TLBI at t=" + std::to_string(t) + " is not after its pre-view");

	if (fulfilled) {
		_ts.removePromise(t);
	} else {
		_mem.promise(event);
	}

	_ts.updateView(ViewKind::TLBI, t);
	_ts.recordTlbiVisibility(t);
	_iis.addNonReg(t);
	return StepResult::success();
}

/* ------------------------------- effects ------------------------------- */

StepResult EffectInterpreter::execRegRead(const RegRead& _e, InstructionState& _iis, ThreadState& _ts) {
	if (!_e.direct) throw UnsupportedError("indirect access to register '" + _e.reg + "'");

	RegisterValue rv;
	if (_e.cls == RegisterClass::APPLICATION) {
		rv = _ts.readRegister(_e.reg);
	} else if (_e.relaxed) {
		std::vector<RegisterValue> visible = _ts.readSysregAll(_e.reg, _ts.getSyncCursor());
		rv = visible[this->choose(ChoicePoint::SYSREG_VALUE, visible.size())];
	} else {
		rv = _ts.readSysregAt(_e.reg, _ts.getSysregHistory().size());
	}

	_iis.addRegRead(rv.view);
	return StepResult::success(rv.value);
}

StepResult EffectInterpreter::execRegWrite(const RegWrite& _e, InstructionState& _iis, ThreadState& _ts) const {
	if (!_e.direct) throw UnsupportedError("indirect access to register '" + _e.reg + "'");

	View v = this->resolveDeps(_e.deps, _iis, _ts);
	if (_e.cls == RegisterClass::APPLICATION) {
		_ts.setRegister(_e.reg, _e.value, v);
	} else {
		_ts.writeSysreg(_e.reg, _e.value, join(v, _ts.getView(ViewKind::CSE)));
	}
	return StepResult::success();
}

StepResult EffectInterpreter::execMemRead(const MemRead& _e, InstructionState& _iis, ThreadState& _ts,
                                          Memory& _mem) {
	switch (_e.purpose) {
		case ReadPurpose::IFETCH: return this->execIfetch(_e, _iis, _ts, _mem);
		case ReadPurpose::TRANSLATION: return this->execTranslationRead(_e, _iis, _ts, _mem);
		default: break;
	}

	this->checkDataAccess(_e.pa, _e.size);
	View        vaddr   = this->resolveDeps(_e.addrDeps, _iis, _ts);
	ReadOutcome outcome = this->readMemExplicit(_iis, _ts, _mem, _e.pa, _e.kind, _e.purpose, vaddr);
	return StepResult::success(outcome.candidate.value);
}

StepResult EffectInterpreter::execMemWrite(const MemWrite& _e, InstructionState& _iis, ThreadState& _ts,
                                           Memory& _mem) const {
	this->checkDataAccess(_e.pa, _e.size);
	View vaddr = this->resolveDeps(_e.addrDeps, _iis, _ts);
	View vdata = this->resolveDeps(_e.dataDeps, _iis, _ts);
	if (_e.kind.exclusive) return this->writeMemXcl(_iis, _ts, _mem, _e.pa, _e.value, _e.kind, vaddr, vdata);
	return this->writeMem(_iis, _ts, _mem, _e.pa, _e.value, _e.kind, vaddr, vdata);
}

StepResult EffectInterpreter::execIfetch(const MemRead& _e, InstructionState& _iis, ThreadState& _ts,
                                         const Memory& _mem) const {
	this->checkPhysicalAddress(_e.pa);
	if (!((_e.size == 4 && _e.pa % 4 == 0) || (_e.size == 8 && _e.pa % 8 == 0))) {
		throw UnsupportedError(std::to_string(_e.size) + "-byte instruction fetch at " + hex(_e.pa));
	}

	View          vCse = _ts.getView(ViewKind::CSE);
	ReadCandidate cell = _mem.readAt(toLocation(_e.pa), vCse);

	uint64_t value = cell.value;
	if (_e.size == 4) value = (_e.pa & 0x4) ? (cell.value >> 32) : (cell.value & 0xffffffffULL);

	_iis.addReadView(vCse);
	return StepResult::success(value);
}

StepResult EffectInterpreter::execTranslationRead(const MemRead& _e, InstructionState& _iis, ThreadState& _ts,
                                                  const Memory& _mem) {
	this->checkDataAccess(_e.pa, _e.size);

	const TranslationCache& cache  = _ts.getTranslationCache();
	uint32_t                levels = cache.getLevels();

	WalkState* walk = _iis.findWalk(cache.vaPrefix(_e.va, levels - 1));
	if (!walk) throw StructuralError("translation read of " + hex(_e.pa) + " with no walk of " + hex(_e.va));

	uint32_t level = uint32_t(walk->collected.size());
	if (level >= levels) {
		throw StructuralError("translation walk of " + hex(_e.va) + " reads beyond the last level");
	}

	// Descriptors of a cached walk are replayed without touching memory.
	if (!walk->remaining.empty()) {
		uint64_t descriptor = walk->remaining.front();
		walk->remaining.pop_front();
		walk->collected.push_back(descriptor);
		_iis.addReadView(walk->time);
		return StepResult::success(descriptor);
	}

	Location   loc      = _e.pa;
	DeadlineFn deadline = [&](const ReadCandidate& _c) {
		bool leaf = isLeafDescriptor(level, levels, _c.value);
		bool global = leaf && ((_c.value >> TranslationCache::DESCRIPTOR_NG_BIT) & 1) == 0;
		auto region = cache.region(walk->va, level, global ? std::nullopt : std::optional<Asid>(walk->asid), leaf);
		return meet(walk->deadline, _mem.invalidationDeadline(loc, _c.timestamp, region));
	};

	ReadOutcome outcome =
	    this->readMemExplicit(_iis, _ts, _mem, loc, _e.kind, ReadPurpose::TRANSLATION, walk->time, deadline);
	if (outcome.discarded) {
		return StepResult::discard("stale translation of " + hex(walk->va) + " read at level " +
		                           std::to_string(level));
	}

	walk->deadline = deadline(outcome.candidate);
	joinInto(walk->time, outcome.postView);
	walk->collected.push_back(outcome.candidate.value);
	return StepResult::success(outcome.candidate.value);
}

bool EffectInterpreter::isCachedWalkValid(const ThreadState& _ts, const Memory& _mem, uint64_t _va,
                                          const CachedWalk& _walk) const {
	View limit = std::min<View>(join(_ts.getView(ViewKind::CSE), _ts.getView(ViewKind::TLBI)), _mem.size());
	if (_walk.entry.view >= limit) return true;

	TranslationRegion region =
	    _ts.getTranslationCache().region(_va, _walk.level, _walk.asid, _walk.entry.complete);
	return !MemoryCut(_mem.getEvents(), _walk.entry.view, limit).findCoveringTlbi(region).has_value();
}

StepResult EffectInterpreter::execTranslationStart(const TranslationStart& _e, InstructionState& _iis,
                                                   ThreadState& _ts, const Memory& _mem) {
	const TranslationCache& cache  = _ts.getTranslationCache();
	uint64_t                prefix = cache.vaPrefix(_e.va, cache.getLevels() - 1);
	if (_iis.hasWalk(prefix)) throw StructuralError("translation of " + hex(_e.va) + " already in progress");

	std::vector<CachedWalk> valid;
	for (auto& cached : cache.lookup(_e.va, _e.asid)) {
		if (this->isCachedWalkValid(_ts, _mem, _e.va, cached)) valid.push_back(std::move(cached));
	}

	WalkState walk;
	walk.va   = _e.va;
	walk.asid = _e.asid;
	walk.time = join(_ts.getView(ViewKind::CSE), this->resolveDeps(_e.deps, _iis, _ts));

	// 0 is a fresh walk; i > 0 replays the (i-1)-th valid cached walk.
	size_t choice = this->choose(ChoicePoint::WALK_CANDIDATE, valid.size() + 1);
	if (choice > 0) {
		const auto& descriptors = valid[choice - 1].entry.descriptors;
		walk.remaining.assign(descriptors.begin(), descriptors.end());
	}

	_iis.startWalk(prefix, std::move(walk));
	return StepResult::success();
}

StepResult EffectInterpreter::execTranslationEnd(const TranslationEnd& _e, InstructionState& _iis,
                                                 ThreadState& _ts) const {
	TranslationCache& cache = _ts.getTranslationCache();

	std::optional<WalkState> walk = _iis.endWalk(cache.vaPrefix(_e.va, cache.getLevels() - 1));
	if (!walk) throw StructuralError("no translation of " + hex(_e.va) + " in progress");

	_iis.addNonReg(walk->time);

	if (walk->deadline != VIEW_INFINITY) return StepResult::success();

	std::vector<uint64_t> descriptors = walk->collected;
	// The faulting descriptor is never cached; the tables above it may be.
	if (_e.fault && !descriptors.empty()) descriptors.pop_back();
	cache.unionWith(cache.fromWalk(walk->va, walk->asid, descriptors, walk->time, !_e.fault));
	return StepResult::success();
}

StepResult EffectInterpreter::execChoose(const Choose& _e) {
	if (_e.bits == 0 || _e.bits > 64) {
		throw StructuralError("choice of " + std::to_string(_e.bits) + " bits");
	}
	return StepResult::success(this->oracle.chooseBits(_e.bits));
}

}  // namespace promsim
