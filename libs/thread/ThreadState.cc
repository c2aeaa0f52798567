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

#include "thread/ThreadState.hh"

#include <algorithm>

#include "common/Errors.hh"

namespace promsim {

const char* toString(ViewKind _kind) {
	switch (_kind) {
		case ViewKind::READ: return "vRead";
		case ViewKind::WRITE: return "vWrite";
		case ViewKind::DMB: return "vDmb";
		case ViewKind::DMB_ST: return "vDmbSt";
		case ViewKind::DSB: return "vDsb";
		case ViewKind::ISB: return "vIsb";
		case ViewKind::SPEC: return "vSpec";
		case ViewKind::CSE: return "vCse";
		case ViewKind::TLBI: return "vTlbi";
		case ViewKind::MSR: return "vMsr";
		case ViewKind::ACQ: return "vAcq";
		case ViewKind::REL: return "vRel";
		default: return "invalid";
	}
}

ThreadState::ThreadState(uint32_t _tid, const RegisterMap& _initialRegs, const TranslationParams& _translation)
    : tid(_tid), initialRegs(std::make_shared<const RegisterMap>(_initialRegs)), tlbCache(_translation) {}

void ThreadState::removePromise(Timestamp _t) {
	auto iter = std::find(this->promises.begin(), this->promises.end(), _t);
	if (iter != this->promises.end()) this->promises.erase(iter);
}

RegisterValue ThreadState::readRegister(const std::string& _reg) const {
	if (auto iter = this->regs.find(_reg); iter != this->regs.end()) return iter->second;
	if (auto iter = this->initialRegs->find(_reg); iter != this->initialRegs->end()) {
		return RegisterValue{iter->second, 0};
	}
	throw StructuralError("register '" + _reg + "' of thread " + std::to_string(this->tid) + " has no known mapping");
}

void ThreadState::setRegister(const std::string& _reg, uint64_t _value, View _view) {
	this->regs[_reg] = RegisterValue{_value, _view};
}

RegisterMap ThreadState::getRegisterValues() const {
	RegisterMap values = *this->initialRegs;
	for (const auto& [reg, rv] : this->regs) values[reg] = rv.value;
	return values;
}

RegisterValue ThreadState::readSysregAt(const std::string& _reg, size_t _s) const {
	size_t visible = std::min(_s, this->sysregHistory.size());
	for (size_t i = visible; i > 0; --i) {
		const auto& entry = this->sysregHistory[i - 1];
		if (entry.reg == _reg) return RegisterValue{entry.value, entry.view};
	}
	if (auto iter = this->initialRegs->find(_reg); iter != this->initialRegs->end()) {
		return RegisterValue{iter->second, 0};
	}
	throw StructuralError("system register '" + _reg + "' of thread " + std::to_string(this->tid) +
	                      " has no known mapping");
}

std::vector<RegisterValue> ThreadState::readSysregAll(const std::string& _reg, size_t _s) const {
	std::vector<RegisterValue> values{this->readSysregAt(_reg, _s)};
	for (size_t i = std::min(_s, this->sysregHistory.size()); i < this->sysregHistory.size(); ++i) {
		const auto& entry = this->sysregHistory[i];
		if (entry.reg == _reg) values.push_back(RegisterValue{entry.value, entry.view});
	}
	return values;
}

void ThreadState::writeSysreg(const std::string& _reg, uint64_t _value, View _view) {
	this->sysregHistory.push_back(SysregWrite{_reg, _value, _view});
	this->updateView(ViewKind::MSR, _view);
}

void ThreadState::recordContextSync(View _v) {
	this->syncCursor = this->sysregHistory.size();
	this->updateView(ViewKind::CSE, _v);
}

void ThreadState::recordTlbiVisibility(Timestamp _t) { this->cseAtTlbi[_t] = this->syncCursor; }

void ThreadState::updateView(ViewKind _kind, View _v) {
	joinInto(this->views.at(static_cast<size_t>(_kind)), _v);
}

View ThreadState::getCoherence(Location _loc) const {
	auto iter = this->coherence.find(_loc);
	return iter == this->coherence.end() ? 0 : iter->second;
}

void ThreadState::updateCoherence(Location _loc, View _v) { joinInto(this->coherence[_loc], _v); }

std::optional<FwdItem> ThreadState::getFwd(Location _loc) const {
	auto iter = this->fwdb.find(_loc);
	if (iter == this->fwdb.end()) return std::nullopt;
	return iter->second;
}

}  // namespace promsim
