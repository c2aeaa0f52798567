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

#include "scenario/Scenario.hh"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/Errors.hh"
#include "effect/ChoiceOracle.hh"
#include "effect/InstructionState.hh"
#include "memory/Memory.hh"
#include "scenario/EffectJson.hh"
#include "utils/Logging.hh"

namespace promsim {

using json = nlohmann::json;

namespace {

std::string hex(uint64_t _value) {
	std::stringstream ss;
	ss << "0x" << std::hex << _value;
	return ss.str();
}

Location location(const json& _j) {
	uint64_t pa = parseNumber(_j);
	if (pa != toLocation(pa)) throw StructuralError("location " + _j.dump() + " is not 8-byte aligned");
	return pa;
}

ScenarioThread parseThread(const json& _j) {
	ScenarioThread thread;
	if (_j.contains("registers")) {
		for (const auto& [reg, value] : _j.at("registers").items()) thread.registers[reg] = parseNumber(value);
	}
	for (const auto& instruction : _j.at("instructions")) {
		std::vector<Effect> effects;
		for (const auto& effect : instruction) effects.push_back(parseEffect(effect));
		thread.instructions.push_back(std::move(effects));
	}
	return thread;
}

}  // namespace

const char* toString(ScenarioStatus _status) {
	switch (_status) {
		case ScenarioStatus::COMPLETED: return "COMPLETED";
		case ScenarioStatus::DISCARDED: return "DISCARDED";
		case ScenarioStatus::FAILED: return "FAILED";
		default: return "UNKNOWN";
	}
}

/* ------------------------------- parsing ------------------------------- */

Scenario Scenario::fromJson(const json& _j) {
	if (!_j.is_object()) throw StructuralError("scenario is not a JSON object");

	Scenario scenario;
	try {
		scenario.name = _j.value("name", std::string("unnamed"));

		if (_j.contains("memory")) {
			for (const auto& [key, value] : _j.at("memory").items()) scenario.memory[location(json(key))] = parseNumber(value);
		}
		if (_j.contains("footprint")) {
			for (const auto& loc : _j.at("footprint")) scenario.footprint.insert(location(loc));
		}

		if (!_j.contains("threads") || _j.at("threads").empty()) throw StructuralError("scenario without threads");
		for (const auto& thread : _j.at("threads")) scenario.threads.push_back(parseThread(thread));

		if (_j.contains("schedule")) {
			for (const auto& t : _j.at("schedule")) scenario.schedule.push_back(static_cast<size_t>(parseNumber(t)));
		} else {
			for (size_t t = 0; t < scenario.threads.size(); ++t) {
				scenario.schedule.insert(scenario.schedule.end(), scenario.threads[t].instructions.size(), t);
			}
		}

		if (_j.contains("promises")) {
			for (const auto& p : _j.at("promises")) {
				scenario.promises.push_back(ScenarioPromise{static_cast<size_t>(parseNumber(p.at("before_step"))),
				                                            static_cast<size_t>(parseNumber(p.at("thread"))),
				                                            parseEvent(p.at("event"))});
			}
		}

		if (_j.contains("choices")) {
			for (const auto& c : _j.at("choices")) scenario.choices.push_back(parseNumber(c));
		}
	} catch (const json::exception& e) { throw StructuralError(std::string("malformed scenario: ") + e.what()); }

	for (size_t t : scenario.schedule) {
		if (t >= scenario.threads.size()) throw StructuralError("schedule names unknown thread " + std::to_string(t));
	}
	for (const auto& p : scenario.promises) {
		if (p.thread >= scenario.threads.size()) {
			throw StructuralError("promise by unknown thread " + std::to_string(p.thread));
		}
		if (p.beforeStep >= scenario.schedule.size()) {
			throw StructuralError("promise before step " + std::to_string(p.beforeStep) + " of a " +
			                      std::to_string(scenario.schedule.size()) + "-step schedule");
		}
	}
	return scenario;
}

Scenario Scenario::fromFile(const std::string& _path) {
	if (!std::filesystem::exists(_path)) throw StructuralError("scenario file " + _path + " does not exist");

	std::ifstream f(_path);
	if (!f.is_open()) throw StructuralError("cannot open scenario file " + _path);

	json j;
	try {
		j = json::parse(f);
	} catch (const json::parse_error& e) {
		throw StructuralError("JSON parsing error in " + _path + ": " + e.what());
	}
	return Scenario::fromJson(j);
}

/* ------------------------------- outcome ------------------------------- */

uint64_t ScenarioOutcome::valueAt(Location _loc) const {
	uint64_t value = 0;
	for (int i = 7; i >= 0; --i) {
		auto iter = this->snapshot.find(_loc + i);
		value     = (value << 8) | (iter == this->snapshot.end() ? 0 : iter->second);
	}
	return value;
}

json ScenarioOutcome::toJson() const {
	json j;
	j["status"] = toString(this->status);
	if (!this->message.empty()) j["message"] = this->message;
	if (this->errorKind != ErrorKind::NONE) j["error"] = toString(this->errorKind);

	json steps = json::array();
	for (const auto& record : this->trace) {
		json effects = json::array();
		for (const auto& e : record.effects) {
			json r = {{"effect", e.effect}, {"status", toString(e.result.status)}, {"value", hex(e.result.value)}};
			if (!e.result.message.empty()) r["message"] = e.result.message;
			effects.push_back(r);
		}
		steps.push_back(
		    {{"step", record.step}, {"thread", record.thread}, {"instruction", record.instruction}, {"effects", effects}});
	}
	j["steps"] = steps;

	json memory = json::object();
	for (const auto& [addr, byte] : this->snapshot) {
		if (addr == toLocation(addr)) memory[hex(addr)] = hex(this->valueAt(addr));
	}
	j["memory"] = memory;

	json registers = json::array();
	for (const auto& regs : this->registers) {
		json r = json::object();
		for (const auto& [name, value] : regs) r[name] = hex(value);
		registers.push_back(r);
	}
	j["registers"]          = registers;
	j["promises_fulfilled"] = this->promisesFulfilled;
	j["choices_consumed"]   = this->choicesConsumed;
	return j;
}

/* -------------------------------- replay -------------------------------- */

ScenarioOutcome ScenarioRunner::run(const Scenario& _scenario) const {
	ScenarioOutcome outcome;

	auto   initial = _scenario.memory;
	Memory memory([initial](Location _loc) {
		auto iter = initial.find(_loc);
		return iter == initial.end() ? uint64_t(0) : iter->second;
	});

	std::vector<ThreadState> threads;
	for (size_t t = 0; t < _scenario.threads.size(); ++t) {
		threads.emplace_back(uint32_t(t), _scenario.threads[t].registers, this->params.translation);
	}
	std::vector<size_t> nextInstruction(threads.size(), 0);

	ScriptedOracle    oracle(_scenario.choices);
	EffectInterpreter interpreter(this->params, oracle);

	CLASS_INFO << "Replaying '" << _scenario.name << "': " << threads.size() << " threads, "
	           << _scenario.schedule.size() << " steps";

	try {
		for (size_t step = 0; step < _scenario.schedule.size() && outcome.status == ScenarioStatus::COMPLETED;
		     ++step) {
			for (const auto& p : _scenario.promises) {
				if (p.beforeStep != step) continue;
				if (!interpreter.promise(threads[p.thread], memory, p.event)) {
					outcome.status  = ScenarioStatus::DISCARDED;
					outcome.message = "promise limit reached on thread " + std::to_string(p.thread);
					break;
				}
			}
			if (outcome.status != ScenarioStatus::COMPLETED) break;

			size_t t     = _scenario.schedule[step];
			size_t index = nextInstruction[t]++;
			if (index >= _scenario.threads[t].instructions.size()) {
				throw StructuralError("thread " + std::to_string(t) + " has no instruction left at step " +
				                      std::to_string(step));
			}

			InstructionRecord record{step, t, index, {}};
			InstructionState  iis;
			for (const Effect& effect : _scenario.threads[t].instructions[index]) {
				StepResult result = interpreter.step(effect, iis, threads[t], memory);
				record.effects.push_back(EffectRecord{effectName(effect), result});

				if (result.status == StepStatus::DISCARD) {
					outcome.status  = ScenarioStatus::DISCARDED;
					outcome.message = result.message;
				} else if (result.status == StepStatus::FAILURE) {
					outcome.status    = ScenarioStatus::FAILED;
					outcome.errorKind = result.errorKind;
					outcome.message   = result.message;
				}
				if (!result.isSuccess()) break;
			}
			outcome.trace.push_back(std::move(record));

			if (outcome.status == ScenarioStatus::COMPLETED && iis.getNumOpenWalks() != 0) {
				throw StructuralError("instruction " + std::to_string(index) + " of thread " + std::to_string(t) +
				                      " ends with a translation in progress");
			}
		}
	} catch (const PromSimError& e) {
		outcome.status    = ScenarioStatus::FAILED;
		outcome.errorKind = e.getKind();
		outcome.message   = e.what();
	}

	for (const auto& thread : threads) {
		outcome.promisesFulfilled = outcome.promisesFulfilled && thread.hasNoPendingPromises();
		outcome.registers.push_back(thread.getRegisterValues());
	}
	if (outcome.status == ScenarioStatus::COMPLETED && !outcome.promisesFulfilled) {
		outcome.status  = ScenarioStatus::DISCARDED;
		outcome.message = "promises left unfulfilled";
	}

	std::set<Location> footprint = _scenario.footprint;
	for (const auto& [loc, value] : _scenario.memory) footprint.insert(loc);
	outcome.snapshot        = memory.snapshot(footprint);
	outcome.choicesConsumed = oracle.getConsumed();

	CLASS_INFO << "'" << _scenario.name << "' " << toString(outcome.status)
	           << (outcome.message.empty() ? "" : ": " + outcome.message);
	return outcome;
}

}  // namespace promsim
