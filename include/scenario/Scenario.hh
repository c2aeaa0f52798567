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
 * @file Scenario.hh
 * @brief Deterministic replay of a litmus-style scenario through the model
 *
 * @details
 * A Scenario fixes every decision an exploration harness would make: which
 * thread executes its next instruction at each step (`schedule`), when promises
 * are made (`promises`) and how the oracle resolves each choice (`choices`).
 * ScenarioRunner replays it on fresh model state and reports the outcome.
 *
 * @code{.json}
 * {
 *   "name": "MP+dmbs",
 *   "memory": { "0x1000": 0, "0x1008": 0 },
 *   "threads": [
 *     { "instructions": [
 *         [ { "kind": "MemWrite", "pa": "0x1000", "value": 1 } ],
 *         [ { "kind": "Barrier", "type": "dmb" } ],
 *         [ { "kind": "MemWrite", "pa": "0x1008", "value": 1 } ] ] },
 *     { "registers": { "x0": 0 },
 *       "instructions": [
 *         [ { "kind": "MemRead", "pa": "0x1008" }, { "kind": "RegWrite", "reg": "x0" } ] ] }
 *   ],
 *   "schedule": [0, 0, 0, 1],
 *   "choices": [0]
 * }
 * @endcode
 *
 * `promises` entries look like
 * `{"before_step": 0, "thread": 0, "event": {"kind": "write", "tid": 0, "location": "0x1000", "value": 1}}`.
 * Without a `schedule`, the threads run one after the other in full.
 */

#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "effect/Effect.hh"
#include "effect/EffectInterpreter.hh"
#include "memory/Event.hh"
#include "thread/ThreadState.hh"
#include "utils/HashableType.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace promsim {

struct ScenarioThread {
	RegisterMap                      registers;
	std::vector<std::vector<Effect>> instructions;
};

/** @brief A harness promise made right before step `beforeStep` */
struct ScenarioPromise {
	size_t beforeStep = 0;
	size_t thread     = 0;
	Event  event;
};

struct Scenario {
	std::string                  name;
	std::map<Location, uint64_t> memory;
	std::set<Location>           footprint;
	std::vector<ScenarioThread>  threads;
	std::vector<size_t>          schedule;
	std::vector<ScenarioPromise> promises;
	std::vector<uint64_t>        choices;

	/** @throws StructuralError on a malformed scenario */
	static Scenario fromJson(const nlohmann::json& _j);

	/** @throws StructuralError if the file cannot be read or parsed */
	static Scenario fromFile(const std::string& _path);
};

enum class ScenarioStatus { COMPLETED, DISCARDED, FAILED };

const char* toString(ScenarioStatus _status);

struct EffectRecord {
	std::string effect;
	StepResult  result;
};

struct InstructionRecord {
	size_t                    step        = 0;
	size_t                    thread      = 0;
	size_t                    instruction = 0;
	std::vector<EffectRecord> effects;
};

struct ScenarioOutcome {
	ScenarioStatus                 status    = ScenarioStatus::COMPLETED;
	ErrorKind                      errorKind = ErrorKind::NONE;
	std::string                    message;
	std::vector<InstructionRecord> trace;
	std::map<uint64_t, uint8_t>    snapshot;
	std::vector<RegisterMap>       registers;
	bool                           promisesFulfilled = true;
	size_t                         choicesConsumed   = 0;

	/** @brief 8-byte little-endian value of `_loc` in the final snapshot */
	uint64_t valueAt(Location _loc) const;

	nlohmann::json toJson() const;
};

class ScenarioRunner : virtual public HashableType {
public:
	ScenarioRunner(const ModelParams& _params) : params(_params) {}

	/**
	 * @brief Replay `_scenario` from the initial state
	 *
	 * Stops at the first discarded or failed effect. A run whose threads still
	 * hold promises at the end is reported as DISCARDED.
	 */
	ScenarioOutcome run(const Scenario& _scenario) const;

private:
	ModelParams params;
};

}  // namespace promsim
