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

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <utility>
#include <vector>

#include "PromSim.hh"

using namespace promsim;

/**
 * @brief ChoiceOracle that replays a script and records every choice it was offered
 *
 * The interpreter only consults the oracle when more than one candidate exists, so
 * an empty `offered` list means every read saw exactly one candidate.
 */
class RecordingOracle : public ChoiceOracle {
public:
	RecordingOracle(std::vector<uint64_t> _script = {}) : scripted(std::move(_script)) {}

	size_t chooseIndex(ChoicePoint _point, size_t _count) override {
		this->offered.emplace_back(_point, _count);
		return this->scripted.chooseIndex(_point, _count);
	}

	uint64_t chooseBits(uint32_t _bits) override { return this->scripted.chooseBits(_bits); }

	std::vector<std::pair<ChoicePoint, size_t>> offered;

private:
	ScriptedOracle scripted;
};

class EffectInterpreterTest : public ::testing::Test {
protected:
	static constexpr Location X = 0x1000;
	static constexpr Location Y = 0x1008;
	static constexpr Location F = 0x1010;

	void SetUp() override {
		LogOStream::setQuiet(true);
		this->reset();
	}

	void TearDown() override { LogOStream::setQuiet(false); }

	/** @brief Fresh memory, two threads and an interpreter driven by `_script` */
	void reset(std::vector<uint64_t> _script = {}, const ModelParams& _params = ModelParams(),
	           InitialMemory _initial = nullptr) {
		this->interp.reset();
		this->oracle = std::make_unique<RecordingOracle>(std::move(_script));
		this->interp = std::make_unique<EffectInterpreter>(_params, *this->oracle);
		this->mem    = Memory(std::move(_initial));

		this->threads.clear();
		for (uint32_t tid = 0; tid < 2; ++tid) {
			this->threads.emplace_back(tid, RegisterMap{{"x0", 0}, {"x1", 0}, {"TTBR0_EL1", 0x1000}},
			                           _params.translation);
		}
	}

	/** @brief Run the effects of one instruction, stopping at the first non-success */
	StepResult execute(uint32_t _tid, const std::vector<Effect>& _instruction, InstructionState& _iis) {
		StepResult result;
		for (const auto& effect : _instruction) {
			result = this->interp->step(effect, _iis, this->threads[_tid], this->mem);
			if (!result.isSuccess()) break;
		}
		return result;
	}

	StepResult execute(uint32_t _tid, const std::vector<Effect>& _instruction) {
		InstructionState iis;
		return this->execute(_tid, _instruction, iis);
	}

	ThreadState& thread(uint32_t _tid) { return this->threads[_tid]; }

	static Effect write(Location _pa, uint64_t _value, AccessStrength _strength = AccessStrength::PLAIN,
	                    bool _exclusive = false) {
		return MemWrite{_pa, 8, _value, AccessKind{_strength, _exclusive}, noDeps(), noDeps()};
	}

	static Effect read(Location _pa, AccessStrength _strength = AccessStrength::PLAIN, bool _exclusive = false,
	                   Deps _addrDeps = noDeps()) {
		return MemRead{_pa, 8, AccessKind{_strength, _exclusive}, ReadPurpose::DATA, 0, std::move(_addrDeps)};
	}

	static Effect barrier(BarrierType _type, BarrierScope _scope = BarrierScope::SY) {
		return Barrier{_type, _scope, Shareability::FULL_SYSTEM};
	}

	std::unique_ptr<RecordingOracle>   oracle;
	std::unique_ptr<EffectInterpreter> interp;
	Memory                             mem;
	std::vector<ThreadState>           threads;
};

/**
 * @brief Two-level translation scheme with 4KB pages used by the walk tests
 *
 * VA 0x403000 walks through level-0 index 2 (descriptor at 0x2010) and level-1
 * index 3 (descriptor at 0x3018).
 */
class TranslationWalkTest : public EffectInterpreterTest {
protected:
	static constexpr uint64_t VA        = 0x403000;
	static constexpr Location L0_DESC   = 0x2010;
	static constexpr Location L1_DESC   = 0x3018;
	static constexpr uint64_t TABLE     = 0x3003;
	static constexpr uint64_t PAGE      = 0x80803;  // nG set
	static constexpr uint64_t PAGE_GLB  = 0x80003;
	static constexpr uint64_t PAGE_NEW  = 0x99803;
	static constexpr Asid     ASID      = 1;

	void SetUp() override {
		LogOStream::setQuiet(true);
		this->resetWalk();
	}

	void resetWalk(std::vector<uint64_t> _script = {}, uint64_t _leaf = PAGE) {
		ModelParams params;
		params.translation = TranslationParams{2, 12, 48};
		this->reset(std::move(_script), params, [_leaf](Location _loc) -> uint64_t {
			if (_loc == L0_DESC) return TABLE;
			if (_loc == L1_DESC) return _leaf;
			return 0;
		});
	}

	/** @brief Step through one instruction and collect the value of every effect */
	std::vector<StepResult> trace(uint32_t _tid, const std::vector<Effect>& _instruction, InstructionState& _iis) {
		std::vector<StepResult> results;
		for (const auto& effect : _instruction) {
			results.push_back(this->interp->step(effect, _iis, this->threads[_tid], this->mem));
			if (!results.back().isSuccess()) break;
		}
		return results;
	}

	static std::vector<Effect> walk(bool _fault = false, Deps _deps = noDeps()) {
		return {TranslationStart{VA, ASID, std::move(_deps)},
		        MemRead{L0_DESC, 8, AccessKind{}, ReadPurpose::TRANSLATION, VA, noDeps()},
		        MemRead{L1_DESC, 8, AccessKind{}, ReadPurpose::TRANSLATION, VA, noDeps()},
		        TranslationEnd{VA, _fault}};
	}
};
