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
 * @file ChoiceOracle.hh
 * @brief Source of the nondeterministic choices the interpreter cannot make itself
 *
 * @details
 * Whenever more than one continuation is architecturally legal (a read with
 * several candidate writes, a translation with several cached walks, a relaxed
 * system-register read, a Choose effect) the EffectInterpreter asks its
 * ChoiceOracle. Choice points with a single candidate never consult the oracle.
 *
 * An exploration harness implements ChoiceOracle to enumerate branches;
 * ScriptedOracle replays a fixed list and is what scenario files and tests use.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "utils/HashableType.hh"

namespace promsim {

/** @brief Where a choice is made */
enum class ChoicePoint {
	READ_CANDIDATE,  ///< which write a memory read observes
	WALK_CANDIDATE,  ///< fresh walk (0) or one of the valid cached walks
	SYSREG_VALUE     ///< which visible value a relaxed system-register read returns
};

const char* toString(ChoicePoint _point);

class ChoiceOracle {
public:
	virtual ~ChoiceOracle() = default;

	/**
	 * @brief Pick one of `_count` candidates (`_count` >= 2)
	 * @return An index in [0, _count)
	 */
	virtual size_t chooseIndex(ChoicePoint _point, size_t _count) = 0;

	/**
	 * @brief Pick an arbitrary `_bits`-wide value (1 <= `_bits` <= 64)
	 */
	virtual uint64_t chooseBits(uint32_t _bits) = 0;
};

/**
 * @brief Replays a fixed list of choices, then answers 0
 */
class ScriptedOracle : public ChoiceOracle, virtual public HashableType {
public:
	ScriptedOracle(std::vector<uint64_t> _script = {}) : script(std::move(_script)) {}

	/** @throws StructuralError if the scripted index is out of range */
	size_t chooseIndex(ChoicePoint _point, size_t _count) override;

	/** @throws StructuralError if the scripted value does not fit in `_bits` */
	uint64_t chooseBits(uint32_t _bits) override;

	/** @brief Number of scripted entries consumed so far */
	size_t getConsumed() const { return this->pos; }

	bool isExhausted() const { return this->pos >= this->script.size(); }

private:
	uint64_t next();

	std::vector<uint64_t> script;
	size_t                pos = 0;
};

}  // namespace promsim
