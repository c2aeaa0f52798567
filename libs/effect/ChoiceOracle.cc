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

#include "effect/ChoiceOracle.hh"

#include <string>

#include "common/Errors.hh"

namespace promsim {

const char* toString(ChoicePoint _point) {
	switch (_point) {
		case ChoicePoint::READ_CANDIDATE: return "read-candidate";
		case ChoicePoint::WALK_CANDIDATE: return "walk-candidate";
		case ChoicePoint::SYSREG_VALUE: return "sysreg-value";
		default: return "unknown";
	}
}

uint64_t ScriptedOracle::next() {
	if (this->pos >= this->script.size()) return 0;
	return this->script[this->pos++];
}

size_t ScriptedOracle::chooseIndex(ChoicePoint _point, size_t _count) {
	uint64_t choice = this->next();
	if (choice >= _count) {
		throw StructuralError("scripted choice " + std::to_string(choice) + " at " + toString(_point) +
		                      " out of range (" + std::to_string(_count) + " candidates)");
	}
	return static_cast<size_t>(choice);
}

uint64_t ScriptedOracle::chooseBits(uint32_t _bits) {
	uint64_t choice = this->next();
	if (_bits < 64 && (choice >> _bits) != 0) {
		throw StructuralError("scripted value " + std::to_string(choice) + " does not fit in " +
		                      std::to_string(_bits) + " bits");
	}
	return choice;
}

}  // namespace promsim
