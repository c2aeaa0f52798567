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

#include "effect/InstructionState.hh"

#include <string>

#include "common/Errors.hh"

namespace promsim {

size_t InstructionState::addReadView(View _v) {
	this->readViews.push_back(_v);
	return this->readViews.size() - 1;
}

View InstructionState::getReadView(size_t _index) const {
	if (_index >= this->readViews.size()) {
		throw StructuralError("dependency on memory read #" + std::to_string(_index) + " but only " +
		                      std::to_string(this->readViews.size()) + " reads happened");
	}
	return this->readViews[_index];
}

View InstructionState::implicitDepsView() const {
	View v = this->vReg;
	for (View r : this->readViews) joinInto(v, r);
	return v;
}

WalkState* InstructionState::findWalk(uint64_t _prefix) {
	auto it = this->walks.find(_prefix);
	return it == this->walks.end() ? nullptr : &it->second;
}

std::optional<WalkState> InstructionState::endWalk(uint64_t _prefix) {
	auto it = this->walks.find(_prefix);
	if (it == this->walks.end()) return std::nullopt;
	WalkState walk = std::move(it->second);
	this->walks.erase(it);
	return walk;
}

}  // namespace promsim
