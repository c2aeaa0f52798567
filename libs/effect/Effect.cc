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

#include "effect/Effect.hh"

#include "utils/Overloaded.hh"

namespace promsim {

const char* effectName(const Effect& _effect) {
	return std::visit(overloaded{[](const RegRead&) { return "RegRead"; }, [](const RegWrite&) { return "RegWrite"; },
	                             [](const MemRead&) { return "MemRead"; }, [](const MemWrite&) { return "MemWrite"; },
	                             [](const MemAtomic&) { return "MemAtomic"; },
	                             [](const Barrier&) { return "Barrier"; }, [](const Tlbi&) { return "Tlbi"; },
	                             [](const BranchAnnounce&) { return "BranchAnnounce"; },
	                             [](const TranslationStart&) { return "TranslationStart"; },
	                             [](const TranslationEnd&) { return "TranslationEnd"; },
	                             [](const ExceptionReturn&) { return "ExceptionReturn"; },
	                             [](const Terminate&) { return "Terminate"; }, [](const Choose&) { return "Choose"; },
	                             [](const Discard&) { return "Discard"; }},
	                  _effect);
}

}  // namespace promsim
