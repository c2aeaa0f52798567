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
 * @file InstructionState.hh
 * @brief Scratch state of the instruction currently executing
 *
 * @details
 * Created fresh for every instruction and dropped at its end. It threads view
 * accumulation between the effects of one instruction:
 * - the max view of its register reads,
 * - the max view of every other effect (the intra-instruction ordering anchor),
 * - the post-views of its memory reads, by occurrence number,
 * - the page-table walks in flight, keyed by leaf-level VA prefix.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <vector>

#include "common/View.hh"
#include "memory/Event.hh"

namespace promsim {

/** @brief Continuation of an in-flight page-table walk */
struct WalkState {
	uint64_t              va   = 0;
	Asid                  asid = 0;
	View                  time = 0;                   ///< accumulated view of the walk
	std::deque<uint64_t>  remaining;                  ///< cached descriptors still to be consumed
	std::vector<uint64_t> collected;                  ///< descriptors obtained so far, level 0 first
	View                  deadline = VIEW_INFINITY;  ///< the walk must stay at or below this
};

class InstructionState {
public:
	InstructionState() = default;

	View getRegReadView() const { return this->vReg; }

	void addRegRead(View _v) { joinInto(this->vReg, _v); }

	/** @brief Intra-instruction ordering anchor */
	View getNonRegView() const { return this->vNonReg; }

	void addNonReg(View _v) { joinInto(this->vNonReg, _v); }

	/** @brief Record a memory read's post-view; returns its occurrence number */
	size_t addReadView(View _v);

	/**
	 * @brief Post-view of the `_index`-th memory read of this instruction
	 * @throws StructuralError if no such read happened
	 */
	View getReadView(size_t _index) const;

	const std::vector<View>& getReadViews() const { return this->readViews; }

	/** @brief Max over every register read and every memory read so far */
	View implicitDepsView() const;

	/* ----------------------------- walks ----------------------------- */

	bool hasWalk(uint64_t _prefix) const { return this->walks.count(_prefix) != 0; }

	/** @return nullptr if no walk is open for `_prefix` */
	WalkState* findWalk(uint64_t _prefix);

	void startWalk(uint64_t _prefix, WalkState _walk) { this->walks[_prefix] = std::move(_walk); }

	/** @brief Remove and return the walk open for `_prefix` */
	std::optional<WalkState> endWalk(uint64_t _prefix);

	size_t getNumOpenWalks() const { return this->walks.size(); }

private:
	View                          vReg    = 0;
	View                          vNonReg = 0;
	std::vector<View>             readViews;
	std::map<uint64_t, WalkState> walks;
};

}  // namespace promsim
