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
 * @file main.cc
 * @brief GoogleTest suite for EffectInterpreter
 *
 * @details
 * Each test drives one or two ThreadState objects over a shared Memory through
 * EffectInterpreter::step(). Nondeterministic choices come from a RecordingOracle,
 * which both replays a script and remembers how many candidates each choice had;
 * ordering properties are checked by asserting that a read had a single candidate.
 *
 * | Suite                 | Covers                                                   |
 * |-----------------------|----------------------------------------------------------|
 * | EffectInterpreterTest | reads, writes, exclusives, promises, barriers, TLBI,     |
 * |                       | dependencies, sysregs, ifetch, error classification      |
 * | TranslationWalkTest   | page-table walks, cache population, TLBI invalidation    |
 */

#include "EffectInterpreterTest.hh"

using ::testing::ElementsAre;
using ::testing::Pair;

/* ------------------------------ reads, writes ------------------------------ */

TEST_F(EffectInterpreterTest, ReadAfterWriteSeesOwnWrite) {
	StepResult w = this->execute(0, {write(X, 5)});
	ASSERT_TRUE(w.isSuccess()) << w.message;
	EXPECT_EQ(this->mem.size(), 1u);
	EXPECT_EQ(this->thread(0).getCoherence(X), 1u);

	StepResult r = this->execute(0, {read(X)});
	ASSERT_TRUE(r.isSuccess()) << r.message;
	EXPECT_EQ(r.value, 5u);
	EXPECT_TRUE(this->oracle->offered.empty());

	EXPECT_THAT(this->mem.read(X, this->thread(0).getCoherence(X)), ElementsAre(ReadCandidate{5, 1}));

	auto snapshot = this->mem.snapshot();
	EXPECT_EQ(snapshot.at(X), 5u);
	EXPECT_EQ(snapshot.at(X + 7), 0u);
}

TEST_F(EffectInterpreterTest, ForwardedReadUsesStoreView) {
	ASSERT_TRUE(this->execute(0, {write(X, 5)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {read(X)}).isSuccess());
	EXPECT_EQ(this->thread(0).getView(ViewKind::READ), 0u);

	ModelParams params;
	params.enableForwarding = false;
	this->reset({}, params);
	ASSERT_TRUE(this->execute(0, {write(X, 5)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {read(X)}).isSuccess());
	EXPECT_EQ(this->thread(0).getView(ViewKind::READ), 1u);
}

TEST_F(EffectInterpreterTest, CoherenceForbidsReadingBackwards) {
	this->reset({1});
	ASSERT_TRUE(this->execute(0, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {write(X, 2)}).isSuccess());

	// Own write (t=1) or the newer one (t=2); the script picks the older.
	EXPECT_EQ(this->execute(0, {read(X)}).value, 1u);
	EXPECT_THAT(this->oracle->offered, ElementsAre(Pair(ChoicePoint::READ_CANDIDATE, 2u)));

	// Exhausted script falls back to index 0, the newer write.
	EXPECT_EQ(this->execute(0, {read(X)}).value, 2u);
	EXPECT_EQ(this->thread(0).getCoherence(X), 2u);

	EXPECT_EQ(this->execute(0, {read(X)}).value, 2u);
	EXPECT_EQ(this->oracle->offered.size(), 2u);
}

TEST_F(EffectInterpreterTest, WriteTimestampFollowsPreView) {
	const std::vector<std::pair<uint32_t, Location>> writes = {{0, X}, {1, X}, {0, Y}, {1, X}, {0, X}, {1, Y}};

	uint64_t value = 0;
	for (const auto& [tid, loc] : writes) {
		View before = join(this->thread(tid).getCoherence(loc), this->thread(tid).getView(ViewKind::WRITE));

		StepResult result = this->execute(tid, {write(loc, ++value)});
		ASSERT_TRUE(result.isSuccess()) << result.message;

		Timestamp t = this->mem.size();
		EXPECT_EQ(this->thread(tid).getCoherence(loc), t);
		EXPECT_GT(t, before);
		EXPECT_EQ(std::get<WriteEvent>(this->mem.at(t)), (WriteEvent{tid, loc, value}));
	}
}

/* -------------------------------- exclusives -------------------------------- */

TEST_F(EffectInterpreterTest, ExclusivePairsWithoutInterferenceSucceed) {
	this->reset({0});

	ASSERT_TRUE(this->execute(0, {read(X, AccessStrength::PLAIN, true)}).isSuccess());
	ASSERT_TRUE(this->thread(0).getExclusiveMarker().has_value());

	StepResult s0 = this->execute(0, {write(X, 1, AccessStrength::PLAIN, true)});
	ASSERT_TRUE(s0.isSuccess()) << s0.message;
	EXPECT_EQ(s0.value, 1u);
	EXPECT_FALSE(this->thread(0).getExclusiveMarker().has_value());

	// Thread 1 observes thread 0's store and then completes its own pair.
	EXPECT_EQ(this->execute(1, {read(X, AccessStrength::PLAIN, true)}).value, 1u);
	StepResult s1 = this->execute(1, {write(X, 2, AccessStrength::PLAIN, true)});
	ASSERT_TRUE(s1.isSuccess()) << s1.message;

	EXPECT_EQ(this->mem.readLast(X), (ReadCandidate{2, 2}));
}

TEST_F(EffectInterpreterTest, ExclusiveStoreDiscardsAfterInterveningWrite) {
	ASSERT_TRUE(this->execute(0, {read(X, AccessStrength::PLAIN, true)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {write(X, 7)}).isSuccess());

	StepResult result = this->execute(0, {write(X, 1, AccessStrength::PLAIN, true)});
	EXPECT_EQ(result.status, StepStatus::DISCARD);
	EXPECT_EQ(this->mem.size(), 1u);
	EXPECT_TRUE(this->thread(0).getExclusiveMarker().has_value());
}

TEST_F(EffectInterpreterTest, ExclusiveStoreWithoutLoadDiscards) {
	StepResult result = this->execute(0, {write(X, 1, AccessStrength::PLAIN, true)});
	EXPECT_EQ(result.status, StepStatus::DISCARD);
	EXPECT_EQ(this->mem.size(), 0u);
}

TEST_F(EffectInterpreterTest, ExclusiveStoreToAnotherLocationDiscards) {
	// The load reads the initial value, so only the marker ties it to X.
	ASSERT_TRUE(this->execute(0, {read(X, AccessStrength::PLAIN, true)}).isSuccess());
	EXPECT_EQ(this->thread(0).getExclusiveMarker()->location, X);

	StepResult result = this->execute(0, {write(Y, 1, AccessStrength::PLAIN, true)});
	EXPECT_EQ(result.status, StepStatus::DISCARD);
	EXPECT_EQ(this->mem.size(), 0u);
	EXPECT_TRUE(this->thread(0).getExclusiveMarker().has_value());
}

TEST_F(EffectInterpreterTest, ExclusiveStoreForwardsOnlyItsTimestampToStrongReads) {
	ASSERT_TRUE(this->execute(0, {read(X, AccessStrength::PLAIN, true)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {write(X, 1, AccessStrength::PLAIN, true)}).isSuccess());

	EXPECT_EQ(this->execute(0, {read(X)}).value, 1u);
	EXPECT_EQ(this->thread(0).getView(ViewKind::READ), 0u);

	EXPECT_EQ(this->execute(0, {read(X, AccessStrength::ACQUIRE)}).value, 1u);
	EXPECT_EQ(this->thread(0).getView(ViewKind::READ), 1u);
	EXPECT_EQ(this->thread(0).getView(ViewKind::ACQ), 1u);
}

/* -------------------------------- promises -------------------------------- */

TEST_F(EffectInterpreterTest, PromiseFulfilledByMatchingWrite) {
	auto t = this->interp->promise(this->thread(0), this->mem, WriteEvent{0, X, 5});
	ASSERT_TRUE(t.has_value());
	EXPECT_EQ(*t, 1u);
	EXPECT_FALSE(this->thread(0).hasNoPendingPromises());

	ASSERT_TRUE(this->execute(0, {write(X, 6)}).isSuccess());
	EXPECT_EQ(this->mem.size(), 2u);
	EXPECT_FALSE(this->thread(0).hasNoPendingPromises());

	// Coherence after the t=2 write rules out fulfilling t=1.
	EXPECT_EQ(this->execute(0, {write(X, 5)}).status, StepStatus::DISCARD);

	this->reset();
	ASSERT_TRUE(this->interp->promise(this->thread(0), this->mem, WriteEvent{0, X, 5}).has_value());
	ASSERT_TRUE(this->execute(0, {write(X, 5)}).isSuccess());
	EXPECT_EQ(this->mem.size(), 1u);
	EXPECT_TRUE(this->thread(0).hasNoPendingPromises());
}

TEST_F(EffectInterpreterTest, PromiseLimitAndOwnership) {
	ModelParams params;
	params.maxPendingPromises = 1;
	this->reset({}, params);

	EXPECT_TRUE(this->interp->promise(this->thread(0), this->mem, WriteEvent{0, X, 1}).has_value());
	EXPECT_FALSE(this->interp->promise(this->thread(0), this->mem, WriteEvent{0, Y, 1}).has_value());
	EXPECT_EQ(this->mem.size(), 1u);

	EXPECT_THROW(this->interp->promise(this->thread(1), this->mem, WriteEvent{0, X, 1}), StructuralError);
	EXPECT_THROW(this->interp->promise(this->thread(1), this->mem, WriteEvent{1, X + 4, 1}), StructuralError);
}

TEST_F(EffectInterpreterTest, BarrierForbidsFulfillingEarlierPromise) {
	ASSERT_TRUE(this->interp->promise(this->thread(0), this->mem, WriteEvent{0, Y, 1}).has_value());
	ASSERT_TRUE(this->execute(0, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {barrier(BarrierType::DMB)}).isSuccess());
	EXPECT_EQ(this->execute(0, {write(Y, 1)}).status, StepStatus::DISCARD);

	this->reset();
	ASSERT_TRUE(this->interp->promise(this->thread(0), this->mem, WriteEvent{0, Y, 1}).has_value());
	ASSERT_TRUE(this->execute(0, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {write(Y, 1)}).isSuccess());
	EXPECT_EQ(this->mem.size(), 2u);
	EXPECT_EQ(this->thread(0).getCoherence(Y), 1u);
	EXPECT_EQ(this->thread(0).getView(ViewKind::WRITE), 2u);
	EXPECT_TRUE(this->thread(0).hasNoPendingPromises());
}

/* ---------------------------- barriers, ordering ---------------------------- */

TEST_F(EffectInterpreterTest, FullBarrierOrdersMessagePassing) {
	ASSERT_TRUE(this->execute(0, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {barrier(BarrierType::DMB)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {write(Y, 1)}).isSuccess());

	EXPECT_EQ(this->execute(1, {read(Y)}).value, 1u);
	ASSERT_TRUE(this->execute(1, {barrier(BarrierType::DMB)}).isSuccess());
	EXPECT_EQ(this->execute(1, {read(X)}).value, 1u);

	// Only the read of Y had more than one candidate.
	EXPECT_EQ(this->oracle->offered.size(), 1u);
	EXPECT_GE(this->thread(1).getCoherence(X), 1u);
}

TEST_F(EffectInterpreterTest, StaleReadWithoutBarrier) {
	this->reset({0, 1});
	ASSERT_TRUE(this->execute(0, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {write(Y, 1)}).isSuccess());

	EXPECT_EQ(this->execute(1, {read(Y)}).value, 1u);
	EXPECT_EQ(this->execute(1, {read(X)}).value, 0u);
	EXPECT_EQ(this->oracle->offered.size(), 2u);
}

TEST_F(EffectInterpreterTest, BarrierViewArithmetic) {
	struct Case {
		Barrier  barrier;
		ViewKind kind;
		View     expected;
	};
	const std::vector<Case> cases = {
	    {Barrier{BarrierType::DMB, BarrierScope::SY}, ViewKind::DMB, 5},
	    {Barrier{BarrierType::DMB, BarrierScope::LD}, ViewKind::DMB, 3},
	    {Barrier{BarrierType::DMB, BarrierScope::ST}, ViewKind::DMB_ST, 5},
	    {Barrier{BarrierType::DSB, BarrierScope::SY}, ViewKind::DSB, 7},
	    {Barrier{BarrierType::DSB, BarrierScope::LD}, ViewKind::DSB, 3},
	    {Barrier{BarrierType::DSB, BarrierScope::ST}, ViewKind::DSB, 7},
	    {Barrier{BarrierType::ISB, BarrierScope::SY}, ViewKind::ISB, 4},
	};

	for (const auto& c : cases) {
		this->reset();
		ThreadState& ts = this->thread(0);
		ts.updateView(ViewKind::READ, 3);
		ts.updateView(ViewKind::WRITE, 5);
		ts.updateView(ViewKind::CSE, 2);
		ts.updateView(ViewKind::DSB, 1);
		ts.updateView(ViewKind::TLBI, 7);
		ts.updateView(ViewKind::MSR, 4);

		InstructionState iis;
		ASSERT_TRUE(this->execute(0, {c.barrier}, iis).isSuccess());
		EXPECT_EQ(ts.getView(c.kind), c.expected) << toString(c.kind);
		EXPECT_EQ(iis.getNonRegView(), c.expected) << toString(c.kind);

		if (c.kind == ViewKind::DMB_ST) EXPECT_EQ(ts.getView(ViewKind::DMB), 0u);
		if (c.kind == ViewKind::ISB) EXPECT_EQ(ts.getView(ViewKind::CSE), 4u);
	}
}

TEST_F(EffectInterpreterTest, NonShareableBarrierIsUnsupported) {
	StepResult result = this->execute(0, {Barrier{BarrierType::DMB, BarrierScope::SY, Shareability::NON_SHAREABLE}});
	EXPECT_EQ(result.status, StepStatus::FAILURE);
	EXPECT_EQ(result.errorKind, ErrorKind::UNSUPPORTED);
}

TEST_F(EffectInterpreterTest, AcquireReadOrdersLaterReads) {
	ASSERT_TRUE(this->execute(1, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {write(Y, 1)}).isSuccess());

	EXPECT_EQ(this->execute(0, {read(Y, AccessStrength::ACQUIRE)}).value, 1u);
	EXPECT_EQ(this->thread(0).getView(ViewKind::ACQ), 2u);
	EXPECT_EQ(this->execute(0, {read(X)}).value, 1u);
	EXPECT_EQ(this->oracle->offered.size(), 1u);
}

TEST_F(EffectInterpreterTest, ReleaseWriteWaitsForEarlierReads) {
	for (AccessStrength strength : {AccessStrength::RELEASE, AccessStrength::PLAIN}) {
		this->reset({0});
		ASSERT_TRUE(this->interp->promise(this->thread(0), this->mem, WriteEvent{0, F, 1}).has_value());
		ASSERT_TRUE(this->execute(1, {write(X, 1)}).isSuccess());
		EXPECT_EQ(this->execute(0, {read(X)}).value, 1u);

		StepResult result = this->execute(0, {write(F, 1, strength)});
		if (strength == AccessStrength::RELEASE) {
			EXPECT_EQ(result.status, StepStatus::DISCARD);
		} else {
			EXPECT_TRUE(result.isSuccess()) << result.message;
		}
	}
}

TEST_F(EffectInterpreterTest, StrongAcquireOrdersAfterRelease) {
	this->reset({1});
	ASSERT_TRUE(this->execute(1, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {write(F, 1, AccessStrength::RELEASE)}).isSuccess());
	EXPECT_EQ(this->thread(0).getView(ViewKind::REL), 2u);

	// RCpc acquire may still read the initial value.
	EXPECT_EQ(this->execute(0, {read(X, AccessStrength::ACQUIRE_PC)}).value, 0u);
	EXPECT_EQ(this->oracle->offered.size(), 1u);

	EXPECT_EQ(this->execute(0, {read(X, AccessStrength::ACQUIRE)}).value, 1u);
	EXPECT_EQ(this->oracle->offered.size(), 1u);
}

/* ------------------------------- dependencies ------------------------------- */

TEST_F(EffectInterpreterTest, AddressDependencyOrdersRead) {
	ASSERT_TRUE(this->execute(1, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {write(Y, 1)}).isSuccess());

	StepResult load = this->execute(0, {read(Y), RegWrite{"x1", 1, RegisterClass::APPLICATION, true, ImplicitAll{}}});
	ASSERT_TRUE(load.isSuccess()) << load.message;
	EXPECT_EQ(this->thread(0).readRegister("x1"), (RegisterValue{1, 2}));

	StepResult r =
	    this->execute(0, {RegRead{"x1"}, read(X, AccessStrength::PLAIN, false, explicitDeps({"x1"}))});
	EXPECT_EQ(r.value, 1u);
	EXPECT_EQ(this->oracle->offered.size(), 1u);
}

TEST_F(EffectInterpreterTest, ReadIndexDependency) {
	ASSERT_TRUE(this->execute(1, {write(X, 1)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {write(Y, 1)}).isSuccess());

	StepResult r = this->execute(0, {read(Y), read(X, AccessStrength::PLAIN, false, explicitDeps({}, {0}))});
	EXPECT_EQ(r.value, 1u);
	EXPECT_EQ(this->oracle->offered.size(), 1u);

	StepResult bad = this->execute(0, {read(X, AccessStrength::PLAIN, false, explicitDeps({}, {3}))});
	EXPECT_EQ(bad.status, StepStatus::FAILURE);
	EXPECT_EQ(bad.errorKind, ErrorKind::STRUCTURAL);
}

TEST_F(EffectInterpreterTest, BranchAndExceptionReturnSynchronizeContext) {
	ASSERT_TRUE(this->execute(1, {write(X, 1)}).isSuccess());

	StepResult result = this->execute(0, {read(X), BranchAnnounce{explicitDeps({}, {0})}, ExceptionReturn{}});
	ASSERT_TRUE(result.isSuccess()) << result.message;
	EXPECT_EQ(this->thread(0).getView(ViewKind::SPEC), 1u);
	EXPECT_EQ(this->thread(0).getView(ViewKind::CSE), 1u);

	ASSERT_TRUE(this->execute(1, {Terminate{}}).isSuccess());
	EXPECT_EQ(this->thread(1).getView(ViewKind::CSE), 0u);
}

/* ---------------------------- system registers ---------------------------- */

TEST_F(EffectInterpreterTest, SystemRegisterVisibility) {
	this->reset({0});
	const RegRead direct{"TTBR0_EL1", RegisterClass::SYSTEM, true, false};
	const RegRead relaxed{"TTBR0_EL1", RegisterClass::SYSTEM, true, true};

	ASSERT_TRUE(this->execute(0, {RegWrite{"TTBR0_EL1", 0x2000, RegisterClass::SYSTEM, true, noDeps()}}).isSuccess());
	EXPECT_EQ(this->thread(0).getSysregHistory().size(), 1u);

	EXPECT_EQ(this->execute(0, {direct}).value, 0x2000u);

	// Before a context synchronization the MMU may still use the old value.
	EXPECT_EQ(this->execute(0, {relaxed}).value, 0x1000u);
	EXPECT_THAT(this->oracle->offered, ElementsAre(Pair(ChoicePoint::SYSREG_VALUE, 2u)));

	ASSERT_TRUE(this->execute(0, {barrier(BarrierType::ISB)}).isSuccess());
	EXPECT_EQ(this->thread(0).getSyncCursor(), 1u);
	EXPECT_EQ(this->execute(0, {relaxed}).value, 0x2000u);
	EXPECT_EQ(this->oracle->offered.size(), 1u);
}

/* -------------------------------- TLBI -------------------------------- */

TEST_F(EffectInterpreterTest, TlbiAppendsPageAlignedEvent) {
	Tlbi tlbi{TlbiScope::BY_VA_BY_ASID, 5, 0x12345, false, Shareability::INNER, Regime::EL10, noDeps()};
	ASSERT_TRUE(this->execute(0, {tlbi}).isSuccess());

	ASSERT_EQ(this->mem.size(), 1u);
	EXPECT_EQ(std::get<TlbiEvent>(this->mem.at(1)).descriptor,
	          (TlbiDescriptor{TlbiScope::BY_VA_BY_ASID, 5, 0x12000, false}));
	EXPECT_EQ(this->thread(0).getView(ViewKind::TLBI), 1u);
	EXPECT_THAT(this->thread(0).getCseAtTlbi(), ElementsAre(Pair(1u, 0u)));

	ASSERT_TRUE(this->execute(0, {barrier(BarrierType::DSB)}).isSuccess());
	EXPECT_EQ(this->thread(0).getView(ViewKind::DSB), 1u);
}

TEST_F(EffectInterpreterTest, TlbiFulfillsPromise) {
	TlbiEvent event{TlbiDescriptor{TlbiScope::ALL, 0, 0, false}};
	ASSERT_TRUE(this->interp->promise(this->thread(0), this->mem, event).has_value());
	ASSERT_TRUE(this->execute(0, {Tlbi{}}).isSuccess());
	EXPECT_EQ(this->mem.size(), 1u);
	EXPECT_TRUE(this->thread(0).hasNoPendingPromises());
}

TEST_F(EffectInterpreterTest, TlbiPromiseIgnoresFieldsOutsideItsScope) {
	// Unaligned VA, and an ASID the by-VA-all-ASID scope does not look at.
	TlbiEvent byVa{TlbiDescriptor{TlbiScope::BY_VA_ALL_ASID, 9, 0x1234, false}};
	ASSERT_TRUE(this->interp->promise(this->thread(0), this->mem, byVa).has_value());
	EXPECT_EQ(std::get<TlbiEvent>(this->mem.at(1)).descriptor,
	          (TlbiDescriptor{TlbiScope::BY_VA_ALL_ASID, 0, 0x1000, false}));

	Tlbi executed{TlbiScope::BY_VA_ALL_ASID, 7, 0x1234, false, Shareability::INNER, Regime::EL10, noDeps()};
	ASSERT_TRUE(this->execute(0, {executed}).isSuccess());
	EXPECT_EQ(this->mem.size(), 1u);
	EXPECT_TRUE(this->thread(0).hasNoPendingPromises());

	TlbiEvent all{TlbiDescriptor{TlbiScope::ALL, 0, 0, false}};
	ASSERT_TRUE(this->interp->promise(this->thread(0), this->mem, all).has_value());
	Tlbi allWithAsid{TlbiScope::ALL, 7, 0x5000, false, Shareability::INNER, Regime::EL10, noDeps()};
	ASSERT_TRUE(this->execute(0, {allWithAsid}).isSuccess());
	EXPECT_EQ(this->mem.size(), 2u);
	EXPECT_TRUE(this->thread(0).hasNoPendingPromises());
}

/* --------------------------- instruction fetch --------------------------- */

TEST_F(EffectInterpreterTest, InstructionFetchReadsAtContextSync) {
	constexpr Location code = 0x4000;
	this->reset({}, ModelParams(), [](Location _loc) -> uint64_t { return _loc == 0x4000 ? 0x1111222233334444 : 0; });
	ASSERT_TRUE(this->execute(1, {write(code, 0xdead)}).isSuccess());

	auto fetch = [&](uint64_t _pa, uint32_t _size) {
		return this->execute(0, {MemRead{_pa, _size, AccessKind{}, ReadPurpose::IFETCH, 0, noDeps()}});
	};
	EXPECT_EQ(fetch(code, 4).value, 0x33334444u);
	EXPECT_EQ(fetch(code + 4, 4).value, 0x11112222u);
	EXPECT_EQ(fetch(code, 8).value, 0x1111222233334444u);
	EXPECT_EQ(fetch(code + 2, 4).errorKind, ErrorKind::UNSUPPORTED);
	EXPECT_EQ(fetch(code + 4, 8).errorKind, ErrorKind::UNSUPPORTED);

	EXPECT_EQ(this->thread(0).getCoherence(code), 0u);
	EXPECT_TRUE(this->oracle->offered.empty());
}

/* ------------------------- error classification ------------------------- */

TEST_F(EffectInterpreterTest, UnsupportedEffects) {
	const std::vector<Effect> effects = {
	    MemAtomic{X, 8},
	    MemRead{X, 4, AccessKind{}, ReadPurpose::DATA, 0, noDeps()},
	    read(X + 4),
	    MemWrite{X, 2, 1, AccessKind{}, noDeps(), noDeps()},
	    RegRead{"x0", RegisterClass::APPLICATION, false, false},
	    RegWrite{"x0", 1, RegisterClass::APPLICATION, false, noDeps()},
	    Tlbi{TlbiScope::ALL, 0, 0, false, Shareability::OUTER, Regime::EL10, noDeps()},
	    Tlbi{TlbiScope::ALL, 0, 0, false, Shareability::INNER, Regime::EL2, noDeps()},
	};
	for (const auto& effect : effects) {
		StepResult result = this->execute(0, {effect});
		EXPECT_EQ(result.status, StepStatus::FAILURE) << effectName(effect);
		EXPECT_EQ(result.errorKind, ErrorKind::UNSUPPORTED) << effectName(effect) << ": " << result.message;
	}
	EXPECT_EQ(this->mem.size(), 0u);
}

TEST_F(EffectInterpreterTest, StructuralErrors) {
	ModelParams params;
	params.paBits = 32;
	this->reset({}, params);

	const std::vector<Effect> effects = {
	    read(uint64_t(1) << 32),
	    write(uint64_t(1) << 40, 1),
	    RegRead{"x9"},
	    RegRead{"VBAR_EL1", RegisterClass::SYSTEM},
	    Choose{0},
	    Choose{65},
	};
	for (const auto& effect : effects) {
		StepResult result = this->execute(0, {effect});
		EXPECT_EQ(result.status, StepStatus::FAILURE) << effectName(effect);
		EXPECT_EQ(result.errorKind, ErrorKind::STRUCTURAL) << effectName(effect) << ": " << result.message;
	}

	params.paBits = 0;
	EXPECT_THROW({ EffectInterpreter invalid(params, *this->oracle); }, StructuralError);
}

TEST_F(EffectInterpreterTest, ChooseAndDiscard) {
	this->reset({9, 16});
	EXPECT_EQ(this->execute(0, {Choose{4}}).value, 9u);
	EXPECT_EQ(this->execute(0, {Choose{4}}).errorKind, ErrorKind::STRUCTURAL);
	EXPECT_EQ(this->execute(0, {Choose{64}}).value, 0u);

	StepResult result = this->execute(0, {Discard{}, write(X, 1)});
	EXPECT_EQ(result.status, StepStatus::DISCARD);
	EXPECT_EQ(this->mem.size(), 0u);
}

/* ---------------------------- translation walks ---------------------------- */

TEST_F(TranslationWalkTest, FreshWalkPopulatesCache) {
	InstructionState iis;
	auto             results = this->trace(0, walk(), iis);
	ASSERT_EQ(results.size(), 4u);
	for (const auto& r : results) ASSERT_TRUE(r.isSuccess()) << r.message;
	EXPECT_EQ(results[1].value, TABLE);
	EXPECT_EQ(results[2].value, PAGE);
	EXPECT_EQ(iis.getNumOpenWalks(), 0u);

	// Walk reads leave the data-side state untouched.
	EXPECT_EQ(this->thread(0).getCoherence(L1_DESC), 0u);
	EXPECT_EQ(iis.getReadViews().size(), 2u);

	const TranslationCache& cache = this->thread(0).getTranslationCache();
	EXPECT_EQ(cache.size(), 2u);

	auto cached = cache.lookup(VA, ASID);
	ASSERT_EQ(cached.size(), 2u);
	EXPECT_EQ(cached[0].level, 1u);
	EXPECT_EQ(cached[0].asid, std::optional<Asid>(ASID));
	EXPECT_TRUE(cached[0].entry.complete);
	EXPECT_THAT(cached[0].entry.descriptors, ElementsAre(TABLE, PAGE));
	EXPECT_EQ(cached[1].level, 0u);
	EXPECT_FALSE(cached[1].entry.complete);

	EXPECT_TRUE(cache.lookup(VA, ASID + 1).empty());
	EXPECT_TRUE(this->oracle->offered.empty());
}

TEST_F(TranslationWalkTest, GlobalWalkIsSharedByEveryAsid) {
	this->resetWalk({}, PAGE_GLB);
	ASSERT_TRUE(this->execute(0, walk()).isSuccess());

	auto cached = this->thread(0).getTranslationCache().lookup(VA, 7);
	ASSERT_EQ(cached.size(), 2u);
	EXPECT_FALSE(cached[0].asid.has_value());
}

TEST_F(TranslationWalkTest, CachedWalkReplaysWithoutMemory) {
	this->resetWalk({1});
	ASSERT_TRUE(this->execute(0, walk()).isSuccess());
	ASSERT_TRUE(this->execute(1, {write(L1_DESC, 0)}).isSuccess());

	InstructionState iis;
	auto             results = this->trace(0, walk(), iis);
	ASSERT_EQ(results.size(), 4u);
	EXPECT_TRUE(results[3].isSuccess()) << results[3].message;
	EXPECT_EQ(results[2].value, PAGE);

	// Fresh walk plus the leaf and level-0 cached walks.
	EXPECT_THAT(this->oracle->offered, ElementsAre(Pair(ChoicePoint::WALK_CANDIDATE, 3u)));
	EXPECT_EQ(this->thread(0).getTranslationCache().size(), 2u);
}

TEST_F(TranslationWalkTest, TlbiInvalidatesCachedWalk) {
	ASSERT_TRUE(this->execute(0, walk()).isSuccess());

	ASSERT_TRUE(this->execute(1, {write(L1_DESC, 0)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {barrier(BarrierType::DSB)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {Tlbi{}}).isSuccess());
	ASSERT_TRUE(this->execute(1, {barrier(BarrierType::DSB)}).isSuccess());
	ASSERT_TRUE(this->execute(1, {write(F, 1)}).isSuccess());
	EXPECT_EQ(this->thread(1).getCseAtTlbi().count(2), 1u);

	EXPECT_EQ(this->execute(0, {read(F)}).value, 1u);
	ASSERT_TRUE(this->execute(0, {barrier(BarrierType::DSB)}).isSuccess());
	ASSERT_TRUE(this->execute(0, {barrier(BarrierType::ISB)}).isSuccess());
	EXPECT_EQ(this->thread(0).getView(ViewKind::CSE), 3u);

	InstructionState iis;
	auto             results = this->trace(0, walk(true), iis);
	ASSERT_EQ(results.size(), 4u);
	EXPECT_TRUE(results[3].isSuccess()) << results[3].message;
	EXPECT_EQ(results[2].value, 0u);

	// No cached walk survived the TLBI, so only the read of F was a choice.
	EXPECT_THAT(this->oracle->offered, ElementsAre(Pair(ChoicePoint::READ_CANDIDATE, 2u)));

	// The faulting walk caches its level-0 table descriptor only.
	EXPECT_EQ(this->thread(0).getTranslationCache().size(), 3u);
}

TEST_F(TranslationWalkTest, StaleDescriptorCannotOutliveTlbi) {
	auto prepare = [this](std::vector<uint64_t> _script) {
		this->resetWalk(std::move(_script));
		ASSERT_TRUE(this->execute(1, {write(L0_DESC, 0)}).isSuccess());
		ASSERT_TRUE(this->execute(1, {Tlbi{}}).isSuccess());
		ASSERT_TRUE(this->execute(1, {write(L1_DESC, PAGE_NEW)}).isSuccess());
	};

	// Stale table descriptor, then a leaf written after the TLBI.
	prepare({1, 0});
	EXPECT_EQ(this->execute(0, walk()).status, StepStatus::DISCARD);

	// Stale table descriptor with the old leaf: allowed, but never cached.
	prepare({1, 1});
	InstructionState iis;
	auto             results = this->trace(0, walk(), iis);
	ASSERT_EQ(results.size(), 4u);
	EXPECT_TRUE(results[3].isSuccess()) << results[3].message;
	EXPECT_EQ(results[1].value, TABLE);
	EXPECT_EQ(results[2].value, PAGE);
	EXPECT_EQ(this->thread(0).getTranslationCache().size(), 0u);
}

TEST_F(TranslationWalkTest, MalformedWalks) {
	const MemRead descriptorRead{L0_DESC, 8, AccessKind{}, ReadPurpose::TRANSLATION, VA, noDeps()};

	EXPECT_EQ(this->execute(0, {descriptorRead}).errorKind, ErrorKind::STRUCTURAL);
	EXPECT_EQ(this->execute(0, {TranslationEnd{VA}}).errorKind, ErrorKind::STRUCTURAL);
	EXPECT_EQ(this->execute(0, {TranslationStart{VA, ASID}, TranslationStart{VA + 8, ASID}}).errorKind,
	          ErrorKind::STRUCTURAL);
	EXPECT_EQ(this->execute(0, {TranslationStart{VA, ASID}, descriptorRead, descriptorRead, descriptorRead}).errorKind,
	          ErrorKind::STRUCTURAL);
}
