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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "PromSim.hh"

using namespace promsim;
using ::testing::ElementsAre;
using ::testing::Pair;

TEST(ThreadStateTest, ApplicationRegisters) {
	ThreadState ts(3, {{"x0", 7}});
	EXPECT_EQ(ts.getTid(), 3u);
	EXPECT_EQ(ts.readRegister("x0"), (RegisterValue{7, 0}));
	EXPECT_THROW(ts.readRegister("x1"), StructuralError);

	ts.setRegister("x1", 42, 5);
	EXPECT_EQ(ts.readRegister("x1"), (RegisterValue{42, 5}));
	ts.setRegister("x0", 1, 2);
	EXPECT_THAT(ts.getRegisterValues(), ElementsAre(Pair("x0", 1u), Pair("x1", 42u)));
}

TEST(ThreadStateTest, CopiesAreIndependent) {
	ThreadState ts(0, {{"x0", 7}});
	ThreadState fork = ts;
	fork.setRegister("x0", 8, 1);
	fork.updateView(ViewKind::READ, 4);

	EXPECT_EQ(ts.readRegister("x0").value, 7u);
	EXPECT_EQ(ts.getView(ViewKind::READ), 0u);
	EXPECT_EQ(fork.readRegister("x0").value, 8u);
}

TEST(ThreadStateTest, SystemRegisterHistory) {
	ThreadState ts(0, {{"TTBR0_EL1", 0x1000}});

	ts.writeSysreg("TTBR0_EL1", 0x2000, 3);
	ts.writeSysreg("SCTLR_EL1", 0x1, 2);
	EXPECT_EQ(ts.getView(ViewKind::MSR), 3u);

	EXPECT_EQ(ts.readSysregAt("TTBR0_EL1", 0), (RegisterValue{0x1000, 0}));
	EXPECT_EQ(ts.readSysregAt("TTBR0_EL1", 2), (RegisterValue{0x2000, 3}));
	EXPECT_EQ(ts.readSysregAt("SCTLR_EL1", 2), (RegisterValue{0x1, 2}));
	EXPECT_THROW(ts.readSysregAt("SCTLR_EL1", 1), StructuralError);

	EXPECT_THAT(ts.readSysregAll("TTBR0_EL1", ts.getSyncCursor()),
	            ElementsAre(RegisterValue{0x1000, 0}, RegisterValue{0x2000, 3}));

	ts.recordContextSync(5);
	EXPECT_EQ(ts.getSyncCursor(), 2u);
	EXPECT_EQ(ts.getView(ViewKind::CSE), 5u);
	EXPECT_THAT(ts.readSysregAll("TTBR0_EL1", ts.getSyncCursor()), ElementsAre(RegisterValue{0x2000, 3}));

	ts.recordTlbiVisibility(9);
	EXPECT_THAT(ts.getCseAtTlbi(), ElementsAre(Pair(9u, 2u)));
}

TEST(ThreadStateTest, ViewsOnlyGrow) {
	ThreadState ts(0);
	ts.updateView(ViewKind::DMB, 5);
	ts.updateView(ViewKind::DMB, 3);
	EXPECT_EQ(ts.getView(ViewKind::DMB), 5u);
	EXPECT_STREQ(toString(ViewKind::DMB_ST), "vDmbSt");

	EXPECT_EQ(ts.getCoherence(0x100), 0u);
	ts.updateCoherence(0x100, 4);
	ts.updateCoherence(0x100, 2);
	EXPECT_EQ(ts.getCoherence(0x100), 4u);
}

TEST(ThreadStateTest, PromisesForwardingAndExclusives) {
	ThreadState ts(0);
	EXPECT_TRUE(ts.hasNoPendingPromises());
	ts.addPromise(2);
	ts.addPromise(5);
	ts.removePromise(2);
	ts.removePromise(7);
	EXPECT_THAT(ts.getPromises(), ElementsAre(5u));

	EXPECT_FALSE(ts.getFwd(0x100).has_value());
	ts.setFwd(0x100, FwdItem{3, 1, true});
	EXPECT_EQ(ts.getFwd(0x100), std::optional<FwdItem>(FwdItem{3, 1, true}));

	ts.setExclusiveMarker(ExclusiveMarker{3, 4});
	EXPECT_EQ(ts.getExclusiveMarker(), std::optional<ExclusiveMarker>(ExclusiveMarker{3, 4}));
	ts.clearExclusiveMarker();
	EXPECT_FALSE(ts.getExclusiveMarker().has_value());
}
