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
 * @file TestMemory.cc
 * @brief Unit tests for Memory, MemoryCut and TLBI coverage
 *
 * The log used by most tests (location A = 0x100, B = 0x108):
 * @code
 *   t=1  W tid0 A=1
 *   t=2  W tid1 B=9
 *   t=3  W tid1 A=2
 *   t=4  W tid0 A=3
 * @endcode
 * Location A starts at 0x11; every other location starts at 0.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "PromSim.hh"

using namespace promsim;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace {

constexpr Location A = 0x100;
constexpr Location B = 0x108;

Memory makeLog() {
	Memory mem([](Location _loc) -> uint64_t { return _loc == A ? 0x11 : 0; });
	mem.promise(WriteEvent{0, A, 1});
	mem.promise(WriteEvent{1, B, 9});
	mem.promise(WriteEvent{1, A, 2});
	mem.promise(WriteEvent{0, A, 3});
	return mem;
}

}  // namespace

TEST(MemoryTest, PromiseAppendsWithIncreasingTimestamps) {
	Memory mem;
	EXPECT_EQ(mem.size(), 0u);
	EXPECT_EQ(mem.promise(WriteEvent{0, A, 1}), 1u);
	EXPECT_EQ(mem.promise(TlbiEvent{}), 2u);
	EXPECT_EQ(mem.at(1), Event(WriteEvent{0, A, 1}));
	EXPECT_THROW(mem.at(0), std::runtime_error);
	EXPECT_THROW(mem.at(3), std::runtime_error);
}

TEST(MemoryTest, ReadReturnsEveryPermittedCandidate) {
	Memory mem = makeLog();

	EXPECT_THAT(mem.read(A, 0), UnorderedElementsAre(ReadCandidate{0x11, 0}, ReadCandidate{1, 1}, ReadCandidate{2, 3},
	                                                  ReadCandidate{3, 4}));
	EXPECT_THAT(mem.read(A, 1), UnorderedElementsAre(ReadCandidate{1, 1}, ReadCandidate{2, 3}, ReadCandidate{3, 4}));
	EXPECT_THAT(mem.read(A, 3), UnorderedElementsAre(ReadCandidate{2, 3}, ReadCandidate{3, 4}));
	EXPECT_THAT(mem.read(A, 4), ElementsAre(ReadCandidate{3, 4}));

	// A view past the end of the log behaves like the end of the log.
	EXPECT_THAT(mem.read(A, 100), ElementsAre(ReadCandidate{3, 4}));

	// Never empty: an untouched location yields its initial value.
	EXPECT_THAT(mem.read(0x200, 4), ElementsAre(ReadCandidate{0, 0}));
}

TEST(MemoryTest, ReadAtAndReadLast) {
	Memory mem = makeLog();
	EXPECT_EQ(mem.readAt(A, 0), (ReadCandidate{0x11, 0}));
	EXPECT_EQ(mem.readAt(A, 2), (ReadCandidate{1, 1}));
	EXPECT_EQ(mem.readAt(B, 2), (ReadCandidate{9, 2}));
	EXPECT_EQ(mem.readLast(A), (ReadCandidate{3, 4}));
	EXPECT_EQ(mem.readLast(0x200), (ReadCandidate{0, 0}));
}

TEST(MemoryTest, CutsAreClampedToTheLog) {
	Memory mem = makeLog();

	MemoryCut before = mem.cutBefore(2);
	EXPECT_EQ(before.lowerBound(), 0u);
	EXPECT_EQ(before.upperBound(), 2u);
	EXPECT_TRUE(before.contains(1));
	EXPECT_FALSE(before.contains(3));

	MemoryCut after = mem.cutAfter(2);
	EXPECT_EQ(after.lowerBound(), 2u);
	EXPECT_EQ(after.upperBound(), 4u);
	EXPECT_FALSE(after.contains(2));

	EXPECT_EQ(mem.cutBefore(VIEW_INFINITY).upperBound(), 4u);
	EXPECT_EQ(mem.cutAfter(VIEW_INFINITY).lowerBound(), 4u);
	EXPECT_TRUE(mem.cutAfter(10).findAllWrites(A).empty());
}

TEST(MemoryTest, FulfillPicksOldestMatchingPromise) {
	Memory mem;
	mem.promise(WriteEvent{0, A, 5});
	mem.promise(WriteEvent{0, A, 5});
	mem.promise(WriteEvent{0, B, 5});

	const Event event = WriteEvent{0, A, 5};
	EXPECT_EQ(mem.fulfill(event, {2, 1, 3}), std::optional<Timestamp>(1));
	EXPECT_EQ(mem.fulfill(event, {3, 2}), std::optional<Timestamp>(2));
	EXPECT_EQ(mem.fulfill(event, {3}), std::nullopt);
	EXPECT_EQ(mem.fulfill(event, {}), std::nullopt);
	EXPECT_EQ(mem.fulfill(event, {0, 99}), std::nullopt);
	EXPECT_EQ(mem.fulfill(WriteEvent{1, A, 5}, {1, 2}), std::nullopt);
}

TEST(MemoryTest, ExclusiveChecksOtherThreadWrites) {
	Memory mem;
	mem.promise(WriteEvent{0, A, 1});
	mem.promise(WriteEvent{0, A, 2});
	mem.promise(WriteEvent{1, A, 3});
	mem.promise(WriteEvent{0, B, 1});

	EXPECT_TRUE(mem.exclusive(A, 1, 0, 2));
	EXPECT_FALSE(mem.exclusive(A, 1, 0, 3));
	EXPECT_FALSE(mem.exclusive(A, 1, 1, 2));
	EXPECT_TRUE(mem.exclusive(A, 3, 1, 4));

	// Timestamp 0 stands for the initial value.
	EXPECT_TRUE(mem.exclusive(A, 0, 0, 2));
	EXPECT_FALSE(mem.exclusive(A, 0, 0, 3));

	// The source must be a write to the same location inside the cut.
	EXPECT_FALSE(mem.exclusive(A, 4, 0, 4));
	EXPECT_FALSE(mem.exclusive(A, 3, 1, 2));

	// Writes to other locations never interfere.
	EXPECT_TRUE(mem.exclusive(B, 0, 0, 3));
}

TEST(MemoryTest, SnapshotIsLittleEndianAndIdempotent) {
	Memory mem;
	mem.promise(WriteEvent{0, A, 0x0102030405060708});
	mem.promise(TlbiEvent{});

	auto first  = mem.snapshot({0x203}, [](Location) -> uint64_t { return 0xff; });
	auto second = mem.snapshot({0x203}, [](Location) -> uint64_t { return 0xff; });
	EXPECT_EQ(first, second);

	EXPECT_EQ(first.size(), 16u);
	EXPECT_EQ(first.at(A), 0x08);
	EXPECT_EQ(first.at(A + 7), 0x01);
	EXPECT_EQ(first.at(0x200), 0xff);
	EXPECT_EQ(first.at(0x207), 0x00);

	// Without an override the memory's own initial function is used.
	EXPECT_EQ(mem.snapshot({0x200}).at(0x200), 0x00);
}

TEST(MemoryTest, InvalidationDeadlineFollowsCoveringTlbi) {
	constexpr Location pte = 0x1000;

	Memory mem;
	mem.promise(WriteEvent{0, pte, 0x3});                            // t=1
	mem.promise(WriteEvent{0, pte, 0x0});                            // t=2
	mem.promise(TlbiEvent{TlbiDescriptor{TlbiScope::BY_ASID, 2}});   // t=3
	mem.promise(TlbiEvent{TlbiDescriptor{TlbiScope::ALL}});          // t=4

	const TranslationRegion asid1{0x400000, 0x401000, Asid(1), true};
	const TranslationRegion asid2{0x400000, 0x401000, Asid(2), true};
	const TranslationRegion global{0x400000, 0x401000, std::nullopt, true};

	EXPECT_EQ(mem.invalidationDeadline(pte, 1, asid1), 3u);
	EXPECT_EQ(mem.invalidationDeadline(pte, 1, asid2), 2u);
	EXPECT_EQ(mem.invalidationDeadline(pte, 1, global), 3u);
	EXPECT_EQ(mem.invalidationDeadline(pte, 0, asid2), 2u);

	// The newest value stays valid.
	EXPECT_EQ(mem.invalidationDeadline(pte, 2, asid1), VIEW_INFINITY);

	// An overwrite with no TLBI after it leaves the old value valid.
	mem.promise(WriteEvent{1, pte, 0x7});
	EXPECT_EQ(mem.invalidationDeadline(pte, 4, asid1), VIEW_INFINITY);
}

TEST(TlbiDescriptorTest, Covers) {
	const uint64_t lo = 0x400000, hi = 0x401000;

	EXPECT_TRUE((TlbiDescriptor{TlbiScope::ALL}).covers(lo, hi, Asid(3), false));
	EXPECT_TRUE((TlbiDescriptor{TlbiScope::ALL}).covers(lo, hi, std::nullopt, true));

	EXPECT_TRUE((TlbiDescriptor{TlbiScope::BY_ASID, 3}).covers(lo, hi, Asid(3), true));
	EXPECT_FALSE((TlbiDescriptor{TlbiScope::BY_ASID, 3}).covers(lo, hi, Asid(4), true));
	EXPECT_FALSE((TlbiDescriptor{TlbiScope::BY_ASID, 3}).covers(lo, hi, std::nullopt, true));

	EXPECT_TRUE((TlbiDescriptor{TlbiScope::BY_VA_ALL_ASID, 0, lo}).covers(lo, hi, std::nullopt, true));
	EXPECT_FALSE((TlbiDescriptor{TlbiScope::BY_VA_ALL_ASID, 0, hi}).covers(lo, hi, Asid(1), true));

	EXPECT_TRUE((TlbiDescriptor{TlbiScope::BY_VA_BY_ASID, 1, lo}).covers(lo, hi, Asid(1), true));
	EXPECT_FALSE((TlbiDescriptor{TlbiScope::BY_VA_BY_ASID, 1, lo}).covers(lo, hi, std::nullopt, true));

	// Last-level-only maintenance leaves table entries alone.
	EXPECT_FALSE((TlbiDescriptor{TlbiScope::ALL, 0, 0, true}).covers(lo, hi, Asid(1), false));
	EXPECT_TRUE((TlbiDescriptor{TlbiScope::ALL, 0, 0, true}).covers(lo, hi, Asid(1), true));
}

TEST(TlbiDescriptorTest, NormalizedKeepsOnlyScopedFields) {
	EXPECT_EQ((TlbiDescriptor{TlbiScope::ALL, 7, 0x1234, true}).normalized(12),
	          (TlbiDescriptor{TlbiScope::ALL, 0, 0, true}));
	EXPECT_EQ((TlbiDescriptor{TlbiScope::BY_ASID, 7, 0x1234}).normalized(12), (TlbiDescriptor{TlbiScope::BY_ASID, 7}));
	EXPECT_EQ((TlbiDescriptor{TlbiScope::BY_VA_ALL_ASID, 7, 0x1234}).normalized(12),
	          (TlbiDescriptor{TlbiScope::BY_VA_ALL_ASID, 0, 0x1000}));
	EXPECT_EQ((TlbiDescriptor{TlbiScope::BY_VA_BY_ASID, 7, 0x12345}).normalized(16),
	          (TlbiDescriptor{TlbiScope::BY_VA_BY_ASID, 7, 0x10000}));
}
