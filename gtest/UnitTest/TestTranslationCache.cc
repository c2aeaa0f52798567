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

namespace {

// Level 0 resolves bits [47:39], level 3 bits [20:12].
constexpr uint64_t VA = 0x0000123456789000;

const std::vector<uint64_t> WALK = {0x10003, 0x20003, 0x30003, 0x40000803};

}  // namespace

TEST(TranslationCacheTest, RejectsInvalidSchemes) {
	EXPECT_THROW(TranslationCache(TranslationParams{0, 12, 48}), StructuralError);
	EXPECT_THROW(TranslationCache(TranslationParams{4, 3, 48}), StructuralError);
	EXPECT_THROW(TranslationCache(TranslationParams{5, 12, 48}), StructuralError);
	EXPECT_THROW(TranslationCache(TranslationParams{4, 12, 64}), StructuralError);
	EXPECT_NO_THROW(TranslationCache(TranslationParams{3, 16, 48}));
}

TEST(TranslationCacheTest, TopRegionEndsAboveItsStart) {
	TranslationCache cache(TranslationParams{4, 12, 63});
	uint64_t         top = (uint64_t(1) << 63) - 1;

	TranslationRegion root = cache.region(top, 0, std::nullopt, false);
	EXPECT_EQ(root.vaLo, (uint64_t(1) << 63) - (uint64_t(1) << 39));
	EXPECT_EQ(root.vaHi, uint64_t(1) << 63);
	TlbiDescriptor lastPage{TlbiScope::BY_VA_ALL_ASID, 0, top & ~uint64_t(0xfff)};
	EXPECT_TRUE(lastPage.covers(root.vaLo, root.vaHi, std::nullopt, false));
}

TEST(TranslationCacheTest, PrefixesAndRegions) {
	TranslationCache cache;
	EXPECT_EQ(cache.getLevels(), 4u);
	EXPECT_EQ(cache.vaPrefix(VA, 3), VA >> 12);
	EXPECT_EQ(cache.vaPrefix(VA, 0), VA >> 39);
	EXPECT_EQ(cache.vaPrefix(0xffff000000001000, 3), 1u);
	EXPECT_THROW(cache.vaPrefix(VA, 4), StructuralError);

	TranslationRegion leaf = cache.region(VA + 0x123, 3, Asid(1), true);
	EXPECT_EQ(leaf.vaLo, VA);
	EXPECT_EQ(leaf.vaHi, VA + 0x1000);
	EXPECT_EQ(leaf.asid, std::optional<Asid>(1));

	TranslationRegion table = cache.region(VA, 2, std::nullopt, false);
	EXPECT_EQ(table.vaHi - table.vaLo, uint64_t(1) << 21);
	EXPECT_FALSE(table.leaf);
}

TEST(TranslationCacheTest, WalkEntriesAreFoundLeafFirst) {
	TranslationCache cache = TranslationCache::init(TranslationParams());
	cache.unionWith(cache.fromWalk(VA, 1, WALK, 6, true));
	EXPECT_EQ(cache.size(), 4u);

	auto found = cache.lookup(VA, 1);
	ASSERT_EQ(found.size(), 4u);
	for (size_t i = 0; i < found.size(); ++i) {
		EXPECT_EQ(found[i].level, 3 - i);
		EXPECT_EQ(found[i].entry.descriptors.size(), 4 - i);
		EXPECT_EQ(found[i].entry.view, 6u);
		EXPECT_EQ(found[i].entry.complete, i == 0);
	}
	EXPECT_THAT(found[0].entry.descriptors, ElementsAre(0x10003, 0x20003, 0x30003, 0x40000803));

	// Non-global walks are tagged with their ASID.
	EXPECT_TRUE(cache.lookup(VA, 2).empty());

	// A neighbouring page shares the upper-level tables only.
	EXPECT_EQ(cache.lookup(VA + 0x1000, 1).size(), 3u);
}

TEST(TranslationCacheTest, GlobalWalksMatchEveryAsid) {
	TranslationCache cache;
	cache.unionWith(cache.fromWalk(VA, 1, {0x10003, 0x20003, 0x30003, 0x40000003}, 0, true));

	auto found = cache.lookup(VA, 9);
	ASSERT_EQ(found.size(), 4u);
	EXPECT_FALSE(found[0].asid.has_value());

	// A partial walk is never global.
	TranslationCache partial;
	partial.unionWith(partial.fromWalk(VA, 1, {0x10003, 0x20003}, 0, false));
	EXPECT_TRUE(partial.lookup(VA, 9).empty());
	EXPECT_EQ(partial.lookup(VA, 1).size(), 2u);
}

TEST(TranslationCacheTest, UnionOnlyGrows) {
	TranslationCache a;
	a.unionWith(a.fromWalk(VA, 1, WALK, 1, true));

	TranslationCache b;
	b.unionWith(b.fromWalk(VA, 1, WALK, 2, true));

	TranslationCache merged = TranslationCache::unite(a, b);
	EXPECT_EQ(merged.size(), 8u);
	EXPECT_EQ(TranslationCache::unite(merged, a), merged);

	EXPECT_THROW(a.unionWith(TranslationCache(TranslationParams{3, 12, 48})), StructuralError);
	EXPECT_THROW(a.fromWalk(VA, 1, {1, 2, 3, 4, 5}, 0, true), StructuralError);
	EXPECT_TRUE(a.fromWalk(VA, 1, {}, 0, true).size() == 0);
	EXPECT_THROW(a.get(4, TranslationKey{}), StructuralError);
}
