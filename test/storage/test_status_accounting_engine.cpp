/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <vector>
#include "storage/status_accounting_engine.h"
#include "test_helpers.h"

using namespace blockstatus::storage;
using namespace blockstatus::storage::test;

class StatusAccountingEngineTest : public ::testing::Test {
protected:
    // Compare every aggregate against a from-scratch recomputation
    static void expect_consistent(const StatusAccountingEngine& engine) {
        ExpectedUsage expected = recompute(engine.blocks());

        EXPECT_EQ(engine.usage().dataset_count(), expected.datasets.size());
        for (const auto& entry : expected.datasets) {
            EXPECT_EQ(engine.mem_used_by_dataset(entry.first), entry.second.first)
                << "dataset " << entry.first;
            EXPECT_EQ(engine.disk_used_by_dataset(entry.first), entry.second.second)
                << "dataset " << entry.first;
        }

        const NodeUsage& opaque = engine.opaque_usage();
        EXPECT_EQ(opaque.on_heap_usage, expected.opaque.on_heap_usage);
        EXPECT_EQ(opaque.off_heap_usage, expected.opaque.off_heap_usage);
        EXPECT_EQ(opaque.disk_usage, expected.opaque.disk_usage);

        EXPECT_GE(engine.mem_used(), 0);
        EXPECT_GE(engine.disk_used(), 0);
    }
};

// ============================================================================
// Capacity scenarios
// ============================================================================

TEST_F(StatusAccountingEngineTest, OnHeapBlockAgainstCeilings) {
    StatusAccountingEngine engine(make_node("a"), int64_t{1000}, int64_t{500});
    engine.add_or_update(BlockId::opaque("a"), on_heap(100));

    EXPECT_EQ(engine.max_mem(), 1500);
    EXPECT_EQ(engine.on_heap_mem_used(), 100);
    EXPECT_EQ(engine.mem_used(), 100);
    EXPECT_EQ(engine.mem_remaining(), std::optional<int64_t>(1400));
    EXPECT_EQ(engine.on_heap_mem_remaining(), std::optional<int64_t>(900));
    EXPECT_EQ(engine.off_heap_mem_remaining(), std::optional<int64_t>(500));
}

TEST_F(StatusAccountingEngineTest, MixedPoolsWithoutCeilings) {
    StatusAccountingEngine engine(make_node("a"));
    engine.add_or_update(BlockId::opaque("a"), on_heap(50));
    engine.add_or_update(BlockId::opaque("b"), off_heap(30));

    EXPECT_EQ(engine.num_blocks(), 2u);
    EXPECT_EQ(engine.mem_used(), 80);
    EXPECT_EQ(engine.on_heap_mem_used(), 50);
    EXPECT_EQ(engine.off_heap_mem_used(), 30);
    EXPECT_FALSE(engine.mem_remaining().has_value());
    EXPECT_FALSE(engine.max_on_heap_mem().has_value());
}

TEST_F(StatusAccountingEngineTest, DatasetLifecycle) {
    StatusAccountingEngine engine(make_node("a"));
    BlockId p0 = BlockId::dataset(10, 0);
    BlockId p1 = BlockId::dataset(10, 1);

    engine.add_or_update(p0, on_heap(200));
    engine.add_or_update(p1, on_heap(300));
    EXPECT_EQ(engine.num_dataset_blocks_by_id(10), 2u);
    EXPECT_EQ(engine.mem_used_by_dataset(10), 500);

    auto removed = engine.remove(p0);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->mem_size(), 200);
    EXPECT_EQ(engine.mem_used_by_dataset(10), 300);
    EXPECT_EQ(engine.num_dataset_blocks_by_id(10), 1u);

    engine.remove(p1);
    EXPECT_FALSE(engine.dataset_usage(10).has_value());
    EXPECT_FALSE(engine.dataset_storage_level(10).has_value());
    EXPECT_EQ(engine.mem_used_by_dataset(10), 0);
    EXPECT_EQ(engine.num_dataset_blocks_by_id(10), 0u);
    EXPECT_FALSE(engine.registry().has_dataset(10));
}

// ============================================================================
// Mutation semantics
// ============================================================================

TEST_F(StatusAccountingEngineTest, RepeatedUpdateIsNoOp) {
    StatusAccountingEngine engine(make_node("a"), int64_t{4096}, int64_t{4096});
    BlockId id = BlockId::dataset(2, 0);
    engine.add_or_update(id, on_heap(120, 30));
    engine.add_or_update(BlockId::opaque("x"), off_heap(60, 6));

    int64_t mem = engine.mem_used();
    int64_t disk = engine.disk_used();
    auto remaining = engine.mem_remaining();

    engine.add_or_update(id, on_heap(120, 30));
    engine.update_block(BlockId::opaque("x"), off_heap(60, 6));

    EXPECT_EQ(engine.mem_used(), mem);
    EXPECT_EQ(engine.disk_used(), disk);
    EXPECT_EQ(engine.mem_remaining(), remaining);
    EXPECT_EQ(engine.mem_used_by_dataset(2), 120);
    EXPECT_EQ(engine.num_blocks(), 2u);
}

TEST_F(StatusAccountingEngineTest, RemoveThenReaddMatchesFreshEngine) {
    StatusAccountingEngine engine(make_node("a"));
    StatusAccountingEngine fresh(make_node("a"));
    BlockId id = BlockId::opaque("broadcast_3");

    engine.add_or_update(BlockId::dataset(1, 0), on_heap(10));
    fresh.add_or_update(BlockId::dataset(1, 0), on_heap(10));

    engine.add_or_update(id, off_heap(900, 100));
    engine.remove(id);
    engine.add_or_update(id, on_heap(40));
    fresh.add_or_update(id, on_heap(40));

    EXPECT_EQ(engine.opaque_usage().on_heap_usage, fresh.opaque_usage().on_heap_usage);
    EXPECT_EQ(engine.opaque_usage().off_heap_usage, fresh.opaque_usage().off_heap_usage);
    EXPECT_EQ(engine.opaque_usage().disk_usage, fresh.opaque_usage().disk_usage);
    EXPECT_EQ(engine.mem_used(), fresh.mem_used());
    EXPECT_EQ(engine.disk_used(), fresh.disk_used());
    EXPECT_EQ(engine.blocks(), fresh.blocks());
}

TEST_F(StatusAccountingEngineTest, RemoveUnknownBlockChangesNothing) {
    StatusAccountingEngine engine(make_node("a"));
    engine.add_or_update(BlockId::opaque("a"), on_heap(5));

    EXPECT_FALSE(engine.remove(BlockId::opaque("zzz")).has_value());
    EXPECT_FALSE(engine.remove(BlockId::dataset(1, 1)).has_value());
    EXPECT_EQ(engine.mem_used(), 5);
    EXPECT_EQ(engine.num_blocks(), 1u);
}

TEST_F(StatusAccountingEngineTest, OffHeapRemovalUsesRemovedBlockLevel) {
    StatusAccountingEngine engine(make_node("a"), int64_t{100}, int64_t{100});
    engine.add_or_update(BlockId::opaque("on"), on_heap(40));
    engine.add_or_update(BlockId::opaque("off"), off_heap(25));

    engine.remove(BlockId::opaque("off"));

    EXPECT_EQ(engine.off_heap_mem_used(), 0);
    EXPECT_EQ(engine.on_heap_mem_used(), 40);
    EXPECT_EQ(engine.off_heap_mem_remaining(), std::optional<int64_t>(100));
}

TEST_F(StatusAccountingEngineTest, BlockQueries) {
    StatusAccountingEngine engine(make_node("a"));
    engine.add_or_update(BlockId::dataset(1, 0), on_heap(1));
    engine.add_or_update(BlockId::dataset(1, 1), on_heap(2));
    engine.add_or_update(BlockId::dataset(2, 0), on_heap(3));
    engine.add_or_update(BlockId::opaque("a"), on_heap(4));

    EXPECT_TRUE(engine.contains_block(BlockId::dataset(1, 1)));
    EXPECT_FALSE(engine.contains_block(BlockId::dataset(1, 2)));
    EXPECT_EQ(engine.get_block(BlockId::opaque("a")), std::optional<BlockRecord>(on_heap(4)));
    EXPECT_EQ(engine.num_blocks(), 4u);
    EXPECT_EQ(engine.num_dataset_blocks(), 3u);
    EXPECT_EQ(engine.blocks().size(), 4u);
    EXPECT_EQ(engine.dataset_blocks().size(), 3u);
    EXPECT_EQ(engine.dataset_blocks_by_id(1).size(), 2u);
}

// ============================================================================
// Construction
// ============================================================================

TEST_F(StatusAccountingEngineTest, SeededFromInitialBlocks) {
    BlockMap initial;
    initial.emplace(BlockId::dataset(1, 0), on_heap(100, 1));
    initial.emplace(BlockId::dataset(1, 1), on_heap(200, 2));
    initial.emplace(BlockId::opaque("b"), off_heap(50));
    BlockMap source_copy = initial;

    StatusConfig config;
    config.max_on_heap_mem = 1000;
    StatusAccountingEngine engine(make_node("a"), config, initial);

    EXPECT_EQ(initial, source_copy);
    EXPECT_EQ(engine.num_blocks(), 3u);
    EXPECT_EQ(engine.mem_used_by_dataset(1), 300);
    EXPECT_EQ(engine.disk_used_by_dataset(1), 3);
    EXPECT_EQ(engine.off_heap_mem_used(), 50);
    EXPECT_EQ(engine.on_heap_mem_remaining(), std::optional<int64_t>(700));
    expect_consistent(engine);
}

TEST_F(StatusAccountingEngineTest, RejectsNegativeCeilings) {
    EXPECT_THROW(StatusAccountingEngine(make_node("a"), int64_t{-1}, std::nullopt),
                 std::invalid_argument);
    EXPECT_THROW(StatusAccountingEngine(make_node("a"), std::nullopt, int64_t{-1}),
                 std::invalid_argument);
}

TEST_F(StatusAccountingEngineTest, EnginesAreIndependent) {
    StatusAccountingEngine a(make_node("a"));
    StatusAccountingEngine b(make_node("b"));
    a.add_or_update(BlockId::dataset(1, 0), on_heap(10));

    EXPECT_EQ(a.num_blocks(), 1u);
    EXPECT_EQ(b.num_blocks(), 0u);
    EXPECT_EQ(b.mem_used_by_dataset(1), 0);

    StatusAccountingEngine moved(std::move(a));
    EXPECT_EQ(moved.node_id(), make_node("a"));
    EXPECT_EQ(moved.mem_used_by_dataset(1), 10);
}

// ============================================================================
// Randomized consistency
// ============================================================================

TEST_F(StatusAccountingEngineTest, AggregatesTrackRandomOperationSequence) {
    StatusAccountingEngine engine(make_node("a"), int64_t{1} << 30, int64_t{1} << 30);
    std::mt19937 gen(20241019);
    std::uniform_int_distribution<int> op_dist(0, 9);
    std::uniform_int_distribution<int> dataset_dist(0, 4);
    std::uniform_int_distribution<int> partition_dist(0, 7);
    std::uniform_int_distribution<int> opaque_dist(0, 9);
    std::uniform_int_distribution<int64_t> size_dist(0, 4096);
    std::uniform_int_distribution<int> level_dist(0, 3);

    const StorageLevel levels[] = {
        StorageLevel::MEMORY_ONLY, StorageLevel::MEMORY_AND_DISK,
        StorageLevel::DISK_ONLY, StorageLevel::OFF_HEAP
    };

    for (int step = 0; step < 2000; ++step) {
        BlockId id = (op_dist(gen) < 6)
            ? BlockId::dataset(dataset_dist(gen), partition_dist(gen))
            : BlockId::opaque("block_" + std::to_string(opaque_dist(gen)));

        if (op_dist(gen) < 7) {
            // Datasets keep one level each, as the placement authority does
            const StorageLevel& level = id.is_dataset_block()
                ? levels[*id.dataset_id() % 4]
                : levels[level_dist(gen)];
            engine.add_or_update(id, BlockRecord(level, size_dist(gen), size_dist(gen)));
        } else {
            engine.remove(id);
        }

        if (step % 100 == 0) {
            expect_consistent(engine);
        }
    }
    expect_consistent(engine);

    // Drain everything; every aggregate returns to zero
    for (const auto& entry : engine.blocks()) {
        engine.remove(entry.first);
    }
    EXPECT_EQ(engine.num_blocks(), 0u);
    EXPECT_EQ(engine.mem_used(), 0);
    EXPECT_EQ(engine.disk_used(), 0);
    EXPECT_EQ(engine.usage().dataset_count(), 0u);
    EXPECT_EQ(engine.mem_remaining(), std::optional<int64_t>(int64_t{2} << 30));
}
