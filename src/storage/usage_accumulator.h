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

#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>
#include "block_id.h"
#include "block_record.h"

namespace blockstatus {
namespace storage {

/**
 * Aggregate footprint of one dataset on this node. The level is the one
 * carried by the most recent accounting step for the dataset; all blocks
 * of a dataset are assumed to share it (not enforced).
 */
struct DatasetUsage {
    int64_t memory_usage = 0;
    int64_t disk_usage = 0;
    StorageLevel level;
};

/**
 * Footprint of the opaque (ungrouped) blocks on this node.
 */
struct NodeUsage {
    int64_t on_heap_usage = 0;
    int64_t off_heap_usage = 0;
    int64_t disk_usage = 0;
};

/**
 * Memory ceilings for the two heap pools. Either may be absent, in which
 * case the matching remaining-capacity query reports nullopt.
 */
struct CapacityLimits {
    std::optional<int64_t> max_on_heap_mem;
    std::optional<int64_t> max_off_heap_mem;
};

/**
 * UsageAccumulator: per-dataset and per-node usage counters maintained
 * from deltas, never recomputed from the block set.
 *
 * Invariants (when fed every change exactly once):
 *   - a dataset's memory/disk equals the sum over its registered blocks
 *   - node usage equals the sums over opaque blocks, split by pool
 *   - a dataset entry exists only while its memory + disk is nonzero
 *   - no counter goes below zero; an update that would is clamped and
 *     logged as a warning
 *
 * Not thread-safe. StatusAccountingEngine owns the only mutable instance
 * and pairs every apply_delta with the matching registry write.
 */
class UsageAccumulator {
public:
    explicit UsageAccumulator(const CapacityLimits& limits = CapacityLimits());

    /**
     * Account for block `id` changing from `old_record` to `new_record`.
     * nullopt on either side stands for the zero record (block absent).
     *
     * The storage level driving the step is the new record's level, or the
     * old record's level when the block is being removed. An opaque block
     * that moves between the on-heap and off-heap pools is released from the
     * old pool and charged to the new one.
     */
    void apply_delta(const BlockId& id,
                     const std::optional<BlockRecord>& old_record,
                     const std::optional<BlockRecord>& new_record);

    // ========== Per-dataset ==========

    int64_t mem_used_by_dataset(DatasetId dataset_id) const;
    int64_t disk_used_by_dataset(DatasetId dataset_id) const;
    std::optional<StorageLevel> dataset_storage_level(DatasetId dataset_id) const;
    std::optional<DatasetUsage> dataset_usage(DatasetId dataset_id) const;
    bool has_dataset(DatasetId dataset_id) const { return datasets_.count(dataset_id) != 0; }
    size_t dataset_count() const { return datasets_.size(); }
    std::vector<DatasetId> dataset_ids() const;

    // ========== Node-wide ==========

    const NodeUsage& opaque_usage() const { return opaque_; }

    // Dataset memory split by each dataset's level. O(#datasets).
    int64_t on_heap_cache_size() const;
    int64_t off_heap_cache_size() const;
    int64_t cache_size() const { return on_heap_cache_size() + off_heap_cache_size(); }

    // Dataset + opaque memory in each pool. O(#datasets).
    int64_t on_heap_mem_used() const { return on_heap_cache_size() + opaque_.on_heap_usage; }
    int64_t off_heap_mem_used() const { return off_heap_cache_size() + opaque_.off_heap_usage; }
    int64_t mem_used() const { return on_heap_mem_used() + off_heap_mem_used(); }
    int64_t disk_used() const;

    // ========== Capacity ==========

    const CapacityLimits& limits() const { return limits_; }

    // Sum of the configured ceilings; an absent ceiling contributes 0
    int64_t max_mem() const;

    std::optional<int64_t> mem_remaining() const;
    std::optional<int64_t> on_heap_mem_remaining() const;
    std::optional<int64_t> off_heap_mem_remaining() const;

private:
    void apply_dataset_delta(const BlockId& id, DatasetId dataset_id,
                             int64_t delta_mem, int64_t delta_disk,
                             const StorageLevel& level);
    void apply_opaque_delta(const BlockId& id, bool off_heap,
                            int64_t delta_mem, int64_t delta_disk);

    CapacityLimits limits_;
    std::unordered_map<DatasetId, DatasetUsage> datasets_;
    NodeUsage opaque_;
};

} // namespace storage
} // namespace blockstatus
