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
#include <utility>
#include <vector>
#include "block_id.h"
#include "block_record.h"
#include "block_registry.h"
#include "usage_accumulator.h"
#include "status_config.h"

namespace blockstatus {
namespace storage {

/**
 * StatusAccountingEngine: the block status of a single storage node.
 *
 * Keeps two views in step: the exact BlockRegistry and the derived
 * UsageAccumulator. Every mutation reads the registry's current record,
 * feeds the delta to the accumulator and only then writes the registry,
 * so the accumulator always sees the pre-mutation state. Neither view can
 * be mutated on its own from outside.
 *
 * Usage:
 *   StatusAccountingEngine status(NodeId("exec-1", "host-a", 7077),
 *                                 StatusConfig::from_env());
 *   status.add_or_update(BlockId::dataset(3, 0),
 *                        BlockRecord(StorageLevel::MEMORY_ONLY, 4096, 0));
 *   int64_t used = status.mem_used_by_dataset(3);
 *
 * Thread-safety:
 *   None. Callers serialize access per node (one lock per engine, or one
 *   owning thread). Read-only use of distinct engines may run in parallel.
 *
 * Precondition:
 *   BlockId is a std::variant, so an id whose payload disagrees with its
 *   kind is unrepresentable; no runtime check exists for it.
 */
class StatusAccountingEngine {
public:
    explicit StatusAccountingEngine(NodeId node,
                                    std::optional<int64_t> max_on_heap_mem = std::nullopt,
                                    std::optional<int64_t> max_off_heap_mem = std::nullopt);

    StatusAccountingEngine(NodeId node, const StatusConfig& config);

    /**
     * Seed the engine with `initial_blocks` through add_or_update.
     * The source map is left unmodified.
     */
    StatusAccountingEngine(NodeId node, const StatusConfig& config,
                           const BlockMap& initial_blocks);

    StatusAccountingEngine(const StatusAccountingEngine&) = delete;
    StatusAccountingEngine& operator=(const StatusAccountingEngine&) = delete;
    StatusAccountingEngine(StatusAccountingEngine&&) = default;
    StatusAccountingEngine& operator=(StatusAccountingEngine&&) = default;

    const NodeId& node_id() const { return node_; }

    // ========== Mutation ==========

    /** Add `id`, overwriting any existing record. */
    void add_or_update(const BlockId& id, const BlockRecord& record);

    /** Update `id`; a block that is not yet registered is added. */
    void update_block(const BlockId& id, const BlockRecord& record) {
        add_or_update(id, record);
    }

    /**
     * Remove `id`.
     * @return the removed record, or nullopt (and no accounting change)
     *         if the block was not registered
     */
    std::optional<BlockRecord> remove(const BlockId& id);

    // ========== Blocks ==========

    bool contains_block(const BlockId& id) const { return registry_.contains(id); }
    std::optional<BlockRecord> get_block(const BlockId& id) const { return registry_.get(id); }

    // O(#datasets)
    size_t num_blocks() const { return registry_.count_all(); }
    size_t num_dataset_blocks() const { return registry_.count_dataset_blocks(); }
    // O(1)
    size_t num_dataset_blocks_by_id(DatasetId dataset_id) const {
        return registry_.count_for_dataset(dataset_id);
    }

    // Copies; O(#blocks). Prefer the counters above where they suffice.
    BlockMap blocks() const { return registry_.snapshot_all(); }
    BlockMap dataset_blocks() const { return registry_.snapshot_dataset_blocks(); }
    BlockMap dataset_blocks_by_id(DatasetId dataset_id) const {
        return registry_.snapshot_for_dataset(dataset_id);
    }

    // ========== Memory ==========

    int64_t max_mem() const { return usage_.max_mem(); }
    int64_t mem_used() const { return usage_.mem_used(); }
    std::optional<int64_t> mem_remaining() const { return usage_.mem_remaining(); }

    int64_t on_heap_mem_used() const { return usage_.on_heap_mem_used(); }
    int64_t off_heap_mem_used() const { return usage_.off_heap_mem_used(); }
    std::optional<int64_t> on_heap_mem_remaining() const { return usage_.on_heap_mem_remaining(); }
    std::optional<int64_t> off_heap_mem_remaining() const { return usage_.off_heap_mem_remaining(); }

    int64_t cache_size() const { return usage_.cache_size(); }
    int64_t on_heap_cache_size() const { return usage_.on_heap_cache_size(); }
    int64_t off_heap_cache_size() const { return usage_.off_heap_cache_size(); }

    std::optional<int64_t> max_on_heap_mem() const { return usage_.limits().max_on_heap_mem; }
    std::optional<int64_t> max_off_heap_mem() const { return usage_.limits().max_off_heap_mem; }

    // ========== Disk ==========

    int64_t disk_used() const { return usage_.disk_used(); }

    // ========== Per-dataset ==========

    int64_t mem_used_by_dataset(DatasetId dataset_id) const { return usage_.mem_used_by_dataset(dataset_id); }
    int64_t disk_used_by_dataset(DatasetId dataset_id) const { return usage_.disk_used_by_dataset(dataset_id); }
    std::optional<StorageLevel> dataset_storage_level(DatasetId dataset_id) const {
        return usage_.dataset_storage_level(dataset_id);
    }
    std::optional<DatasetUsage> dataset_usage(DatasetId dataset_id) const {
        return usage_.dataset_usage(dataset_id);
    }

    // Read-only views for reporting
    const NodeUsage& opaque_usage() const { return usage_.opaque_usage(); }
    const UsageAccumulator& usage() const { return usage_; }
    const BlockRegistry& registry() const { return registry_; }

private:
    static CapacityLimits checked_limits(const StatusConfig& config);

    NodeId node_;
    BlockRegistry registry_;
    UsageAccumulator usage_;
};

} // namespace storage
} // namespace blockstatus
