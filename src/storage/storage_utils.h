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
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "status_accounting_engine.h"

namespace blockstatus {
namespace storage {

/**
 * Cluster-wide view of one dataset, rebuilt from the per-node engines by
 * update_dataset_summaries().
 */
struct DatasetSummary {
    DatasetId id = 0;
    std::string name;
    int32_t num_partitions = 0;

    // Overwritten on every update
    StorageLevel storage_level;
    int64_t num_cached_partitions = 0;
    int64_t mem_size = 0;
    int64_t disk_size = 0;

    DatasetSummary() = default;
    DatasetSummary(DatasetId dataset_id, std::string dataset_name, int32_t partitions)
        : id(dataset_id), name(std::move(dataset_name)), num_partitions(partitions) {}

    bool is_cached() const { return mem_size + disk_size > 0 && num_cached_partitions > 0; }
};

// Non-owning; engine lifetime belongs to whoever tracks cluster membership
using EngineList = std::vector<const StatusAccountingEngine*>;

using BlockLocations = std::unordered_map<BlockId, std::vector<std::string>>;

/**
 * Overwrite each summary's storage level, cached partition count, memory
 * and disk size from `engines`.
 *
 * The level is the first one reported for the dataset in engine order
 * (StorageLevel::NONE if no engine holds it); counts and sizes are sums.
 * Read-only on the engines; each summary costs O(#engines).
 */
void update_dataset_summaries(std::vector<DatasetSummary>& summaries, const EngineList& engines);

/**
 * Map every block of `dataset_id` held by any engine to the host:port of
 * each engine holding it, in engine order.
 */
BlockLocations dataset_block_locations(DatasetId dataset_id, const EngineList& engines);

} // namespace storage
} // namespace blockstatus
