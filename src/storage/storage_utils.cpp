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

#include "storage_utils.h"
#include "../util/log.h"

namespace blockstatus {
namespace storage {

void update_dataset_summaries(std::vector<DatasetSummary>& summaries, const EngineList& engines) {
    for (auto& summary : summaries) {
        std::optional<StorageLevel> level;
        int64_t cached_partitions = 0;
        int64_t mem_size = 0;
        int64_t disk_size = 0;

        for (const StatusAccountingEngine* engine : engines) {
            if (!level) {
                level = engine->dataset_storage_level(summary.id);
            }
            cached_partitions += static_cast<int64_t>(engine->num_dataset_blocks_by_id(summary.id));
            mem_size += engine->mem_used_by_dataset(summary.id);
            disk_size += engine->disk_used_by_dataset(summary.id);
        }

        summary.storage_level = level.value_or(StorageLevel::NONE);
        summary.num_cached_partitions = cached_partitions;
        summary.mem_size = mem_size;
        summary.disk_size = disk_size;
    }

    debug() << "Refreshed " << summaries.size() << " dataset summaries from "
            << engines.size() << " nodes";
}

BlockLocations dataset_block_locations(DatasetId dataset_id, const EngineList& engines) {
    BlockLocations locations;
    for (const StatusAccountingEngine* engine : engines) {
        const std::string location = engine->node_id().host_port();
        for (const auto& entry : engine->dataset_blocks_by_id(dataset_id)) {
            locations[entry.first].push_back(location);
        }
    }
    return locations;
}

} // namespace storage
} // namespace blockstatus
