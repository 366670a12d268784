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
#include <cstddef>
#include <optional>
#include <unordered_map>
#include "block_id.h"
#include "block_record.h"

namespace blockstatus {
namespace storage {

using BlockMap = std::unordered_map<BlockId, BlockRecord>;

/**
 * BlockRegistry: exact block -> record map for one node.
 *
 * Dataset blocks are grouped per dataset id so that dataset-scoped counts
 * and lookups stay O(1); everything else lives in a flat opaque map.
 * A dataset group exists only while it holds at least one block.
 *
 * Complexity:
 *   put / remove / get / contains / count_for_dataset   O(1)
 *   count_all / count_dataset_blocks                    O(#datasets)
 *   snapshot_all                                        O(#blocks)
 *   snapshot_for_dataset                                O(#blocks in dataset)
 *
 * The snapshot calls copy; nothing on the accounting path uses them.
 */
class BlockRegistry {
public:
    BlockRegistry() = default;

    /** Insert or overwrite the record for `id`. */
    void put(const BlockId& id, const BlockRecord& record);

    /**
     * Remove `id`. Drops the dataset group when its last block leaves.
     * @return the removed record, or nullopt if `id` was not registered
     */
    std::optional<BlockRecord> remove(const BlockId& id);

    std::optional<BlockRecord> get(const BlockId& id) const;
    bool contains(const BlockId& id) const;

    size_t count_all() const;
    size_t count_dataset_blocks() const;
    size_t count_for_dataset(DatasetId dataset_id) const;
    size_t count_opaque() const { return opaque_blocks_.size(); }

    size_t dataset_count() const { return dataset_blocks_.size(); }
    bool has_dataset(DatasetId dataset_id) const {
        return dataset_blocks_.count(dataset_id) != 0;
    }

    BlockMap snapshot_all() const;
    BlockMap snapshot_dataset_blocks() const;
    BlockMap snapshot_for_dataset(DatasetId dataset_id) const;

private:
    std::unordered_map<DatasetId, BlockMap> dataset_blocks_;
    BlockMap opaque_blocks_;
};

} // namespace storage
} // namespace blockstatus
