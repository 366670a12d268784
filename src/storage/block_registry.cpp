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

#include "block_registry.h"

namespace blockstatus {
namespace storage {

void BlockRegistry::put(const BlockId& id, const BlockRecord& record) {
    id.visit([&](const auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, DatasetBlock>) {
            dataset_blocks_[b.dataset_id][id] = record;
        } else {
            opaque_blocks_[id] = record;
        }
    });
}

std::optional<BlockRecord> BlockRegistry::remove(const BlockId& id) {
    return id.visit([&](const auto& b) -> std::optional<BlockRecord> {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, DatasetBlock>) {
            auto group = dataset_blocks_.find(b.dataset_id);
            if (group == dataset_blocks_.end()) {
                return std::nullopt;
            }
            auto it = group->second.find(id);
            if (it == group->second.end()) {
                return std::nullopt;
            }
            BlockRecord removed = it->second;
            group->second.erase(it);
            if (group->second.empty()) {
                dataset_blocks_.erase(group);
            }
            return removed;
        } else {
            auto it = opaque_blocks_.find(id);
            if (it == opaque_blocks_.end()) {
                return std::nullopt;
            }
            BlockRecord removed = it->second;
            opaque_blocks_.erase(it);
            return removed;
        }
    });
}

std::optional<BlockRecord> BlockRegistry::get(const BlockId& id) const {
    return id.visit([&](const auto& b) -> std::optional<BlockRecord> {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, DatasetBlock>) {
            auto group = dataset_blocks_.find(b.dataset_id);
            if (group == dataset_blocks_.end()) {
                return std::nullopt;
            }
            auto it = group->second.find(id);
            if (it == group->second.end()) {
                return std::nullopt;
            }
            return it->second;
        } else {
            auto it = opaque_blocks_.find(id);
            if (it == opaque_blocks_.end()) {
                return std::nullopt;
            }
            return it->second;
        }
    });
}

bool BlockRegistry::contains(const BlockId& id) const {
    return id.visit([&](const auto& b) -> bool {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, DatasetBlock>) {
            auto group = dataset_blocks_.find(b.dataset_id);
            return group != dataset_blocks_.end() && group->second.count(id) != 0;
        } else {
            return opaque_blocks_.count(id) != 0;
        }
    });
}

size_t BlockRegistry::count_all() const {
    return opaque_blocks_.size() + count_dataset_blocks();
}

size_t BlockRegistry::count_dataset_blocks() const {
    size_t total = 0;
    for (const auto& group : dataset_blocks_) {
        total += group.second.size();
    }
    return total;
}

size_t BlockRegistry::count_for_dataset(DatasetId dataset_id) const {
    auto group = dataset_blocks_.find(dataset_id);
    return group == dataset_blocks_.end() ? 0 : group->second.size();
}

BlockMap BlockRegistry::snapshot_all() const {
    BlockMap out = snapshot_dataset_blocks();
    out.insert(opaque_blocks_.begin(), opaque_blocks_.end());
    return out;
}

BlockMap BlockRegistry::snapshot_dataset_blocks() const {
    BlockMap out;
    out.reserve(count_dataset_blocks());
    for (const auto& group : dataset_blocks_) {
        out.insert(group.second.begin(), group.second.end());
    }
    return out;
}

BlockMap BlockRegistry::snapshot_for_dataset(DatasetId dataset_id) const {
    auto group = dataset_blocks_.find(dataset_id);
    if (group == dataset_blocks_.end()) {
        return BlockMap();
    }
    return group->second;
}

} // namespace storage
} // namespace blockstatus
