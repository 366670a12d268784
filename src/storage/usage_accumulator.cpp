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

#include "usage_accumulator.h"
#include "../util/log.h"

namespace blockstatus {
namespace storage {

namespace {

// Adds delta to current, flooring the result at zero. A floor hit means the
// caller fed an inconsistent delta sequence.
int64_t clamped_add(int64_t current, int64_t delta, const char* counter, const BlockId& id) {
    int64_t updated = current + delta;
    if (updated < 0) {
        warning() << "Clamping " << counter << " at 0 after applying delta " << delta
                  << " for block " << id.name() << " (was " << current << ")";
        return 0;
    }
    return updated;
}

} // namespace

UsageAccumulator::UsageAccumulator(const CapacityLimits& limits)
    : limits_(limits) {}

void UsageAccumulator::apply_delta(const BlockId& id,
                                   const std::optional<BlockRecord>& old_record,
                                   const std::optional<BlockRecord>& new_record) {
    const BlockRecord before = old_record.value_or(BlockRecord::empty());
    const BlockRecord after = new_record.value_or(BlockRecord::empty());
    const int64_t delta_mem = after.mem_size() - before.mem_size();
    const int64_t delta_disk = after.disk_size() - before.disk_size();

    // Removal passes no new record; the removed block's level picks the pool.
    const StorageLevel& level = new_record ? after.storage_level() : before.storage_level();

    id.visit([&](const auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, DatasetBlock>) {
            apply_dataset_delta(id, b.dataset_id, delta_mem, delta_disk, level);
        } else {
            const bool old_off_heap = before.storage_level().use_off_heap;
            const bool new_off_heap = after.storage_level().use_off_heap;
            if (old_record && new_record && old_off_heap != new_off_heap) {
                apply_opaque_delta(id, old_off_heap, -before.mem_size(), -before.disk_size());
                apply_opaque_delta(id, new_off_heap, after.mem_size(), after.disk_size());
            } else {
                apply_opaque_delta(id, level.use_off_heap, delta_mem, delta_disk);
            }
        }
    });
}

void UsageAccumulator::apply_dataset_delta(const BlockId& id, DatasetId dataset_id,
                                           int64_t delta_mem, int64_t delta_disk,
                                           const StorageLevel& level) {
    int64_t mem = 0;
    int64_t disk = 0;
    auto it = datasets_.find(dataset_id);
    if (it != datasets_.end()) {
        mem = it->second.memory_usage;
        disk = it->second.disk_usage;
    }

    const int64_t new_mem = clamped_add(mem, delta_mem, "dataset memory usage", id);
    const int64_t new_disk = clamped_add(disk, delta_disk, "dataset disk usage", id);

    if (new_mem + new_disk == 0) {
        if (it != datasets_.end()) {
            datasets_.erase(it);
            debug() << "Dataset " << dataset_id << " no longer persisted on this node";
        }
        return;
    }

    DatasetUsage& usage = (it != datasets_.end()) ? it->second : datasets_[dataset_id];
    usage.memory_usage = new_mem;
    usage.disk_usage = new_disk;
    usage.level = level;
}

void UsageAccumulator::apply_opaque_delta(const BlockId& id, bool off_heap,
                                          int64_t delta_mem, int64_t delta_disk) {
    if (off_heap) {
        opaque_.off_heap_usage = clamped_add(opaque_.off_heap_usage, delta_mem, "off-heap usage", id);
    } else {
        opaque_.on_heap_usage = clamped_add(opaque_.on_heap_usage, delta_mem, "on-heap usage", id);
    }
    opaque_.disk_usage = clamped_add(opaque_.disk_usage, delta_disk, "disk usage", id);
}

int64_t UsageAccumulator::mem_used_by_dataset(DatasetId dataset_id) const {
    auto it = datasets_.find(dataset_id);
    return it == datasets_.end() ? 0 : it->second.memory_usage;
}

int64_t UsageAccumulator::disk_used_by_dataset(DatasetId dataset_id) const {
    auto it = datasets_.find(dataset_id);
    return it == datasets_.end() ? 0 : it->second.disk_usage;
}

std::optional<StorageLevel> UsageAccumulator::dataset_storage_level(DatasetId dataset_id) const {
    auto it = datasets_.find(dataset_id);
    if (it == datasets_.end()) {
        return std::nullopt;
    }
    return it->second.level;
}

std::optional<DatasetUsage> UsageAccumulator::dataset_usage(DatasetId dataset_id) const {
    auto it = datasets_.find(dataset_id);
    if (it == datasets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DatasetId> UsageAccumulator::dataset_ids() const {
    std::vector<DatasetId> ids;
    ids.reserve(datasets_.size());
    for (const auto& entry : datasets_) {
        ids.push_back(entry.first);
    }
    return ids;
}

int64_t UsageAccumulator::on_heap_cache_size() const {
    int64_t total = 0;
    for (const auto& entry : datasets_) {
        if (!entry.second.level.use_off_heap) {
            total += entry.second.memory_usage;
        }
    }
    return total;
}

int64_t UsageAccumulator::off_heap_cache_size() const {
    int64_t total = 0;
    for (const auto& entry : datasets_) {
        if (entry.second.level.use_off_heap) {
            total += entry.second.memory_usage;
        }
    }
    return total;
}

int64_t UsageAccumulator::disk_used() const {
    int64_t total = opaque_.disk_usage;
    for (const auto& entry : datasets_) {
        total += entry.second.disk_usage;
    }
    return total;
}

int64_t UsageAccumulator::max_mem() const {
    return limits_.max_on_heap_mem.value_or(0) + limits_.max_off_heap_mem.value_or(0);
}

std::optional<int64_t> UsageAccumulator::mem_remaining() const {
    if (!limits_.max_on_heap_mem && !limits_.max_off_heap_mem) {
        return std::nullopt;
    }
    return max_mem() - mem_used();
}

std::optional<int64_t> UsageAccumulator::on_heap_mem_remaining() const {
    if (!limits_.max_on_heap_mem) {
        return std::nullopt;
    }
    return *limits_.max_on_heap_mem - on_heap_mem_used();
}

std::optional<int64_t> UsageAccumulator::off_heap_mem_remaining() const {
    if (!limits_.max_off_heap_mem) {
        return std::nullopt;
    }
    return *limits_.max_off_heap_mem - off_heap_mem_used();
}

} // namespace storage
} // namespace blockstatus
