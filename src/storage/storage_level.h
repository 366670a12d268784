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

namespace blockstatus {
namespace storage {

/**
 * Placement policy for a block: which tiers hold it and how many replicas
 * the cluster keeps. The accounting core only reads use_off_heap; the rest
 * is carried through for reporting.
 */
struct StorageLevel {
    bool use_disk = false;
    bool use_memory = false;
    bool use_off_heap = false;
    bool deserialized = false;
    int replication = 1;

    constexpr StorageLevel() = default;
    constexpr StorageLevel(bool disk, bool memory, bool off_heap,
                           bool deser, int replicas = 1)
        : use_disk(disk), use_memory(memory), use_off_heap(off_heap),
          deserialized(deser), replication(replicas) {}

    // A level must persist somewhere; off-heap data lives in memory
    // and is never kept deserialized.
    bool is_valid() const {
        return (use_memory || use_disk) && replication > 0 &&
               !(use_off_heap && (!use_memory || deserialized));
    }

    std::string description() const;

    constexpr bool operator==(const StorageLevel& o) const {
        return use_disk == o.use_disk && use_memory == o.use_memory &&
               use_off_heap == o.use_off_heap &&
               deserialized == o.deserialized &&
               replication == o.replication;
    }
    constexpr bool operator!=(const StorageLevel& o) const { return !(*this == o); }

    static const StorageLevel NONE;
    static const StorageLevel DISK_ONLY;
    static const StorageLevel MEMORY_ONLY;
    static const StorageLevel MEMORY_ONLY_SER;
    static const StorageLevel MEMORY_AND_DISK;
    static const StorageLevel MEMORY_AND_DISK_SER;
    static const StorageLevel OFF_HEAP;
};

} // namespace storage
} // namespace blockstatus
