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
#include <stdexcept>
#include <string>
#include "storage_level.h"

namespace blockstatus {
namespace storage {

/**
 * Footprint of one block as last reported by the placement authority.
 * Sizes are bytes and never negative; the constructor rejects negative
 * values with std::invalid_argument.
 */
class BlockRecord {
public:
    BlockRecord() = default;
    BlockRecord(const StorageLevel& level, int64_t mem_size, int64_t disk_size)
        : level_(level), mem_size_(mem_size), disk_size_(disk_size) {
        if (mem_size < 0 || disk_size < 0) {
            throw std::invalid_argument("BlockRecord: negative size (mem=" +
                std::to_string(mem_size) + ", disk=" + std::to_string(disk_size) + ")");
        }
    }

    // The zero record: NONE level, nothing in memory or on disk
    static BlockRecord empty() { return BlockRecord(); }

    const StorageLevel& storage_level() const { return level_; }
    int64_t mem_size() const { return mem_size_; }
    int64_t disk_size() const { return disk_size_; }

    bool is_cached() const { return mem_size_ + disk_size_ > 0; }

    bool operator==(const BlockRecord& o) const {
        return level_ == o.level_ && mem_size_ == o.mem_size_ && disk_size_ == o.disk_size_;
    }
    bool operator!=(const BlockRecord& o) const { return !(*this == o); }

private:
    StorageLevel level_;  // default-constructed level is NONE
    int64_t mem_size_ = 0;
    int64_t disk_size_ = 0;
};

} // namespace storage
} // namespace blockstatus
