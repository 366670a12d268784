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

#include "storage_level.h"

#include <sstream>

namespace blockstatus {
namespace storage {

const StorageLevel StorageLevel::NONE{false, false, false, false};
const StorageLevel StorageLevel::DISK_ONLY{true, false, false, false};
const StorageLevel StorageLevel::MEMORY_ONLY{false, true, false, true};
const StorageLevel StorageLevel::MEMORY_ONLY_SER{false, true, false, false};
const StorageLevel StorageLevel::MEMORY_AND_DISK{true, true, false, true};
const StorageLevel StorageLevel::MEMORY_AND_DISK_SER{true, true, false, false};
const StorageLevel StorageLevel::OFF_HEAP{true, true, true, false};

std::string StorageLevel::description() const {
    std::ostringstream oss;
    if (use_disk) {
        oss << "Disk ";
    }
    if (use_memory) {
        oss << (use_off_heap ? "Memory (off heap) " : "Memory ");
    }
    oss << (deserialized ? "Deserialized " : "Serialized ");
    oss << replication << "x Replicated";
    return oss.str();
}

} // namespace storage
} // namespace blockstatus
