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
#include <string>
#include <boost/filesystem/path.hpp>

namespace blockstatus {
namespace storage {

enum class BufferKind {
    Heap,    // Owned by the allocator; nothing to release here
    Direct,  // Native allocation owned by its creator
    Mapped   // mmap'ed region, released with munmap
};

/**
 * A native buffer handed out by the block store.
 */
struct BufferHandle {
    void* address = nullptr;
    size_t length = 0;
    BufferKind kind = BufferKind::Heap;
    boost::filesystem::path backing_file;  // Empty for anonymous mappings

    std::string describe() const;
};

/**
 * Eagerly release the OS resources behind a memory-mapped buffer instead
 * of waiting for its owner to go away.
 *
 * Only BufferKind::Mapped handles are touched. On success the handle is
 * cleared, so disposing twice is harmless. The buffer must not be read
 * after a successful dispose.
 *
 * Never throws: an OS failure is logged as a warning and reported as false.
 * The block accounting engine never calls this.
 *
 * @return true if a mapping was released
 */
bool dispose(BufferHandle& buffer);

} // namespace storage
} // namespace blockstatus
