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

#include "buffer_release.h"
#include "../util/log.h"

#include <sys/mman.h>

namespace blockstatus {
namespace storage {

std::string BufferHandle::describe() const {
    std::ostringstream oss;
    oss << "buffer@" << address << " (" << length << " bytes";
    if (!backing_file.empty()) {
        oss << ", " << backing_file.string();
    }
    oss << ')';
    return oss.str();
}

bool dispose(BufferHandle& buffer) {
    if (buffer.kind != BufferKind::Mapped || buffer.address == nullptr) {
        return false;
    }

    trace() << "Disposing of " << buffer.describe();

    if (::munmap(buffer.address, buffer.length) != 0) {
        int err = errno;
        warning() << "Failed to dispose of " << buffer.describe() << ": "
                  << errnoWithDescription(err);
        return false;
    }

    buffer.address = nullptr;
    buffer.length = 0;
    return true;
}

} // namespace storage
} // namespace blockstatus
