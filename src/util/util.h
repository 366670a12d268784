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

#include "../pch.h"
#include <optional>

namespace blockstatus {

    /**
     * Parse a byte size such as "512", "64KB", "16mb" or "2GB".
     * Suffixes are powers of 1024 and case-insensitive.
     * @return the size in bytes, or nullopt if the text is not a
     *         non-negative number with an optional suffix.
     */
    std::optional<int64_t> parse_byte_size(const string& text);

    /* Human readable byte count, e.g. "1.5 MB". */
    string format_byte_size(int64_t bytes);
}
