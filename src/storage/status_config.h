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
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include "usage_accumulator.h"
#include "../util/util.h"

namespace blockstatus {
namespace storage {

/**
 * Runtime configuration for a node's status engine.
 * Ceilings are optional; an unset ceiling means "not reported".
 */
struct StatusConfig {
    std::optional<int64_t> max_on_heap_mem;
    std::optional<int64_t> max_off_heap_mem;

    static constexpr const char* kOnHeapEnvVar = "BLOCKSTATUS_MAX_ONHEAP_MEM";
    static constexpr const char* kOffHeapEnvVar = "BLOCKSTATUS_MAX_OFFHEAP_MEM";

    /**
     * No ceilings configured
     */
    static StatusConfig defaults() {
        return StatusConfig();
    }

    /**
     * Defaults overridden by BLOCKSTATUS_MAX_ONHEAP_MEM and
     * BLOCKSTATUS_MAX_OFFHEAP_MEM (e.g. "4GB", "512MB", "1048576").
     * Throws std::invalid_argument if a variable is set but unparsable.
     */
    static StatusConfig from_env() {
        StatusConfig cfg = defaults();

        if (const char* env = std::getenv(kOnHeapEnvVar)) {
            cfg.max_on_heap_mem = parse_env_size(kOnHeapEnvVar, env);
        }

        if (const char* env = std::getenv(kOffHeapEnvVar)) {
            cfg.max_off_heap_mem = parse_env_size(kOffHeapEnvVar, env);
        }

        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (max_on_heap_mem && *max_on_heap_mem < 0) {
            return false;
        }
        if (max_off_heap_mem && *max_off_heap_mem < 0) {
            return false;
        }
        return true;
    }

    CapacityLimits limits() const {
        CapacityLimits l;
        l.max_on_heap_mem = max_on_heap_mem;
        l.max_off_heap_mem = max_off_heap_mem;
        return l;
    }

private:
    static int64_t parse_env_size(const char* name, const char* value) {
        auto bytes = parse_byte_size(value);
        if (!bytes) {
            throw std::invalid_argument(std::string(name) + ": invalid size '" + value + "'");
        }
        return *bytes;
    }
};

} // namespace storage
} // namespace blockstatus
