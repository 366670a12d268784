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

#include "status_accounting_engine.h"
#include "../util/log.h"

namespace blockstatus {
namespace storage {

namespace {

StatusConfig make_config(std::optional<int64_t> max_on_heap_mem,
                         std::optional<int64_t> max_off_heap_mem) {
    StatusConfig config;
    config.max_on_heap_mem = max_on_heap_mem;
    config.max_off_heap_mem = max_off_heap_mem;
    return config;
}

string describe_ceiling(const std::optional<int64_t>& ceiling) {
    return ceiling ? format_byte_size(*ceiling) : string("unset");
}

} // namespace

StatusAccountingEngine::StatusAccountingEngine(NodeId node,
                                               std::optional<int64_t> max_on_heap_mem,
                                               std::optional<int64_t> max_off_heap_mem)
    : StatusAccountingEngine(std::move(node), make_config(max_on_heap_mem, max_off_heap_mem)) {}

StatusAccountingEngine::StatusAccountingEngine(NodeId node, const StatusConfig& config)
    : node_(std::move(node)), usage_(checked_limits(config)) {
    debug() << "Block status for " << node_.host_port() << " (executor " << node_.executor_id()
            << "): on-heap ceiling " << describe_ceiling(config.max_on_heap_mem)
            << ", off-heap ceiling " << describe_ceiling(config.max_off_heap_mem);
}

StatusAccountingEngine::StatusAccountingEngine(NodeId node, const StatusConfig& config,
                                               const BlockMap& initial_blocks)
    : StatusAccountingEngine(std::move(node), config) {
    for (const auto& entry : initial_blocks) {
        add_or_update(entry.first, entry.second);
    }
}

CapacityLimits StatusAccountingEngine::checked_limits(const StatusConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("StatusAccountingEngine: memory ceilings must not be negative");
    }
    return config.limits();
}

void StatusAccountingEngine::add_or_update(const BlockId& id, const BlockRecord& record) {
    std::optional<BlockRecord> old_record = registry_.get(id);

    usage_.apply_delta(id, old_record, record);
    registry_.put(id, record);

    trace() << (old_record ? "Updated " : "Added ") << id.name() << " on " << node_.host_port()
            << ": mem=" << record.mem_size() << " disk=" << record.disk_size()
            << " level=" << record.storage_level().description();
}

std::optional<BlockRecord> StatusAccountingEngine::remove(const BlockId& id) {
    std::optional<BlockRecord> old_record = registry_.get(id);
    if (!old_record) {
        trace() << "Remove of " << id.name() << " on " << node_.host_port() << ": not registered";
        return std::nullopt;
    }

    usage_.apply_delta(id, old_record, std::nullopt);
    registry_.remove(id);

    trace() << "Removed " << id.name() << " from " << node_.host_port()
            << ": mem=" << old_record->mem_size() << " disk=" << old_record->disk_size();
    return old_record;
}

} // namespace storage
} // namespace blockstatus
