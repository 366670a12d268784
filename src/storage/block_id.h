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
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace blockstatus {
namespace storage {

using DatasetId = int32_t;

/**
 * NodeId identifies the storage node an engine reports for.
 * Immutable once built; equality covers every field.
 */
class NodeId {
public:
    NodeId(std::string executor_id, std::string host, uint16_t port)
        : executor_id_(std::move(executor_id)), host_(std::move(host)), port_(port) {}

    const std::string& executor_id() const { return executor_id_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

    // Display form used in block location listings
    std::string host_port() const { return host_ + ":" + std::to_string(port_); }

    bool operator==(const NodeId& o) const {
        return executor_id_ == o.executor_id_ && host_ == o.host_ && port_ == o.port_;
    }
    bool operator!=(const NodeId& o) const { return !(*this == o); }

private:
    std::string executor_id_;
    std::string host_;
    uint16_t port_;
};

/** A block that belongs to partition `partition` of dataset `dataset_id`. */
struct DatasetBlock {
    DatasetId dataset_id;
    int32_t partition;

    bool operator==(const DatasetBlock& o) const {
        return dataset_id == o.dataset_id && partition == o.partition;
    }
    bool operator!=(const DatasetBlock& o) const { return !(*this == o); }
};

/** A block with no dataset grouping (broadcast pieces, stream input, ...). */
struct OpaqueBlock {
    std::string name;

    bool operator==(const OpaqueBlock& o) const { return name == o.name; }
    bool operator!=(const OpaqueBlock& o) const { return !(*this == o); }
};

/**
 * BlockId is a closed sum of DatasetBlock and OpaqueBlock.
 *
 * The variant is the only discriminant, so a block id whose payload
 * disagrees with its kind cannot be constructed. Code that needs the
 * payload matches with visit() and handles both alternatives.
 */
class BlockId {
public:
    using Value = std::variant<DatasetBlock, OpaqueBlock>;

    BlockId(DatasetBlock b) : value_(b) {}
    BlockId(OpaqueBlock b) : value_(std::move(b)) {}

    static BlockId dataset(DatasetId dataset_id, int32_t partition) {
        return BlockId(DatasetBlock{dataset_id, partition});
    }
    static BlockId opaque(std::string name) {
        return BlockId(OpaqueBlock{std::move(name)});
    }

    bool is_dataset_block() const {
        return std::holds_alternative<DatasetBlock>(value_);
    }

    std::optional<DatasetId> dataset_id() const {
        if (const auto* b = std::get_if<DatasetBlock>(&value_)) {
            return b->dataset_id;
        }
        return std::nullopt;
    }

    // "rdd_<dataset>_<partition>" for dataset blocks, the raw name otherwise
    std::string name() const;

    const Value& value() const { return value_; }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& v) const {
        return std::visit(std::forward<Visitor>(v), value_);
    }

    bool operator==(const BlockId& o) const { return value_ == o.value_; }
    bool operator!=(const BlockId& o) const { return !(*this == o); }

private:
    Value value_;
};

namespace detail {
    inline size_t hash_combine(size_t seed, size_t h) {
        return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
    }
}

} // namespace storage
} // namespace blockstatus

namespace std {

template <>
struct hash<blockstatus::storage::NodeId> {
    size_t operator()(const blockstatus::storage::NodeId& n) const noexcept {
        using blockstatus::storage::detail::hash_combine;
        size_t h = std::hash<std::string>{}(n.executor_id());
        h = hash_combine(h, std::hash<std::string>{}(n.host()));
        return hash_combine(h, std::hash<uint16_t>{}(n.port()));
    }
};

template <>
struct hash<blockstatus::storage::BlockId> {
    size_t operator()(const blockstatus::storage::BlockId& id) const noexcept {
        using namespace blockstatus::storage;
        return id.visit([](const auto& b) -> size_t {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, DatasetBlock>) {
                size_t h = std::hash<int32_t>{}(b.dataset_id);
                return blockstatus::storage::detail::hash_combine(h, std::hash<int32_t>{}(b.partition));
            } else {
                // Salted to separate the two alternatives
                return blockstatus::storage::detail::hash_combine(0x5bd1e995, std::hash<std::string>{}(b.name));
            }
        });
    }
};

} // namespace std
