#pragma once

#include "core/Error.hpp"
#include "namespace/INode.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace FSI {

struct Snapshot {
    std::string   name;
    SnapshotId    id           = NoSnapshot;
    NodeId        root         = InvalidNodeId;
    std::uint64_t creationTime = 0;

    auto operator==(Snapshot const&) const -> bool = default;
};

/**
 * Snapshottable directories and the snapshots each of them owns.
 *
 * Snapshots of a directory are kept in creation order, which is also
 * ascending id order. Ids are drawn from one namespace-wide sequence.
 */
class SnapshotRegistry {
public:
    struct Entry {
        NodeId                directory = InvalidNodeId;
        std::uint32_t         quota     = 0;
        std::vector<Snapshot> snapshots;
    };

    auto allow(NodeId directory, std::uint32_t quota) -> void;
    [[nodiscard]] auto disallow(NodeId directory) -> Expected<void>;
    [[nodiscard]] auto isSnapshottable(NodeId directory) const -> bool;
    // Drops the entry of a directory leaving the namespace, snapshots included.
    auto forget(NodeId directory) -> void { entries_.erase(directory); }

    [[nodiscard]] auto create(NodeId directory, std::string_view name, std::uint64_t creationTime)
        -> Expected<Snapshot>;
    [[nodiscard]] auto remove(NodeId directory, std::string_view name) -> Expected<Snapshot>;
    [[nodiscard]] auto rename(NodeId directory, std::string_view oldName, std::string_view newName)
        -> Expected<void>;

    [[nodiscard]] auto list(NodeId directory) const -> Expected<std::vector<Snapshot>>;
    [[nodiscard]] auto find(NodeId directory, std::string_view name) const -> Snapshot const*;
    [[nodiscard]] auto entry(NodeId directory) const -> Entry const*;

    // Newest snapshot of the directory, NoSnapshot when it has none.
    [[nodiscard]] auto latest(NodeId directory) const -> SnapshotId;
    // Newest snapshot of the directory with an id below `bound`.
    [[nodiscard]] auto latestBefore(NodeId directory, SnapshotId bound) const -> SnapshotId;

    [[nodiscard]] auto lastSequence() const noexcept -> SnapshotId { return lastSequence_; }
    auto setLastSequence(SnapshotId value) noexcept -> void { lastSequence_ = value; }

    // Snapshottable directories in ascending id order.
    [[nodiscard]] auto directories() const -> std::vector<NodeId>;
    [[nodiscard]] auto snapshotCount() const -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    // Restores an entry read from an image; rejects duplicates.
    [[nodiscard]] auto restore(Entry entry) -> Expected<void>;

private:
    [[nodiscard]] auto mutableEntry(NodeId directory) -> Expected<Entry*>;

    phmap::flat_hash_map<NodeId, Entry> entries_;
    SnapshotId                          lastSequence_ = NoSnapshot;
};

} // namespace FSI
