#pragma once

#include "core/Error.hpp"
#include "namespace/INode.hpp"
#include "namespace/NamesystemOptions.hpp"
#include "namespace/NodeArena.hpp"
#include "snapshot/SnapshotDiff.hpp"
#include "snapshot/SnapshotRegistry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FSI {

class ImageLoader;

struct NodeSpec {
    NodeKind                   kind = NodeKind::Directory;
    std::optional<Attributes>  attributes;             // defaults from NamesystemOptions
    std::uint16_t              replication        = 0; // 0 selects the default
    std::uint64_t              preferredBlockSize = 0; // 0 selects the default
    std::optional<std::string> underConstruction;      // client name for files created open
};

struct AttributeUpdate {
    std::optional<std::string>   owner;
    std::optional<std::string>   group;
    std::optional<std::uint16_t> permission;
    std::optional<std::uint64_t> modificationTime;
};

struct ResolvedPath {
    NodeId                  node     = InvalidNodeId;
    SnapshotId              snapshot = CurrentState;
    std::optional<Snapshot> snapshotRoot;            // path names a snapshot root itself
    bool                    snapshotListing = false; // path ends in /.snapshot
};

struct NamespaceCounters {
    NodeId        lastNodeId      = 0;
    std::uint64_t lastBlockId     = 0;
    std::uint64_t generationStamp = 0;
    SnapshotId    lastSnapshotId  = NoSnapshot;

    auto operator==(NamespaceCounters const&) const -> bool = default;
};

/**
 * The namespace: an arena of directory/file nodes, the per-node diff chains
 * that let snapshots share unchanged state, and the snapshot registry.
 *
 * Not synchronized; Namesystem serializes access with its reader/writer lock.
 *
 * Every mutation first records the pre-mutation state in the diff tagged with
 * the newest snapshot covering the node (creating that diff if needed), then
 * applies the change. Operations validate before recording so a failure never
 * leaves a partial change behind.
 */
class NamespaceTree {
public:
    explicit NamespaceTree(NamesystemOptions options);

    NamespaceTree(NamespaceTree const&)            = delete;
    NamespaceTree& operator=(NamespaceTree const&) = delete;

    [[nodiscard]] auto options() const noexcept -> NamesystemOptions const& { return options_; }
    [[nodiscard]] auto root() const -> INode const&;
    [[nodiscard]] auto node(NodeId id) const -> INode const* { return arena_.find(id); }
    [[nodiscard]] auto arena() const noexcept -> NodeArena const& { return arena_; }
    [[nodiscard]] auto registry() const noexcept -> SnapshotRegistry const& { return registry_; }
    [[nodiscard]] auto counters() const -> NamespaceCounters;
    [[nodiscard]] auto nodeCount() const noexcept -> std::size_t { return arena_.size(); }
    [[nodiscard]] auto diffRecordCount() const noexcept -> std::size_t { return diffRecords_; }

    [[nodiscard]] auto isLive(NodeId id) const -> bool;
    [[nodiscard]] auto pathOf(NodeId id) const -> std::string;

    [[nodiscard]] auto resolve(std::string_view path) const -> Expected<ResolvedPath>;
    [[nodiscard]] auto lookupChild(NodeId parent, std::string_view name) const -> Expected<NodeId>;

    auto createChild(NodeId parent, std::string_view name, NodeSpec const& spec) -> Expected<NodeId>;
    auto deleteChild(NodeId parent, std::string_view name) -> Expected<NodeId>;
    auto renameChild(NodeId parent, std::string_view oldName, std::string_view newName) -> Expected<void>;
    auto setAttributes(NodeId id, AttributeUpdate const& update) -> Expected<void>;
    auto setReplication(NodeId id, std::uint16_t replication) -> Expected<void>;

    auto openForWrite(NodeId id, std::string_view client) -> Expected<void>;
    // Makes `bytes` synced bytes visible: grows the last block, then allocates new ones.
    auto commitBytes(NodeId id, std::uint64_t bytes) -> Expected<void>;
    auto finalizeFile(NodeId id) -> Expected<void>;

    auto allowSnapshots(NodeId directory) -> Expected<void>;
    auto disallowSnapshots(NodeId directory) -> Expected<void>;
    auto createSnapshot(NodeId directory, std::string_view name) -> Expected<Snapshot>;
    auto deleteSnapshot(NodeId directory, std::string_view name) -> Expected<void>;
    auto renameSnapshot(NodeId directory, std::string_view oldName, std::string_view newName) -> Expected<void>;
    [[nodiscard]] auto listSnapshots(NodeId directory) const -> Expected<std::vector<Snapshot>>;

    [[nodiscard]] auto childrenAt(INode const& directory, SnapshotId snapshot) const
        -> std::vector<SnapshotDiff::ChildView>;

private:
    friend class ImageLoader;

    struct LoadTag {};
    NamespaceTree(NamesystemOptions options, LoadTag);
    // Empty tree without a root, filled in by the image loader.
    static auto makeForLoad(NamesystemOptions options) -> std::unique_ptr<NamespaceTree>;
    auto finishLoad() -> Expected<void>;

    [[nodiscard]] auto mutableNode(NodeId id) -> INode* { return arena_.find(id); }
    [[nodiscard]] auto requireDirectory(NodeId id) -> Expected<INode*>;
    [[nodiscard]] auto requireFile(NodeId id) -> Expected<INode*>;
    [[nodiscard]] auto defaultAttributes(NodeKind kind) const -> Attributes;

    [[nodiscard]] auto latestCoveringSnapshot(INode const& node) const -> SnapshotId;
    [[nodiscard]] auto priorCoveringSnapshot(INode const& node, SnapshotId bound) const -> SnapshotId;
    auto recordDirectoryModification(INode& directory) -> DirectoryDiff*;
    auto recordFileModification(INode& file) -> FileDiff*;
    auto recordModification(INode& node) -> void;

    auto applyDelta(SnapshotDiff::ReferenceDelta&& delta) -> void;
    auto release(NodeId id) -> void;
    auto compactSnapshot(NodeId directory, SnapshotId removed) -> void;
    auto compactNode(INode& node, SnapshotId removed) -> void;
    [[nodiscard]] auto isAncestorOrSelf(NodeId ancestor, NodeId id) const -> bool;
    [[nodiscard]] auto subtreeHasSnapshots(NodeId subtreeRoot) const -> bool;
    auto forgetSnapshottableUnder(NodeId subtreeRoot) -> void;

    NamesystemOptions options_;
    NodeArena         arena_;
    SnapshotRegistry  registry_;
    std::uint64_t     lastBlockId_     = 1ull << 30;
    std::uint64_t     generationStamp_ = 1000;
    std::size_t       diffRecords_     = 0;
};

} // namespace FSI
