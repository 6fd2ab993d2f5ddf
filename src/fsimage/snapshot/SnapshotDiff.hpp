#pragma once

#include "namespace/INode.hpp"
#include "namespace/NodeArena.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace FSI::SnapshotDiff {

/**
 * Reference count changes produced by a diff operation. The caller applies
 * them to the arena; released ids may reclaim nodes.
 */
struct ReferenceDelta {
    std::vector<NodeId> acquired;
    std::vector<NodeId> released;

    auto append(ReferenceDelta&& other) -> void;
};

// Diff of `diffs` tagged with `snapshot`, or nullptr.
[[nodiscard]] auto findDirectoryDiff(std::vector<DirectoryDiff>& diffs, SnapshotId snapshot) -> DirectoryDiff*;
[[nodiscard]] auto findFileDiff(std::vector<FileDiff>& diffs, SnapshotId snapshot) -> FileDiff*;

/*
 * Children diff bookkeeping. Each call describes one live mutation in the
 * window of `diff` and reports which references it takes or drops.
 */
[[nodiscard]] auto recordCreate(ChildrenDiff& diff, NodeId child) -> ReferenceDelta;
[[nodiscard]] auto recordDelete(ChildrenDiff& diff, NodeId child) -> ReferenceDelta;
[[nodiscard]] auto recordRename(ChildrenDiff& diff, NodeId child, std::string_view oldName, std::string_view newName)
    -> ReferenceDelta;

// Folds `later` into `prior`; `later` is left empty.
[[nodiscard]] auto combine(ChildrenDiff& prior, ChildrenDiff& later) -> ReferenceDelta;

// Every reference held by the diff, for dropping it outright.
[[nodiscard]] auto references(ChildrenDiff const& diff) -> std::vector<NodeId>;

struct ChildView {
    std::string name;
    NodeId      id = InvalidNodeId;
};

/*
 * Snapshot views. `snapshot` may be CurrentState for the live tree. A view at
 * snapshot s combines the live state with every diff tagged s or newer.
 */
[[nodiscard]] auto childrenAt(NodeArena const& arena, INode const& directory, SnapshotId snapshot)
    -> std::vector<ChildView>;
[[nodiscard]] auto attributesAt(INode const& node, SnapshotId snapshot) -> Attributes const&;
[[nodiscard]] auto fileStateAt(INode const& node, SnapshotId snapshot) -> FileState const&;

} // namespace FSI::SnapshotDiff
