#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace FSI {

using NodeId     = std::uint64_t;
using SnapshotId = std::uint64_t;

inline constexpr NodeId     InvalidNodeId = 0;
inline constexpr NodeId     RootNodeId    = 16385;
inline constexpr SnapshotId NoSnapshot    = 0;
// Pseudo snapshot id naming the live state in view queries.
inline constexpr SnapshotId CurrentState  = std::numeric_limits<SnapshotId>::max();

enum class NodeKind : std::uint8_t {
    Directory = 1,
    File      = 2
};

[[nodiscard]] constexpr auto nodeKindName(NodeKind kind) -> std::string_view {
    return kind == NodeKind::Directory ? "dir" : "file";
}

struct Attributes {
    std::string   owner;
    std::string   group;
    std::uint16_t permission       = 0;
    std::uint64_t modificationTime = 0;

    auto operator==(Attributes const&) const -> bool = default;
};

struct BlockInfo {
    std::uint64_t blockId         = 0;
    std::uint64_t numBytes        = 0;
    std::uint64_t generationStamp = 0;

    auto operator==(BlockInfo const&) const -> bool = default;
};

struct FileState {
    std::uint16_t          replication        = 0;
    std::uint64_t          preferredBlockSize = 0;
    std::vector<BlockInfo> blocks;

    [[nodiscard]] auto length() const noexcept -> std::uint64_t {
        std::uint64_t total = 0;
        for (auto const& block : blocks) {
            total += block.numBytes;
        }
        return total;
    }

    auto operator==(FileState const&) const -> bool = default;
};

struct RenameRecord {
    std::string oldName;
    NodeId      child = InvalidNodeId;

    auto operator==(RenameRecord const&) const -> bool = default;
};

/**
 * Children changes of one directory between the tagging snapshot and the
 * next snapshot that covers the directory (or the live state).
 *
 * created: children that did not exist when the snapshot was taken.
 * deleted: children that existed then and are gone now; the nodes stay
 *          alive as long as this record references them.
 * renamed: children that existed under oldName when the snapshot was taken.
 */
struct ChildrenDiff {
    std::vector<NodeId>       created;
    std::vector<NodeId>       deleted;
    std::vector<RenameRecord> renamed;

    [[nodiscard]] auto empty() const noexcept -> bool {
        return created.empty() && deleted.empty() && renamed.empty();
    }
};

struct DirectoryDiff {
    SnapshotId   snapshot = NoSnapshot;
    Attributes   attributes; // state of the directory when the snapshot was taken
    ChildrenDiff children;
};

struct FileDiff {
    SnapshotId snapshot = NoSnapshot;
    Attributes attributes; // state of the file when the snapshot was taken
    FileState  state;
};

struct DirectoryPayload {
    std::map<std::string, NodeId, std::less<>> children;
    std::vector<DirectoryDiff>                 diffs; // oldest first
};

struct FilePayload {
    FileState                  state;
    std::optional<std::string> underConstruction; // writing client, set while open
    std::vector<FileDiff>      diffs;              // oldest first
};

/**
 * One node of the namespace arena.
 *
 * A node is linked into its parent's live children map while it is part of
 * the live tree. Diff records refer to nodes by id; every reference (live link
 * or diff entry) is counted in `references` and the node is reclaimed when the
 * count drops to zero.
 *
 * createdAfter holds the last snapshot sequence number allocated before the
 * node was created: snapshots with a larger id may contain it.
 */
struct INode {
    NodeId      id           = InvalidNodeId;
    NodeId      parent       = InvalidNodeId;
    std::string name;
    Attributes  attributes;
    SnapshotId  createdAfter = NoSnapshot;
    std::uint32_t references = 0;

    std::variant<DirectoryPayload, FilePayload> payload;

    [[nodiscard]] auto kind() const noexcept -> NodeKind {
        return std::holds_alternative<DirectoryPayload>(payload) ? NodeKind::Directory : NodeKind::File;
    }
    [[nodiscard]] auto isDirectory() const noexcept -> bool { return kind() == NodeKind::Directory; }
    [[nodiscard]] auto isFile() const noexcept -> bool { return kind() == NodeKind::File; }

    [[nodiscard]] auto directory() -> DirectoryPayload& { return std::get<DirectoryPayload>(payload); }
    [[nodiscard]] auto directory() const -> DirectoryPayload const& { return std::get<DirectoryPayload>(payload); }
    [[nodiscard]] auto file() -> FilePayload& { return std::get<FilePayload>(payload); }
    [[nodiscard]] auto file() const -> FilePayload const& { return std::get<FilePayload>(payload); }

    [[nodiscard]] auto diffCount() const noexcept -> std::size_t;
};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Renders permission bits as rwxr-xr-x.
[[nodiscard]] auto permissionString(std::uint16_t permission) -> std::string;

} // namespace FSI
