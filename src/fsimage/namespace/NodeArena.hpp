#pragma once

#include "namespace/INode.hpp"

#include <cstddef>
#include <memory>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace FSI {

/**
 * Owns every node of a namespace, live or retained by snapshot diffs.
 *
 * Nodes are addressed by stable identifiers; pointers stay valid until the
 * node is erased. Identifiers are never reused.
 */
class NodeArena {
public:
    NodeArena() = default;

    NodeArena(NodeArena const&)            = delete;
    NodeArena& operator=(NodeArena const&) = delete;
    NodeArena(NodeArena&&) noexcept        = default;
    NodeArena& operator=(NodeArena&&) noexcept = default;

    // Allocates a fresh identifier and stores an empty node of the given kind.
    auto allocate(NodeKind kind) -> INode&;

    // Stores a node with a pre-assigned identifier (image loading).
    // Returns nullptr when the identifier is already taken.
    auto adopt(std::unique_ptr<INode> node) -> INode*;

    [[nodiscard]] auto find(NodeId id) -> INode*;
    [[nodiscard]] auto find(NodeId id) const -> INode const*;
    [[nodiscard]] auto contains(NodeId id) const -> bool { return nodes_.contains(id); }

    auto erase(NodeId id) -> void;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return nodes_.size(); }
    [[nodiscard]] auto lastAllocatedId() const noexcept -> NodeId { return lastId_; }
    auto setLastAllocatedId(NodeId id) noexcept -> void { lastId_ = id; }

    // Identifiers in ascending order.
    [[nodiscard]] auto ids() const -> std::vector<NodeId>;

private:
    phmap::flat_hash_map<NodeId, std::unique_ptr<INode>> nodes_;
    NodeId                                               lastId_ = RootNodeId - 1;
};

} // namespace FSI
