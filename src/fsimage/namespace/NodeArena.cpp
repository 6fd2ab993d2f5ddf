#include "namespace/NodeArena.hpp"

#include <algorithm>

namespace FSI {

auto NodeArena::allocate(NodeKind kind) -> INode& {
    auto node = std::make_unique<INode>();
    node->id  = ++lastId_;
    if (kind == NodeKind::File) {
        node->payload = FilePayload{};
    }
    auto* raw = node.get();
    nodes_.emplace(raw->id, std::move(node));
    return *raw;
}

auto NodeArena::adopt(std::unique_ptr<INode> node) -> INode* {
    if (!node || node->id == InvalidNodeId) {
        return nullptr;
    }
    auto const id          = node->id;
    auto [it, inserted]    = nodes_.try_emplace(id, std::move(node));
    if (!inserted) {
        return nullptr;
    }
    lastId_ = std::max(lastId_, id);
    return it->second.get();
}

auto NodeArena::find(NodeId id) -> INode* {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

auto NodeArena::find(NodeId id) const -> INode const* {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

auto NodeArena::erase(NodeId id) -> void {
    nodes_.erase(id);
}

auto NodeArena::ids() const -> std::vector<NodeId> {
    std::vector<NodeId> out;
    out.reserve(nodes_.size());
    for (auto const& [id, _] : nodes_) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace FSI
