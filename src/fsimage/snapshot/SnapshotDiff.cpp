#include "snapshot/SnapshotDiff.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace FSI::SnapshotDiff {

namespace {

auto eraseId(std::vector<NodeId>& ids, NodeId id) -> bool {
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end()) {
        return false;
    }
    ids.erase(it);
    return true;
}

auto containsId(std::vector<NodeId> const& ids, NodeId id) -> bool {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

auto findRename(std::vector<RenameRecord>& records, NodeId child) -> std::vector<RenameRecord>::iterator {
    return std::find_if(records.begin(), records.end(),
                        [child](RenameRecord const& record) { return record.child == child; });
}

template <typename Diff>
auto findDiff(std::vector<Diff>& diffs, SnapshotId snapshot) -> Diff* {
    auto it = std::lower_bound(diffs.begin(), diffs.end(), snapshot,
                               [](Diff const& diff, SnapshotId value) { return diff.snapshot < value; });
    if (it == diffs.end() || it->snapshot != snapshot) {
        return nullptr;
    }
    return &*it;
}

template <typename Diff>
auto firstDiffAtOrAfter(std::vector<Diff> const& diffs, SnapshotId snapshot) -> Diff const* {
    auto it = std::lower_bound(diffs.begin(), diffs.end(), snapshot,
                               [](Diff const& diff, SnapshotId value) { return diff.snapshot < value; });
    return it == diffs.end() ? nullptr : &*it;
}

} // namespace

auto ReferenceDelta::append(ReferenceDelta&& other) -> void {
    acquired.insert(acquired.end(), other.acquired.begin(), other.acquired.end());
    released.insert(released.end(), other.released.begin(), other.released.end());
}

auto findDirectoryDiff(std::vector<DirectoryDiff>& diffs, SnapshotId snapshot) -> DirectoryDiff* {
    return findDiff(diffs, snapshot);
}

auto findFileDiff(std::vector<FileDiff>& diffs, SnapshotId snapshot) -> FileDiff* {
    return findDiff(diffs, snapshot);
}

auto recordCreate(ChildrenDiff& diff, NodeId child) -> ReferenceDelta {
    ReferenceDelta delta;
    diff.created.push_back(child);
    delta.acquired.push_back(child);
    return delta;
}

auto recordDelete(ChildrenDiff& diff, NodeId child) -> ReferenceDelta {
    ReferenceDelta delta;
    if (eraseId(diff.created, child)) {
        // Born and gone inside the same window: no snapshot ever saw it.
        delta.released.push_back(child);
        return delta;
    }
    diff.deleted.push_back(child);
    delta.acquired.push_back(child);
    return delta;
}

auto recordRename(ChildrenDiff& diff, NodeId child, std::string_view oldName, std::string_view newName)
    -> ReferenceDelta {
    ReferenceDelta delta;
    if (containsId(diff.created, child)) {
        return delta;
    }
    auto existing = findRename(diff.renamed, child);
    if (existing != diff.renamed.end()) {
        if (existing->oldName == newName) {
            diff.renamed.erase(existing);
            delta.released.push_back(child);
        }
        return delta;
    }
    diff.renamed.push_back(RenameRecord{std::string{oldName}, child});
    delta.acquired.push_back(child);
    return delta;
}

auto combine(ChildrenDiff& prior, ChildrenDiff& later) -> ReferenceDelta {
    ReferenceDelta delta;

    for (auto& record : later.renamed) {
        if (findRename(prior.renamed, record.child) != prior.renamed.end()
            || containsId(prior.created, record.child)) {
            delta.released.push_back(record.child);
            continue;
        }
        prior.renamed.push_back(std::move(record));
    }

    for (auto id : later.deleted) {
        if (eraseId(prior.created, id)) {
            // Created after the prior snapshot and deleted before the next one.
            delta.released.push_back(id);
            delta.released.push_back(id);
            continue;
        }
        prior.deleted.push_back(id);
    }

    prior.created.insert(prior.created.end(), later.created.begin(), later.created.end());

    later = ChildrenDiff{};
    return delta;
}

auto references(ChildrenDiff const& diff) -> std::vector<NodeId> {
    std::vector<NodeId> out;
    out.reserve(diff.created.size() + diff.deleted.size() + diff.renamed.size());
    out.insert(out.end(), diff.created.begin(), diff.created.end());
    out.insert(out.end(), diff.deleted.begin(), diff.deleted.end());
    for (auto const& record : diff.renamed) {
        out.push_back(record.child);
    }
    return out;
}

auto childrenAt(NodeArena const& arena, INode const& directory, SnapshotId snapshot) -> std::vector<ChildView> {
    auto const& payload = directory.directory();
    std::vector<ChildView> out;

    if (snapshot == CurrentState) {
        out.reserve(payload.children.size());
        for (auto const& [name, id] : payload.children) {
            out.push_back(ChildView{name, id});
        }
        return out;
    }

    std::unordered_set<NodeId> members;
    members.reserve(payload.children.size());
    for (auto const& [_, id] : payload.children) {
        members.insert(id);
    }

    std::unordered_map<NodeId, std::string_view> renamedFrom;
    for (auto it = payload.diffs.rbegin(); it != payload.diffs.rend() && it->snapshot >= snapshot; ++it) {
        for (auto id : it->children.created) {
            members.erase(id);
        }
        for (auto id : it->children.deleted) {
            members.insert(id);
        }
        for (auto const& record : it->children.renamed) {
            renamedFrom[record.child] = record.oldName;
        }
    }

    out.reserve(members.size());
    for (auto id : members) {
        auto const* child = arena.find(id);
        if (!child) {
            continue;
        }
        auto renamed = renamedFrom.find(id);
        if (renamed != renamedFrom.end()) {
            out.push_back(ChildView{std::string{renamed->second}, id});
        } else {
            out.push_back(ChildView{child->name, id});
        }
    }
    std::sort(out.begin(), out.end(), [](ChildView const& lhs, ChildView const& rhs) { return lhs.name < rhs.name; });
    return out;
}

auto attributesAt(INode const& node, SnapshotId snapshot) -> Attributes const& {
    if (snapshot == CurrentState) {
        return node.attributes;
    }
    return std::visit(Overloaded{
                          [&](DirectoryPayload const& dir) -> Attributes const& {
                              auto const* diff = firstDiffAtOrAfter(dir.diffs, snapshot);
                              return diff ? diff->attributes : node.attributes;
                          },
                          [&](FilePayload const& file) -> Attributes const& {
                              auto const* diff = firstDiffAtOrAfter(file.diffs, snapshot);
                              return diff ? diff->attributes : node.attributes;
                          },
                      },
                      node.payload);
}

auto fileStateAt(INode const& node, SnapshotId snapshot) -> FileState const& {
    auto const& file = node.file();
    if (snapshot == CurrentState) {
        return file.state;
    }
    auto const* diff = firstDiffAtOrAfter(file.diffs, snapshot);
    return diff ? diff->state : file.state;
}

} // namespace FSI::SnapshotDiff
