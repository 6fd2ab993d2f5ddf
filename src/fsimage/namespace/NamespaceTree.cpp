#include "namespace/NamespaceTree.hpp"

#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace FSI {

namespace {

auto notFound(std::string_view what, std::string_view name) -> Error {
    std::string message{what};
    message.append(" \"");
    message.append(name);
    message.append("\" does not exist");
    return Error{Error::Code::NotFound, std::move(message)};
}

} // namespace

NamespaceTree::NamespaceTree(NamesystemOptions options)
    : options_(std::move(options)) {
    auto root = std::make_unique<INode>();
    root->id         = RootNodeId;
    root->parent     = InvalidNodeId;
    root->attributes = defaultAttributes(NodeKind::Directory);
    root->references = 1;
    arena_.adopt(std::move(root));
}

NamespaceTree::NamespaceTree(NamesystemOptions options, LoadTag)
    : options_(std::move(options)) {}

auto NamespaceTree::makeForLoad(NamesystemOptions options) -> std::unique_ptr<NamespaceTree> {
    return std::unique_ptr<NamespaceTree>(new NamespaceTree(std::move(options), LoadTag{}));
}

auto NamespaceTree::root() const -> INode const& {
    return *arena_.find(RootNodeId);
}

auto NamespaceTree::counters() const -> NamespaceCounters {
    return NamespaceCounters{.lastNodeId      = arena_.lastAllocatedId(),
                             .lastBlockId     = lastBlockId_,
                             .generationStamp = generationStamp_,
                             .lastSnapshotId  = registry_.lastSequence()};
}

auto NamespaceTree::defaultAttributes(NodeKind kind) const -> Attributes {
    Attributes attributes;
    attributes.owner            = options_.defaultOwner;
    attributes.group            = options_.defaultGroup;
    attributes.permission       = kind == NodeKind::Directory ? options_.directoryPermission : options_.filePermission;
    attributes.modificationTime = options_.now();
    return attributes;
}

auto NamespaceTree::isLive(NodeId id) const -> bool {
    auto const* current = arena_.find(id);
    while (current && current->id != RootNodeId) {
        auto const* parent = arena_.find(current->parent);
        if (!parent || !parent->isDirectory()) {
            return false;
        }
        auto const& children = parent->directory().children;
        auto        it       = children.find(current->name);
        if (it == children.end() || it->second != current->id) {
            return false;
        }
        current = parent;
    }
    return current != nullptr;
}

auto NamespaceTree::pathOf(NodeId id) const -> std::string {
    std::vector<std::string_view> names;
    auto const* current = arena_.find(id);
    while (current && current->id != RootNodeId) {
        names.push_back(current->name);
        current = arena_.find(current->parent);
    }
    if (names.empty()) {
        return "/";
    }
    std::string path;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        path.push_back('/');
        path.append(*it);
    }
    return path;
}

auto NamespaceTree::resolve(std::string_view path) const -> Expected<ResolvedPath> {
    auto components = splitPath(path);
    if (!components)
        return std::unexpected(components.error());

    ResolvedPath resolved;
    resolved.node = RootNodeId;

    auto const& parts = *components;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto const& component = parts[i];
        auto const* current   = arena_.find(resolved.node);
        if (!current->isDirectory()) {
            return std::unexpected(Error{Error::Code::NotDirectory,
                                         "\"" + current->name + "\" is not a directory in " + std::string{path}});
        }

        if (component == SnapshotDirectoryName) {
            if (resolved.snapshot != CurrentState) {
                return std::unexpected(Error{Error::Code::InvalidPath, "Nested snapshot path " + std::string{path}});
            }
            if (!registry_.isSnapshottable(current->id)) {
                return std::unexpected(Error{Error::Code::NotSnapshottable,
                                             "Directory " + pathOf(current->id) + " is not snapshottable"});
            }
            if (i + 1 == parts.size()) {
                resolved.snapshotListing = true;
                return resolved;
            }
            auto const* snapshot = registry_.find(current->id, parts[i + 1]);
            if (!snapshot) {
                return std::unexpected(notFound("Snapshot", parts[i + 1]));
            }
            resolved.snapshot     = snapshot->id;
            resolved.snapshotRoot = *snapshot;
            ++i;
            continue;
        }

        resolved.snapshotRoot.reset();
        if (resolved.snapshot == CurrentState) {
            auto const& children = current->directory().children;
            auto        it       = children.find(component);
            if (it == children.end()) {
                return std::unexpected(notFound("Path", path));
            }
            resolved.node = it->second;
            continue;
        }

        auto const view  = SnapshotDiff::childrenAt(arena_, *current, resolved.snapshot);
        auto       match = std::find_if(view.begin(), view.end(),
                                        [&](SnapshotDiff::ChildView const& child) { return child.name == component; });
        if (match == view.end()) {
            return std::unexpected(notFound("Path", path));
        }
        resolved.node = match->id;
    }
    return resolved;
}

auto NamespaceTree::lookupChild(NodeId parent, std::string_view name) const -> Expected<NodeId> {
    auto const* directory = arena_.find(parent);
    if (!directory) {
        return std::unexpected(Error{Error::Code::NotFound, "Unknown node " + std::to_string(parent)});
    }
    if (!directory->isDirectory()) {
        return std::unexpected(Error{Error::Code::NotDirectory, "\"" + directory->name + "\" is not a directory"});
    }
    auto const& children = directory->directory().children;
    auto        it       = children.find(name);
    if (it == children.end()) {
        return std::unexpected(notFound("Child", name));
    }
    return it->second;
}

auto NamespaceTree::requireDirectory(NodeId id) -> Expected<INode*> {
    auto* node = mutableNode(id);
    if (!node) {
        return std::unexpected(Error{Error::Code::NotFound, "Unknown node " + std::to_string(id)});
    }
    if (!node->isDirectory()) {
        return std::unexpected(Error{Error::Code::NotDirectory, "\"" + node->name + "\" is not a directory"});
    }
    return node;
}

auto NamespaceTree::requireFile(NodeId id) -> Expected<INode*> {
    auto* node = mutableNode(id);
    if (!node) {
        return std::unexpected(Error{Error::Code::NotFound, "Unknown node " + std::to_string(id)});
    }
    if (!node->isFile()) {
        return std::unexpected(Error{Error::Code::NotFile, "\"" + node->name + "\" is not a file"});
    }
    return node;
}

auto NamespaceTree::latestCoveringSnapshot(INode const& node) const -> SnapshotId {
    SnapshotId latest = NoSnapshot;
    for (auto const* current = &node; current; current = arena_.find(current->parent)) {
        latest = std::max(latest, registry_.latest(current->id));
    }
    return latest;
}

auto NamespaceTree::priorCoveringSnapshot(INode const& node, SnapshotId bound) const -> SnapshotId {
    SnapshotId prior = NoSnapshot;
    for (auto const* current = &node; current; current = arena_.find(current->parent)) {
        prior = std::max(prior, registry_.latestBefore(current->id, bound));
    }
    return prior;
}

auto NamespaceTree::recordDirectoryModification(INode& directory) -> DirectoryDiff* {
    auto const latest = latestCoveringSnapshot(directory);
    if (latest == NoSnapshot || latest <= directory.createdAfter) {
        return nullptr;
    }
    auto& diffs = directory.directory().diffs;
    if (!diffs.empty() && diffs.back().snapshot == latest) {
        return &diffs.back();
    }
    DirectoryDiff diff;
    diff.snapshot   = latest;
    diff.attributes = directory.attributes;
    diffs.push_back(std::move(diff));
    ++diffRecords_;
    return &diffs.back();
}

auto NamespaceTree::recordFileModification(INode& file) -> FileDiff* {
    auto const latest = latestCoveringSnapshot(file);
    if (latest == NoSnapshot || latest <= file.createdAfter) {
        return nullptr;
    }
    auto& payload = file.file();
    if (!payload.diffs.empty() && payload.diffs.back().snapshot == latest) {
        return &payload.diffs.back();
    }
    FileDiff diff;
    diff.snapshot   = latest;
    diff.attributes = file.attributes;
    diff.state      = payload.state;
    payload.diffs.push_back(std::move(diff));
    ++diffRecords_;
    return &payload.diffs.back();
}

auto NamespaceTree::recordModification(INode& node) -> void {
    if (node.isDirectory()) {
        recordDirectoryModification(node);
    } else {
        recordFileModification(node);
    }
}

auto NamespaceTree::applyDelta(SnapshotDiff::ReferenceDelta&& delta) -> void {
    for (auto id : delta.acquired) {
        if (auto* node = arena_.find(id)) {
            ++node->references;
        }
    }
    for (auto id : delta.released) {
        release(id);
    }
}

auto NamespaceTree::release(NodeId id) -> void {
    std::vector<NodeId> pending{id};
    while (!pending.empty()) {
        auto const current = pending.back();
        pending.pop_back();

        auto* node = arena_.find(current);
        if (!node) {
            continue;
        }
        if (node->references > 0) {
            --node->references;
        }
        if (node->references > 0) {
            continue;
        }

        std::visit(Overloaded{
                       [&](DirectoryPayload const& dir) {
                           for (auto const& [_, child] : dir.children) {
                               pending.push_back(child);
                           }
                           for (auto const& diff : dir.diffs) {
                               auto refs = SnapshotDiff::references(diff.children);
                               pending.insert(pending.end(), refs.begin(), refs.end());
                           }
                           diffRecords_ -= dir.diffs.size();
                       },
                       [&](FilePayload const& file) { diffRecords_ -= file.diffs.size(); },
                   },
                   node->payload);

        registry_.forget(current);
        arena_.erase(current);
    }
}

auto NamespaceTree::createChild(NodeId parentId, std::string_view name, NodeSpec const& spec) -> Expected<NodeId> {
    if (auto valid = validateChildName(name); !valid)
        return std::unexpected(valid.error());
    auto parentExpected = requireDirectory(parentId);
    if (!parentExpected)
        return std::unexpected(parentExpected.error());
    auto& parent = **parentExpected;

    if (parent.directory().children.contains(name)) {
        return std::unexpected(Error{Error::Code::AlreadyExists,
                                     "\"" + std::string{name} + "\" already exists in " + pathOf(parentId)});
    }
    auto const blockSize = spec.preferredBlockSize ? spec.preferredBlockSize : options_.preferredBlockSize;
    if (spec.kind == NodeKind::File && blockSize == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Preferred block size must be positive"});
    }

    auto* diff  = recordDirectoryModification(parent);
    auto& child = arena_.allocate(spec.kind);
    child.parent       = parentId;
    child.name         = std::string{name};
    child.attributes   = spec.attributes.value_or(defaultAttributes(spec.kind));
    child.createdAfter = registry_.lastSequence();
    child.references   = 1;
    if (spec.kind == NodeKind::File) {
        auto& file                    = child.file();
        file.state.replication        = spec.replication ? spec.replication : options_.defaultReplication;
        file.state.preferredBlockSize = blockSize;
        file.underConstruction        = spec.underConstruction;
    }

    parent.directory().children.emplace(child.name, child.id);
    parent.attributes.modificationTime = options_.now();
    if (diff) {
        applyDelta(SnapshotDiff::recordCreate(diff->children, child.id));
    }
    fsi_log("Created " + std::string{nodeKindName(spec.kind)} + " " + pathOf(child.id), "Namesystem");
    return child.id;
}

auto NamespaceTree::deleteChild(NodeId parentId, std::string_view name) -> Expected<NodeId> {
    auto parentExpected = requireDirectory(parentId);
    if (!parentExpected)
        return std::unexpected(parentExpected.error());
    auto& parent   = **parentExpected;
    auto& children = parent.directory().children;

    auto it = children.find(name);
    if (it == children.end()) {
        return std::unexpected(notFound("Child", name));
    }
    auto const childId = it->second;
    if (subtreeHasSnapshots(childId)) {
        return std::unexpected(Error{Error::Code::SnapshotsExist,
                                     "Cannot delete " + pathOf(childId) + ": it contains snapshottable directories with snapshots"});
    }

    fsi_log("Deleting " + pathOf(childId), "Namesystem");
    auto* diff = recordDirectoryModification(parent);
    children.erase(it);
    parent.attributes.modificationTime = options_.now();
    forgetSnapshottableUnder(childId);

    SnapshotDiff::ReferenceDelta delta;
    if (diff) {
        delta = SnapshotDiff::recordDelete(diff->children, childId);
    }
    delta.released.push_back(childId); // the live link
    applyDelta(std::move(delta));
    return childId;
}

auto NamespaceTree::renameChild(NodeId parentId, std::string_view oldName, std::string_view newName)
    -> Expected<void> {
    if (auto valid = validateChildName(newName); !valid)
        return std::unexpected(valid.error());
    auto parentExpected = requireDirectory(parentId);
    if (!parentExpected)
        return std::unexpected(parentExpected.error());
    auto& parent   = **parentExpected;
    auto& children = parent.directory().children;

    auto it = children.find(oldName);
    if (it == children.end()) {
        return std::unexpected(notFound("Child", oldName));
    }
    if (oldName == newName) {
        return {};
    }
    if (children.contains(newName)) {
        return std::unexpected(Error{Error::Code::AlreadyExists,
                                     "\"" + std::string{newName} + "\" already exists in " + pathOf(parentId)});
    }

    auto const childId = it->second;
    auto*      diff    = recordDirectoryModification(parent);
    children.erase(it);
    children.emplace(std::string{newName}, childId);
    arena_.find(childId)->name          = std::string{newName};
    parent.attributes.modificationTime = options_.now();
    if (diff) {
        applyDelta(SnapshotDiff::recordRename(diff->children, childId, oldName, newName));
    }
    return {};
}

auto NamespaceTree::setAttributes(NodeId id, AttributeUpdate const& update) -> Expected<void> {
    auto* node = mutableNode(id);
    if (!node) {
        return std::unexpected(Error{Error::Code::NotFound, "Unknown node " + std::to_string(id)});
    }
    recordModification(*node);
    auto& attributes = node->attributes;
    if (update.owner)
        attributes.owner = *update.owner;
    if (update.group)
        attributes.group = *update.group;
    if (update.permission)
        attributes.permission = static_cast<std::uint16_t>(*update.permission & 0777);
    if (update.modificationTime)
        attributes.modificationTime = *update.modificationTime;
    return {};
}

auto NamespaceTree::setReplication(NodeId id, std::uint16_t replication) -> Expected<void> {
    auto fileExpected = requireFile(id);
    if (!fileExpected)
        return std::unexpected(fileExpected.error());
    if (replication == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Replication must be positive"});
    }
    auto& file = **fileExpected;
    recordFileModification(file);
    file.file().state.replication = replication;
    return {};
}

auto NamespaceTree::openForWrite(NodeId id, std::string_view client) -> Expected<void> {
    auto fileExpected = requireFile(id);
    if (!fileExpected)
        return std::unexpected(fileExpected.error());
    auto& file = **fileExpected;
    if (file.file().underConstruction) {
        return std::unexpected(Error{Error::Code::AlreadyUnderConstruction,
                                     pathOf(id) + " is already open by " + *file.file().underConstruction});
    }
    recordFileModification(file);
    auto& payload             = file.file();
    payload.underConstruction = std::string{client};
    auto& blocks              = payload.state.blocks;
    if (!blocks.empty() && blocks.back().numBytes < payload.state.preferredBlockSize) {
        blocks.back().generationStamp = ++generationStamp_;
    }
    return {};
}

auto NamespaceTree::commitBytes(NodeId id, std::uint64_t bytes) -> Expected<void> {
    auto fileExpected = requireFile(id);
    if (!fileExpected)
        return std::unexpected(fileExpected.error());
    auto& file = **fileExpected;
    if (!file.file().underConstruction) {
        return std::unexpected(Error{Error::Code::NotUnderConstruction, pathOf(id) + " is not open for write"});
    }
    if (bytes == 0) {
        return {};
    }
    if (file.file().state.preferredBlockSize == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, pathOf(id) + " has no preferred block size"});
    }
    recordFileModification(file);
    auto&      state     = file.file().state;
    auto const blockSize = state.preferredBlockSize;
    while (bytes > 0) {
        if (state.blocks.empty() || state.blocks.back().numBytes >= blockSize) {
            state.blocks.push_back(BlockInfo{.blockId = ++lastBlockId_, .numBytes = 0, .generationStamp = ++generationStamp_});
        }
        auto&      last  = state.blocks.back();
        auto const chunk = std::min(bytes, blockSize - last.numBytes);
        last.numBytes += chunk;
        bytes -= chunk;
    }
    return {};
}

auto NamespaceTree::finalizeFile(NodeId id) -> Expected<void> {
    auto fileExpected = requireFile(id);
    if (!fileExpected)
        return std::unexpected(fileExpected.error());
    auto& file = **fileExpected;
    if (!file.file().underConstruction) {
        return std::unexpected(Error{Error::Code::NotUnderConstruction, pathOf(id) + " is not open for write"});
    }
    recordFileModification(file);
    file.file().underConstruction.reset();
    file.attributes.modificationTime = options_.now();
    return {};
}

auto NamespaceTree::allowSnapshots(NodeId directory) -> Expected<void> {
    auto dirExpected = requireDirectory(directory);
    if (!dirExpected)
        return std::unexpected(dirExpected.error());
    registry_.allow(directory, options_.snapshotQuota);
    return {};
}

auto NamespaceTree::disallowSnapshots(NodeId directory) -> Expected<void> {
    auto dirExpected = requireDirectory(directory);
    if (!dirExpected)
        return std::unexpected(dirExpected.error());
    return registry_.disallow(directory);
}

auto NamespaceTree::createSnapshot(NodeId directory, std::string_view name) -> Expected<Snapshot> {
    auto dirExpected = requireDirectory(directory);
    if (!dirExpected)
        return std::unexpected(dirExpected.error());
    if (name.empty() || name.find('/') != std::string_view::npos || name == "." || name == "..") {
        return std::unexpected(Error{Error::Code::InvalidPath, "Invalid snapshot name \"" + std::string{name} + "\""});
    }
    return registry_.create(directory, name, options_.now());
}

auto NamespaceTree::deleteSnapshot(NodeId directory, std::string_view name) -> Expected<void> {
    auto dirExpected = requireDirectory(directory);
    if (!dirExpected)
        return std::unexpected(dirExpected.error());
    auto removed = registry_.remove(directory, name);
    if (!removed)
        return std::unexpected(removed.error());
    compactSnapshot(directory, removed->id);
    fsi_log("Deleted snapshot " + removed->name + " of " + pathOf(directory), "Snapshot");
    return {};
}

auto NamespaceTree::renameSnapshot(NodeId directory, std::string_view oldName, std::string_view newName)
    -> Expected<void> {
    if (newName.empty() || newName.find('/') != std::string_view::npos) {
        return std::unexpected(Error{Error::Code::InvalidPath, "Invalid snapshot name \"" + std::string{newName} + "\""});
    }
    return registry_.rename(directory, oldName, newName);
}

auto NamespaceTree::listSnapshots(NodeId directory) const -> Expected<std::vector<Snapshot>> {
    return registry_.list(directory);
}

auto NamespaceTree::childrenAt(INode const& directory, SnapshotId snapshot) const
    -> std::vector<SnapshotDiff::ChildView> {
    return SnapshotDiff::childrenAt(arena_, directory, snapshot);
}

auto NamespaceTree::compactSnapshot(NodeId directory, SnapshotId removed) -> void {
    std::vector<NodeId>        pending{directory};
    std::unordered_set<NodeId> visited;
    while (!pending.empty()) {
        auto const current = pending.back();
        pending.pop_back();
        if (!visited.insert(current).second) {
            continue;
        }
        auto* node = arena_.find(current);
        if (!node) {
            continue; // reclaimed while compacting a parent
        }
        compactNode(*node, removed);
        if (!node->isDirectory()) {
            continue;
        }
        auto const& dir = node->directory();
        for (auto const& [_, child] : dir.children) {
            pending.push_back(child);
        }
        for (auto const& diff : dir.diffs) {
            auto refs = SnapshotDiff::references(diff.children);
            pending.insert(pending.end(), refs.begin(), refs.end());
        }
    }
}

auto NamespaceTree::compactNode(INode& node, SnapshotId removed) -> void {
    auto prior = priorCoveringSnapshot(node, removed);
    if (prior <= node.createdAfter) {
        prior = NoSnapshot;
    }

    SnapshotDiff::ReferenceDelta delta;
    std::visit(Overloaded{
                   [&](DirectoryPayload& dir) {
                       auto& diffs = dir.diffs;
                       auto  it    = std::find_if(diffs.begin(), diffs.end(),
                                                  [&](DirectoryDiff const& diff) { return diff.snapshot == removed; });
                       if (it == diffs.end()) {
                           return;
                       }
                       if (prior == NoSnapshot) {
                           delta.released = SnapshotDiff::references(it->children);
                           diffs.erase(it);
                           --diffRecords_;
                       } else if (it != diffs.begin() && std::prev(it)->snapshot == prior) {
                           delta = SnapshotDiff::combine(std::prev(it)->children, it->children);
                           diffs.erase(it);
                           --diffRecords_;
                       } else {
                           it->snapshot = prior;
                       }
                   },
                   [&](FilePayload& file) {
                       auto& diffs = file.diffs;
                       auto  it    = std::find_if(diffs.begin(), diffs.end(),
                                                  [&](FileDiff const& diff) { return diff.snapshot == removed; });
                       if (it == diffs.end()) {
                           return;
                       }
                       if (prior == NoSnapshot || (it != diffs.begin() && std::prev(it)->snapshot == prior)) {
                           diffs.erase(it);
                           --diffRecords_;
                       } else {
                           it->snapshot = prior;
                       }
                   },
               },
               node.payload);
    applyDelta(std::move(delta));
}

auto NamespaceTree::isAncestorOrSelf(NodeId ancestor, NodeId id) const -> bool {
    for (auto const* current = arena_.find(id); current; current = arena_.find(current->parent)) {
        if (current->id == ancestor) {
            return true;
        }
    }
    return false;
}

auto NamespaceTree::subtreeHasSnapshots(NodeId subtreeRoot) const -> bool {
    for (auto directory : registry_.directories()) {
        if (registry_.latest(directory) != NoSnapshot && isAncestorOrSelf(subtreeRoot, directory)) {
            return true;
        }
    }
    return false;
}

auto NamespaceTree::forgetSnapshottableUnder(NodeId subtreeRoot) -> void {
    for (auto directory : registry_.directories()) {
        if (isAncestorOrSelf(subtreeRoot, directory)) {
            registry_.forget(directory);
        }
    }
}

auto NamespaceTree::finishLoad() -> Expected<void> {
    auto* root = arena_.find(RootNodeId);
    if (!root || !root->isDirectory()) {
        return std::unexpected(Error{Error::Code::Corrupt, "Image has no root directory"});
    }

    for (auto id : arena_.ids()) {
        arena_.find(id)->references = 0;
    }
    root->references = 1;
    diffRecords_     = 0;

    auto const lastSnapshot = registry_.lastSequence();
    auto       acquire      = [&](NodeId owner, NodeId id) -> Expected<INode*> {
        auto* node = arena_.find(id);
        if (!node) {
            return std::unexpected(Error{Error::Code::Corrupt,
                                         "Node " + std::to_string(owner) + " references missing node " + std::to_string(id)});
        }
        ++node->references;
        return node;
    };

    for (auto id : arena_.ids()) {
        auto& node = *arena_.find(id);
        if (node.isDirectory()) {
            auto& dir = node.directory();
            for (auto const& [name, childId] : dir.children) {
                auto child = acquire(id, childId);
                if (!child)
                    return std::unexpected(child.error());
                if ((*child)->parent != id || (*child)->name != name) {
                    return std::unexpected(Error{Error::Code::Corrupt, "Child link mismatch for node " + std::to_string(childId)});
                }
            }
            SnapshotId previous = NoSnapshot;
            for (auto const& diff : dir.diffs) {
                if (diff.snapshot <= previous || diff.snapshot > lastSnapshot) {
                    return std::unexpected(Error{Error::Code::Corrupt, "Diff chain of node " + std::to_string(id) + " is out of order"});
                }
                previous = diff.snapshot;
                for (auto ref : SnapshotDiff::references(diff.children)) {
                    auto child = acquire(id, ref);
                    if (!child)
                        return std::unexpected(child.error());
                }
            }
            diffRecords_ += dir.diffs.size();
        } else {
            auto const& file     = node.file();
            SnapshotId  previous = NoSnapshot;
            for (auto const& diff : file.diffs) {
                if (diff.snapshot <= previous || diff.snapshot > lastSnapshot) {
                    return std::unexpected(Error{Error::Code::Corrupt, "Diff chain of node " + std::to_string(id) + " is out of order"});
                }
                previous = diff.snapshot;
            }
            diffRecords_ += file.diffs.size();
        }
    }

    for (auto id : arena_.ids()) {
        if (arena_.find(id)->references == 0) {
            return std::unexpected(Error{Error::Code::Corrupt, "Node " + std::to_string(id) + " is unreachable"});
        }
    }

    for (auto directory : registry_.directories()) {
        auto const* node = arena_.find(directory);
        if (!node || !node->isDirectory() || !isLive(directory)) {
            return std::unexpected(Error{Error::Code::Corrupt,
                                         "Snapshottable directory " + std::to_string(directory) + " is not a live directory"});
        }
    }
    return {};
}

} // namespace FSI
