#include "namespace/Namesystem.hpp"

#include "dump/TreeDump.hpp"
#include "image/ImageLoader.hpp"
#include "image/ImageWriter.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

#include <algorithm>

namespace FSI {

namespace {

auto readOnlySnapshot(std::string_view path) -> Error {
    return Error{Error::Code::InvalidPath, "Snapshot paths are read-only: " + std::string{path}};
}

} // namespace

Namesystem::Namesystem(NamesystemOptions options)
    : options_(std::move(options)), tree_(std::make_unique<NamespaceTree>(options_)) {}

auto Namesystem::transactionId() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return transactionId_;
}

auto Namesystem::format() -> void {
    std::unique_lock lock(mutex_);
    tree_ = std::make_unique<NamespaceTree>(options_);
    leases_.clear();
    transactionId_ = 0;
    fsi_log("Formatted namespace", "Namesystem");
}

auto Namesystem::resolveLive(std::string_view path) const -> Expected<NodeId> {
    auto resolved = tree_->resolve(path);
    if (!resolved)
        return std::unexpected(resolved.error());
    if (resolved->snapshot != CurrentState || resolved->snapshotListing) {
        return std::unexpected(readOnlySnapshot(path));
    }
    return resolved->node;
}

auto Namesystem::resolveParent(std::string_view path) const -> Expected<ParentAndName> {
    auto components = splitPath(path);
    if (!components)
        return std::unexpected(components.error());
    if (components->empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "The root has no parent"});
    }
    auto parent = resolveLive(parentPath(path));
    if (!parent)
        return std::unexpected(parent.error());
    return ParentAndName{*parent, components->back()};
}

auto Namesystem::statusOf(NodeId id, SnapshotId snapshot, std::string name) const -> FileStatus {
    auto const& node = *tree_->node(id);
    FileStatus  status;
    status.name       = std::move(name);
    status.id         = id;
    status.kind       = node.kind();
    status.attributes = SnapshotDiff::attributesAt(node, snapshot);
    status.inSnapshot = snapshot != CurrentState;
    if (node.isDirectory()) {
        status.childCount = snapshot == CurrentState ? node.directory().children.size()
                                                     : tree_->childrenAt(node, snapshot).size();
        return status;
    }
    auto const& state  = SnapshotDiff::fileStateAt(node, snapshot);
    status.length      = state.length();
    status.replication = state.replication;
    status.blockSize   = state.preferredBlockSize;
    status.blockCount  = state.blocks.size();
    if (snapshot == CurrentState) {
        status.underConstruction = node.file().underConstruction;
    }
    return status;
}

auto Namesystem::mkdirsLocked(std::string_view path, bool& created) -> Expected<NodeId> {
    auto components = splitPath(path);
    if (!components)
        return std::unexpected(components.error());

    NodeId current = RootNodeId;
    for (auto const& component : *components) {
        auto child = tree_->lookupChild(current, component);
        if (child) {
            if (!tree_->node(*child)->isDirectory()) {
                return std::unexpected(Error{Error::Code::NotDirectory,
                                             tree_->pathOf(*child) + " exists and is not a directory"});
            }
            current = *child;
            continue;
        }
        if (child.error().code != Error::Code::NotFound)
            return std::unexpected(child.error());
        auto made = tree_->createChild(current, component, NodeSpec{.kind = NodeKind::Directory});
        if (!made)
            return std::unexpected(made.error());
        created = true;
        current = *made;
    }
    return current;
}

auto Namesystem::mkdirs(std::string_view path) -> Expected<NodeId> {
    std::unique_lock lock(mutex_);
    bool             created = false;
    auto             result  = mkdirsLocked(path, created);
    if (created) {
        commitTransaction();
    }
    return result;
}

auto Namesystem::createLocked(std::string_view path, std::optional<std::string_view> client,
                              CreateOptions const& options) -> Expected<NodeId> {
    auto components = splitPath(path);
    if (!components)
        return std::unexpected(components.error());
    if (components->empty()) {
        return std::unexpected(Error{Error::Code::AlreadyExists, "The root is a directory"});
    }
    if (auto valid = validateChildName(components->back()); !valid)
        return std::unexpected(valid.error());

    bool   created = false;
    NodeId parent  = InvalidNodeId;
    if (options.createParent) {
        auto made = mkdirsLocked(parentPath(path), created);
        if (!made)
            return std::unexpected(made.error());
        parent = *made;
    } else {
        auto found = resolveLive(parentPath(path));
        if (!found)
            return std::unexpected(found.error());
        parent = *found;
    }
    if (created) {
        commitTransaction();
    }

    auto const& name     = components->back();
    auto        existing = tree_->lookupChild(parent, name);
    if (existing) {
        auto const* node = tree_->node(*existing);
        if (!options.overwrite || !node->isFile()) {
            return std::unexpected(Error{Error::Code::AlreadyExists, std::string{path} + " already exists"});
        }
        if (node->file().underConstruction) {
            return std::unexpected(Error{Error::Code::AlreadyUnderConstruction,
                                         std::string{path} + " is open by " + *node->file().underConstruction});
        }
        if (auto removed = tree_->deleteChild(parent, name); !removed)
            return std::unexpected(removed.error());
        commitTransaction();
    }

    NodeSpec spec;
    spec.kind               = NodeKind::File;
    spec.replication        = options.replication;
    spec.preferredBlockSize = options.blockSize;
    if (client) {
        spec.underConstruction = std::string{*client};
    }
    auto id = tree_->createChild(parent, name, spec);
    if (!id)
        return std::unexpected(id.error());
    commitTransaction();
    return *id;
}

auto Namesystem::createFile(std::string_view path, CreateOptions const& options) -> Expected<NodeId> {
    std::unique_lock lock(mutex_);
    return createLocked(path, std::nullopt, options);
}

auto Namesystem::openLease(NodeId file, std::string_view client) -> WriteHandle {
    WriteHandle handle{.lease = ++nextLease_, .file = file};
    leases_.emplace(handle.lease, Lease{.file = file, .client = std::string{client}, .pendingBytes = 0});
    return handle;
}

auto Namesystem::findLease(WriteHandle const& handle) -> Expected<Lease*> {
    auto it = leases_.find(handle.lease);
    if (it == leases_.end() || it->second.file != handle.file) {
        return std::unexpected(Error{Error::Code::NotUnderConstruction,
                                     "No open lease " + std::to_string(handle.lease)});
    }
    return &it->second;
}

auto Namesystem::create(std::string_view path, std::string_view client, CreateOptions const& options)
    -> Expected<WriteHandle> {
    std::unique_lock lock(mutex_);
    auto             id = createLocked(path, client, options);
    if (!id)
        return std::unexpected(id.error());
    return openLease(*id, client);
}

auto Namesystem::appendFile(std::string_view path, std::string_view client) -> Expected<WriteHandle> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto opened = tree_->openForWrite(*id, client); !opened)
        return std::unexpected(opened.error());
    commitTransaction();
    return openLease(*id, client);
}

auto Namesystem::write(WriteHandle const& handle, std::uint64_t bytes) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             lease = findLease(handle);
    if (!lease)
        return std::unexpected(lease.error());
    (*lease)->pendingBytes += bytes;
    return {};
}

auto Namesystem::sync(WriteHandle const& handle) -> Expected<std::uint64_t> {
    std::unique_lock lock(mutex_);
    auto             lease = findLease(handle);
    if (!lease)
        return std::unexpected(lease.error());
    auto const pending = (*lease)->pendingBytes;
    if (auto committed = tree_->commitBytes(handle.file, pending); !committed)
        return std::unexpected(committed.error());
    (*lease)->pendingBytes = 0;
    if (pending > 0) {
        commitTransaction();
    }
    return tree_->node(handle.file)->file().state.length();
}

auto Namesystem::close(WriteHandle const& handle) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             lease = findLease(handle);
    if (!lease)
        return std::unexpected(lease.error());
    if (auto committed = tree_->commitBytes(handle.file, (*lease)->pendingBytes); !committed)
        return std::unexpected(committed.error());
    if (auto finalized = tree_->finalizeFile(handle.file); !finalized)
        return std::unexpected(finalized.error());
    leases_.erase(handle.lease);
    commitTransaction();
    return {};
}

auto Namesystem::recoverLease(std::string_view path) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto finalized = tree_->finalizeFile(*id); !finalized)
        return std::unexpected(finalized.error());
    // Unsynced bytes of the previous writer are lost.
    for (auto it = leases_.begin(); it != leases_.end();) {
        if (it->second.file == *id) {
            leases_.erase(it++);
        } else {
            ++it;
        }
    }
    commitTransaction();
    fsi_log("Recovered lease on " + std::string{path}, "Namesystem");
    return {};
}

auto Namesystem::dropDeadLeases() -> void {
    for (auto it = leases_.begin(); it != leases_.end();) {
        if (!tree_->isLive(it->second.file)) {
            leases_.erase(it++);
        } else {
            ++it;
        }
    }
}

auto Namesystem::deletePath(std::string_view path, bool recursive) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             target = resolveParent(path);
    if (!target)
        return std::unexpected(target.error());
    auto child = tree_->lookupChild(target->parent, target->name);
    if (!child)
        return std::unexpected(child.error());
    auto const* node = tree_->node(*child);
    if (node->isDirectory() && !node->directory().children.empty() && !recursive) {
        return std::unexpected(Error{Error::Code::DirectoryNotEmpty, std::string{path} + " is not empty"});
    }
    if (auto removed = tree_->deleteChild(target->parent, target->name); !removed)
        return std::unexpected(removed.error());
    dropDeadLeases();
    commitTransaction();
    return {};
}

auto Namesystem::rename(std::string_view source, std::string_view destination) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             from = resolveParent(source);
    if (!from)
        return std::unexpected(from.error());
    auto to = resolveParent(destination);
    if (!to)
        return std::unexpected(to.error());
    if (from->parent != to->parent) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "Rename across directories is not supported: " + std::string{source} + " -> "
                                         + std::string{destination}});
    }
    if (auto renamed = tree_->renameChild(from->parent, from->name, to->name); !renamed)
        return renamed;
    commitTransaction();
    return {};
}

auto Namesystem::setOwner(std::string_view path, std::optional<std::string> owner, std::optional<std::string> group)
    -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    AttributeUpdate update;
    update.owner = std::move(owner);
    update.group = std::move(group);
    if (auto applied = tree_->setAttributes(*id, update); !applied)
        return applied;
    commitTransaction();
    return {};
}

auto Namesystem::setPermission(std::string_view path, std::uint16_t permission) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto applied = tree_->setAttributes(*id, AttributeUpdate{.permission = permission}); !applied)
        return applied;
    commitTransaction();
    return {};
}

auto Namesystem::setReplication(std::string_view path, std::uint16_t replication) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto applied = tree_->setReplication(*id, replication); !applied)
        return applied;
    commitTransaction();
    return {};
}

auto Namesystem::setTimes(std::string_view path, std::uint64_t modificationTime) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto applied = tree_->setAttributes(*id, AttributeUpdate{.modificationTime = modificationTime}); !applied)
        return applied;
    commitTransaction();
    return {};
}

auto Namesystem::getFileInfo(std::string_view path) const -> Expected<FileStatus> {
    std::shared_lock lock(mutex_);
    auto             resolved = tree_->resolve(path);
    if (!resolved)
        return std::unexpected(resolved.error());
    if (resolved->snapshotListing) {
        auto status = statusOf(resolved->node, CurrentState, std::string{SnapshotDirectoryName});
        status.childCount = tree_->registry().entry(resolved->node)->snapshots.size();
        return status;
    }
    auto name = resolved->snapshotRoot ? resolved->snapshotRoot->name : std::string{baseName(path)};
    return statusOf(resolved->node, resolved->snapshot, std::move(name));
}

auto Namesystem::listing(std::string_view path) const -> Expected<std::vector<FileStatus>> {
    std::shared_lock lock(mutex_);
    auto             resolved = tree_->resolve(path);
    if (!resolved)
        return std::unexpected(resolved.error());

    std::vector<FileStatus> out;
    if (resolved->snapshotListing) {
        for (auto const& snapshot : tree_->registry().entry(resolved->node)->snapshots) {
            out.push_back(statusOf(resolved->node, snapshot.id, snapshot.name));
        }
        return out;
    }

    auto const* node = tree_->node(resolved->node);
    if (!node->isDirectory()) {
        out.push_back(statusOf(resolved->node, resolved->snapshot, std::string{baseName(path)}));
        return out;
    }
    for (auto const& child : tree_->childrenAt(*node, resolved->snapshot)) {
        out.push_back(statusOf(child.id, resolved->snapshot, child.name));
    }
    return out;
}

auto Namesystem::exists(std::string_view path) const -> bool {
    std::shared_lock lock(mutex_);
    return tree_->resolve(path).has_value();
}

auto Namesystem::allowSnapshots(std::string_view path) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto allowed = tree_->allowSnapshots(*id); !allowed)
        return allowed;
    commitTransaction();
    return {};
}

auto Namesystem::disallowSnapshots(std::string_view path) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto disallowed = tree_->disallowSnapshots(*id); !disallowed)
        return disallowed;
    commitTransaction();
    return {};
}

auto Namesystem::createSnapshot(std::string_view path, std::string_view name) -> Expected<std::string> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    auto snapshot = tree_->createSnapshot(*id, name);
    if (!snapshot)
        return std::unexpected(snapshot.error());
    commitTransaction();
    return joinPath(joinPath(tree_->pathOf(*id), SnapshotDirectoryName), snapshot->name);
}

auto Namesystem::deleteSnapshot(std::string_view path, std::string_view name) -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto deleted = tree_->deleteSnapshot(*id, name); !deleted)
        return deleted;
    commitTransaction();
    return {};
}

auto Namesystem::renameSnapshot(std::string_view path, std::string_view oldName, std::string_view newName)
    -> Expected<void> {
    std::unique_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    if (auto renamed = tree_->renameSnapshot(*id, oldName, newName); !renamed)
        return renamed;
    commitTransaction();
    return {};
}

auto Namesystem::listSnapshots(std::string_view path) const -> Expected<std::vector<Snapshot>> {
    std::shared_lock lock(mutex_);
    auto             id = resolveLive(path);
    if (!id)
        return std::unexpected(id.error());
    return tree_->listSnapshots(*id);
}

auto Namesystem::snapshottableDirectories() const -> std::vector<SnapshottableDirectoryStatus> {
    std::shared_lock                          lock(mutex_);
    std::vector<SnapshottableDirectoryStatus> out;
    auto const&                               registry = tree_->registry();
    for (auto directory : registry.directories()) {
        auto const* entry = registry.entry(directory);
        out.push_back(SnapshottableDirectoryStatus{.path          = tree_->pathOf(directory),
                                                   .directory     = directory,
                                                   .snapshotCount = entry->snapshots.size(),
                                                   .quota         = entry->quota});
    }
    std::sort(out.begin(), out.end(), [](auto const& lhs, auto const& rhs) { return lhs.path < rhs.path; });
    return out;
}

auto Namesystem::saveImage(ByteSink& sink, CancellationToken const& token, ImageSaveOptions options) const
    -> Expected<SaveOutcome> {
    std::shared_lock lock(mutex_);
    ImageWriter      writer(*tree_, transactionId_, std::move(options));
    return writer.save(sink, token);
}

auto Namesystem::saveImageToFile(std::filesystem::path const& path, CancellationToken const& token,
                                 ImageSaveOptions options) const -> Expected<SaveOutcome> {
    FileByteSink sink(path);
    return saveImage(sink, token, std::move(options));
}

auto Namesystem::loadImage(ByteSource& source) -> Expected<ImageHeader> {
    std::unique_lock lock(mutex_);
    ImageLoader      loader(options_);
    auto             loaded = loader.load(source);
    if (!loaded) {
        fsi_log("Image load failed: " + describeError(loaded.error()), "ImageLoader", "ERROR");
        return std::unexpected(loaded.error());
    }
    tree_          = std::move(loaded->tree);
    transactionId_ = loaded->header.transactionId;
    leases_.clear();
    return loaded->header;
}

auto Namesystem::loadImageFromFile(std::filesystem::path const& path) -> Expected<ImageHeader> {
    FileByteSource source(path);
    if (!source.isOpen()) {
        return std::unexpected(Error{Error::Code::NotFound, "Image not found: " + path.string()});
    }
    return loadImage(source);
}

auto Namesystem::dump() const -> std::string {
    std::shared_lock lock(mutex_);
    return TreeDump::dumpNamespace(*tree_);
}

} // namespace FSI
