#pragma once

#include "core/Error.hpp"
#include "image/ByteStreams.hpp"
#include "image/CancellationToken.hpp"
#include "image/ImageFormat.hpp"
#include "namespace/NamespaceTree.hpp"
#include "namespace/NamesystemOptions.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace FSI {

struct CreateOptions {
    std::uint16_t replication  = 0; // 0 selects NamesystemOptions::defaultReplication
    std::uint64_t blockSize    = 0; // 0 selects NamesystemOptions::preferredBlockSize
    bool          createParent = true;
    bool          overwrite    = false;
};

struct WriteHandle {
    std::uint64_t lease = 0;
    NodeId        file  = InvalidNodeId;
};

struct FileStatus {
    std::string                name;
    NodeId                     id   = InvalidNodeId;
    NodeKind                   kind = NodeKind::Directory;
    Attributes                 attributes;
    std::uint64_t              length      = 0;
    std::uint16_t              replication = 0;
    std::uint64_t              blockSize   = 0;
    std::size_t                blockCount  = 0;
    std::size_t                childCount  = 0;
    std::optional<std::string> underConstruction; // writing client; never set inside snapshots
    bool                       inSnapshot = false;
};

struct SnapshottableDirectoryStatus {
    std::string   path;
    NodeId        directory     = InvalidNodeId;
    std::size_t   snapshotCount = 0;
    std::uint32_t quota         = 0;
};

/**
 * Thread-safe handle on one namespace.
 *
 * Every operation takes the namespace reader/writer lock for its whole
 * critical section: mutations and image loads exclusively, lookups, dumps and
 * image saves shared. A load builds a complete new tree and swaps it in with a
 * single pointer assignment, so readers see either the old or the new tree.
 *
 * Bytes written through a WriteHandle stay in the lease table until sync();
 * only synced lengths ever reach the tree, its snapshots or an image.
 */
class Namesystem {
public:
    explicit Namesystem(NamesystemOptions options = {});

    Namesystem(Namesystem const&)            = delete;
    Namesystem& operator=(Namesystem const&) = delete;

    // Explicit lock handles for callers that need several reads to be
    // consistent. Use unlockedTree() while holding one; the other member
    // functions take the lock themselves.
    auto readLock() const -> void { mutex_.lock_shared(); }
    auto readUnlock() const -> void { mutex_.unlock_shared(); }
    auto writeLock() -> void { mutex_.lock(); }
    auto writeUnlock() -> void { mutex_.unlock(); }
    [[nodiscard]] auto unlockedTree() const -> NamespaceTree const& { return *tree_; }

    [[nodiscard]] auto options() const noexcept -> NamesystemOptions const& { return options_; }
    [[nodiscard]] auto transactionId() const -> std::uint64_t;

    // Replaces the namespace with an empty one (root only).
    auto format() -> void;

    auto mkdirs(std::string_view path) -> Expected<NodeId>;
    auto createFile(std::string_view path, CreateOptions const& options = {}) -> Expected<NodeId>;
    auto create(std::string_view path, std::string_view client, CreateOptions const& options = {})
        -> Expected<WriteHandle>;
    auto appendFile(std::string_view path, std::string_view client) -> Expected<WriteHandle>;
    auto write(WriteHandle const& handle, std::uint64_t bytes) -> Expected<void>;
    // Makes written bytes visible; returns the synced file length.
    auto sync(WriteHandle const& handle) -> Expected<std::uint64_t>;
    auto close(WriteHandle const& handle) -> Expected<void>;
    auto recoverLease(std::string_view path) -> Expected<void>;

    auto deletePath(std::string_view path, bool recursive = false) -> Expected<void>;
    // Renames within one directory: both paths must share their parent.
    auto rename(std::string_view source, std::string_view destination) -> Expected<void>;
    auto setOwner(std::string_view path, std::optional<std::string> owner, std::optional<std::string> group)
        -> Expected<void>;
    auto setPermission(std::string_view path, std::uint16_t permission) -> Expected<void>;
    auto setReplication(std::string_view path, std::uint16_t replication) -> Expected<void>;
    auto setTimes(std::string_view path, std::uint64_t modificationTime) -> Expected<void>;

    [[nodiscard]] auto getFileInfo(std::string_view path) const -> Expected<FileStatus>;
    [[nodiscard]] auto listing(std::string_view path) const -> Expected<std::vector<FileStatus>>;
    [[nodiscard]] auto exists(std::string_view path) const -> bool;

    auto allowSnapshots(std::string_view path) -> Expected<void>;
    auto disallowSnapshots(std::string_view path) -> Expected<void>;
    // Returns the snapshot root path, /dir/.snapshot/<name>.
    auto createSnapshot(std::string_view path, std::string_view name) -> Expected<std::string>;
    auto deleteSnapshot(std::string_view path, std::string_view name) -> Expected<void>;
    auto renameSnapshot(std::string_view path, std::string_view oldName, std::string_view newName) -> Expected<void>;
    [[nodiscard]] auto listSnapshots(std::string_view path) const -> Expected<std::vector<Snapshot>>;
    [[nodiscard]] auto snapshottableDirectories() const -> std::vector<SnapshottableDirectoryStatus>;

    auto saveImage(ByteSink& sink, CancellationToken const& token, ImageSaveOptions options = {}) const
        -> Expected<SaveOutcome>;
    auto saveImageToFile(std::filesystem::path const& path, CancellationToken const& token,
                         ImageSaveOptions options = {}) const -> Expected<SaveOutcome>;
    // Replaces the namespace with the image's. On failure the current one stays.
    auto loadImage(ByteSource& source) -> Expected<ImageHeader>;
    auto loadImageFromFile(std::filesystem::path const& path) -> Expected<ImageHeader>;

    [[nodiscard]] auto dump() const -> std::string;

    template <typename Fn>
    auto inspect(Fn&& fn) const -> decltype(auto) {
        std::shared_lock lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<NamespaceTree const&>(*tree_));
    }

private:
    struct Lease {
        NodeId        file = InvalidNodeId;
        std::string   client;
        std::uint64_t pendingBytes = 0;
    };

    struct ParentAndName {
        NodeId      parent = InvalidNodeId;
        std::string name;
    };

    [[nodiscard]] auto resolveLive(std::string_view path) const -> Expected<NodeId>;
    [[nodiscard]] auto resolveParent(std::string_view path) const -> Expected<ParentAndName>;
    [[nodiscard]] auto statusOf(NodeId id, SnapshotId snapshot, std::string name) const -> FileStatus;
    auto mkdirsLocked(std::string_view path, bool& created) -> Expected<NodeId>;
    auto createLocked(std::string_view path, std::optional<std::string_view> client, CreateOptions const& options)
        -> Expected<NodeId>;
    auto openLease(NodeId file, std::string_view client) -> WriteHandle;
    [[nodiscard]] auto findLease(WriteHandle const& handle) -> Expected<Lease*>;
    auto dropDeadLeases() -> void;
    auto commitTransaction() -> void { ++transactionId_; }

    mutable std::shared_mutex                   mutex_;
    NamesystemOptions                           options_;
    std::unique_ptr<NamespaceTree>              tree_;
    phmap::flat_hash_map<std::uint64_t, Lease> leases_;
    std::uint64_t                               nextLease_     = 0;
    std::uint64_t                               transactionId_ = 0;
};

} // namespace FSI
