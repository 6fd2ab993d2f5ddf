#include "snapshot/SnapshotRegistry.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <iterator>

namespace FSI {

namespace {

auto notSnapshottable(NodeId directory) -> Error {
    return Error{Error::Code::NotSnapshottable,
                 "Directory " + std::to_string(directory) + " is not snapshottable"};
}

} // namespace

auto SnapshotRegistry::allow(NodeId directory, std::uint32_t quota) -> void {
    auto [it, inserted] = entries_.try_emplace(directory);
    if (inserted) {
        it->second.directory = directory;
    }
    it->second.quota = quota;
}

auto SnapshotRegistry::disallow(NodeId directory) -> Expected<void> {
    auto it = entries_.find(directory);
    if (it == entries_.end()) {
        return std::unexpected(notSnapshottable(directory));
    }
    if (!it->second.snapshots.empty()) {
        return std::unexpected(Error{Error::Code::SnapshotsExist,
                                     "Directory still has " + std::to_string(it->second.snapshots.size())
                                         + " snapshot(s)"});
    }
    entries_.erase(it);
    return {};
}

auto SnapshotRegistry::isSnapshottable(NodeId directory) const -> bool {
    return entries_.contains(directory);
}

auto SnapshotRegistry::mutableEntry(NodeId directory) -> Expected<Entry*> {
    auto it = entries_.find(directory);
    if (it == entries_.end()) {
        return std::unexpected(notSnapshottable(directory));
    }
    return &it->second;
}

auto SnapshotRegistry::create(NodeId directory, std::string_view name, std::uint64_t creationTime)
    -> Expected<Snapshot> {
    auto entryExpected = mutableEntry(directory);
    if (!entryExpected)
        return std::unexpected(entryExpected.error());
    auto& entry = **entryExpected;

    auto const duplicate = std::any_of(entry.snapshots.begin(), entry.snapshots.end(),
                                       [&](Snapshot const& snapshot) { return snapshot.name == name; });
    if (duplicate) {
        return std::unexpected(Error{Error::Code::DuplicateName,
                                     "Snapshot \"" + std::string{name} + "\" already exists"});
    }
    if (entry.snapshots.size() >= entry.quota) {
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     "Snapshot quota of " + std::to_string(entry.quota) + " reached"});
    }

    Snapshot snapshot;
    snapshot.name         = std::string{name};
    snapshot.id           = ++lastSequence_;
    snapshot.root         = directory;
    snapshot.creationTime = creationTime;
    entry.snapshots.push_back(snapshot);
    fsi_log("Created snapshot " + snapshot.name + " id=" + std::to_string(snapshot.id), "Snapshot");
    return snapshot;
}

auto SnapshotRegistry::remove(NodeId directory, std::string_view name) -> Expected<Snapshot> {
    auto entryExpected = mutableEntry(directory);
    if (!entryExpected)
        return std::unexpected(entryExpected.error());
    auto& snapshots = (*entryExpected)->snapshots;

    auto it = std::find_if(snapshots.begin(), snapshots.end(),
                           [&](Snapshot const& snapshot) { return snapshot.name == name; });
    if (it == snapshots.end()) {
        return std::unexpected(Error{Error::Code::NotFound,
                                     "Snapshot \"" + std::string{name} + "\" does not exist"});
    }
    auto removed = *it;
    snapshots.erase(it);
    return removed;
}

auto SnapshotRegistry::rename(NodeId directory, std::string_view oldName, std::string_view newName)
    -> Expected<void> {
    auto entryExpected = mutableEntry(directory);
    if (!entryExpected)
        return std::unexpected(entryExpected.error());
    auto& snapshots = (*entryExpected)->snapshots;

    auto target = std::find_if(snapshots.begin(), snapshots.end(),
                               [&](Snapshot const& snapshot) { return snapshot.name == oldName; });
    if (target == snapshots.end()) {
        return std::unexpected(Error{Error::Code::NotFound,
                                     "Snapshot \"" + std::string{oldName} + "\" does not exist"});
    }
    if (oldName == newName) {
        return {};
    }
    auto const clash = std::any_of(snapshots.begin(), snapshots.end(),
                                   [&](Snapshot const& snapshot) { return snapshot.name == newName; });
    if (clash) {
        return std::unexpected(Error{Error::Code::DuplicateName,
                                     "Snapshot \"" + std::string{newName} + "\" already exists"});
    }
    target->name = std::string{newName};
    return {};
}

auto SnapshotRegistry::list(NodeId directory) const -> Expected<std::vector<Snapshot>> {
    auto const* found = entry(directory);
    if (!found) {
        return std::unexpected(notSnapshottable(directory));
    }
    return found->snapshots;
}

auto SnapshotRegistry::find(NodeId directory, std::string_view name) const -> Snapshot const* {
    auto const* found = entry(directory);
    if (!found) {
        return nullptr;
    }
    for (auto const& snapshot : found->snapshots) {
        if (snapshot.name == name) {
            return &snapshot;
        }
    }
    return nullptr;
}

auto SnapshotRegistry::entry(NodeId directory) const -> Entry const* {
    auto it = entries_.find(directory);
    return it == entries_.end() ? nullptr : &it->second;
}

auto SnapshotRegistry::latest(NodeId directory) const -> SnapshotId {
    auto const* found = entry(directory);
    if (!found || found->snapshots.empty()) {
        return NoSnapshot;
    }
    return found->snapshots.back().id;
}

auto SnapshotRegistry::latestBefore(NodeId directory, SnapshotId bound) const -> SnapshotId {
    auto const* found = entry(directory);
    if (!found) {
        return NoSnapshot;
    }
    auto const& snapshots = found->snapshots;
    auto it = std::lower_bound(snapshots.begin(), snapshots.end(), bound,
                               [](Snapshot const& snapshot, SnapshotId value) { return snapshot.id < value; });
    if (it == snapshots.begin()) {
        return NoSnapshot;
    }
    return std::prev(it)->id;
}

auto SnapshotRegistry::directories() const -> std::vector<NodeId> {
    std::vector<NodeId> out;
    out.reserve(entries_.size());
    for (auto const& [id, _] : entries_) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

auto SnapshotRegistry::snapshotCount() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& [_, entry] : entries_) {
        total += entry.snapshots.size();
    }
    return total;
}

auto SnapshotRegistry::restore(Entry entry) -> Expected<void> {
    if (entries_.contains(entry.directory)) {
        return std::unexpected(Error{Error::Code::Corrupt,
                                     "Snapshottable directory " + std::to_string(entry.directory)
                                         + " listed twice"});
    }
    for (std::size_t i = 1; i < entry.snapshots.size(); ++i) {
        if (entry.snapshots[i - 1].id >= entry.snapshots[i].id) {
            return std::unexpected(Error{Error::Code::Corrupt, "Snapshot ids are not increasing"});
        }
    }
    for (auto const& snapshot : entry.snapshots) {
        lastSequence_ = std::max(lastSequence_, snapshot.id);
    }
    auto const directory = entry.directory;
    entries_.emplace(directory, std::move(entry));
    return {};
}

} // namespace FSI
