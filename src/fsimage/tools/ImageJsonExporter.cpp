#include "tools/ImageJsonExporter.hpp"

#include "image/ImageLoader.hpp"
#include "snapshot/SnapshotDiff.hpp"

#include <cstdio>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace FSI {

namespace {

using Json = nlohmann::json;

auto hex64(std::uint64_t value) -> std::string {
    char buffer[19];
    std::snprintf(buffer, sizeof(buffer), "0x%016llx", static_cast<unsigned long long>(value));
    return buffer;
}

class TreeJsonBuilder {
public:
    TreeJsonBuilder(NamespaceTree const& tree, ImageJsonOptions const& options)
        : tree_(tree), options_(options) {
        for (auto directory : tree_.registry().directories()) {
            for (auto const& snapshot : tree_.registry().entry(directory)->snapshots) {
                snapshotNames_.emplace(snapshot.id, snapshot.name);
            }
        }
    }

    auto node(INode const& node, std::string_view name, SnapshotId snapshot) const -> Json {
        auto const& attributes = SnapshotDiff::attributesAt(node, snapshot);
        Json        out;
        out["name"]       = name;
        out["id"]         = node.id;
        out["kind"]       = nodeKindName(node.kind());
        out["owner"]      = attributes.owner;
        out["group"]      = attributes.group;
        out["permission"] = permissionString(attributes.permission);
        out["mtime"]      = attributes.modificationTime;

        if (node.isFile()) {
            auto const& state  = SnapshotDiff::fileStateAt(node, snapshot);
            out["length"]      = state.length();
            out["replication"] = state.replication;
            out["block_size"]  = state.preferredBlockSize;
            if (options_.includeBlocks) {
                out["blocks"] = blocks(state);
            } else {
                out["block_count"] = state.blocks.size();
            }
            if (snapshot == CurrentState && node.file().underConstruction) {
                out["under_construction"] = *node.file().underConstruction;
            }
            return out;
        }

        Json children = Json::array();
        for (auto const& child : tree_.childrenAt(node, snapshot)) {
            children.push_back(this->node(*tree_.node(child.id), child.name, snapshot));
        }
        out["children"] = std::move(children);
        return out;
    }

    auto registry() const -> Json {
        Json out = Json::array();
        for (auto directory : tree_.registry().directories()) {
            auto const* entry = tree_.registry().entry(directory);
            Json        dir;
            dir["path"]      = tree_.pathOf(directory);
            dir["directory"] = directory;
            dir["quota"]     = entry->quota;
            Json snapshots   = Json::array();
            for (auto const& snapshot : entry->snapshots) {
                Json item;
                item["name"]          = snapshot.name;
                item["id"]            = snapshot.id;
                item["creation_time"] = snapshot.creationTime;
                if (options_.includeSnapshotViews) {
                    item["view"] = node(*tree_.node(directory), snapshot.name, snapshot.id);
                }
                snapshots.push_back(std::move(item));
            }
            dir["snapshots"] = std::move(snapshots);
            out.push_back(std::move(dir));
        }
        return out;
    }

    auto diffs() const -> Json {
        Json out = Json::array();
        for (auto id : tree_.arena().ids()) {
            auto const* owner = tree_.node(id);
            if (owner->diffCount() == 0) {
                continue;
            }
            Json chain;
            chain["owner"] = id;
            chain["kind"]  = nodeKindName(owner->kind());
            chain["live"]  = tree_.isLive(id);
            chain["path"]  = tree_.pathOf(id);
            Json records   = Json::array();
            std::visit(Overloaded{
                           [&](DirectoryPayload const& dir) {
                               for (auto const& diff : dir.diffs) {
                                   Json record;
                                   record["snapshot"] = snapshotLabel(diff.snapshot);
                                   record["created"]  = diff.children.created;
                                   record["deleted"]  = diff.children.deleted;
                                   Json renamed       = Json::array();
                                   for (auto const& rename : diff.children.renamed) {
                                       renamed.push_back(Json{{"old_name", rename.oldName}, {"child", rename.child}});
                                   }
                                   record["renamed"] = std::move(renamed);
                                   records.push_back(std::move(record));
                               }
                           },
                           [&](FilePayload const& file) {
                               for (auto const& diff : file.diffs) {
                                   Json record;
                                   record["snapshot"]    = snapshotLabel(diff.snapshot);
                                   record["length"]      = diff.state.length();
                                   record["replication"] = diff.state.replication;
                                   if (options_.includeBlocks) {
                                       record["blocks"] = blocks(diff.state);
                                   }
                                   records.push_back(std::move(record));
                               }
                           },
                       },
                       owner->payload);
            chain["records"] = std::move(records);
            out.push_back(std::move(chain));
        }
        return out;
    }

private:
    static auto blocks(FileState const& state) -> Json {
        Json out = Json::array();
        for (auto const& block : state.blocks) {
            out.push_back(Json{{"id", block.blockId}, {"bytes", block.numBytes}, {"generation_stamp", block.generationStamp}});
        }
        return out;
    }

    auto snapshotLabel(SnapshotId id) const -> Json {
        auto it = snapshotNames_.find(id);
        if (it == snapshotNames_.end()) {
            return Json(id);
        }
        return Json{{"id", id}, {"name", it->second}};
    }

    NamespaceTree const&                        tree_;
    ImageJsonOptions const&                     options_;
    std::unordered_map<SnapshotId, std::string> snapshotNames_;
};

} // namespace

auto ImageJsonExporter::Export(NamespaceTree const& tree, std::optional<ImageHeader> const& header,
                               std::optional<std::uint64_t> checksum, ImageJsonOptions const& options)
    -> Expected<std::string> {
    TreeJsonBuilder builder(tree, options);
    Json            root;

    if (header) {
        Json headerJson;
        headerJson["magic"]          = hex64(header->magic);
        headerJson["version"]        = header->version;
        headerJson["transaction_id"] = header->transactionId;
        headerJson["flags"]          = header->flags;
        headerJson["payload_length"] = header->payloadLength;
        if (checksum) {
            headerJson["checksum"] = hex64(*checksum);
        }
        root["header"] = std::move(headerJson);
    }

    auto const counters = tree.counters();
    root["counters"]    = Json{{"last_node_id", counters.lastNodeId},
                               {"last_block_id", counters.lastBlockId},
                               {"generation_stamp", counters.generationStamp},
                               {"last_snapshot_id", counters.lastSnapshotId}};
    root["stats"]       = Json{{"nodes", tree.nodeCount()},
                               {"diff_records", tree.diffRecordCount()},
                               {"snapshots", tree.registry().snapshotCount()}};
    root["tree"]        = builder.node(tree.root(), "/", CurrentState);
    root["snapshottable"] = builder.registry();
    if (options.includeDiffs) {
        root["diffs"] = builder.diffs();
    }

    try {
        return root.dump(options.indent);
    } catch (nlohmann::json::exception const& ex) {
        return std::unexpected(Error{Error::Code::MalformedInput, ex.what()});
    }
}

auto ImageJsonExporter::Export(std::span<const std::byte> image, ImageJsonOptions const& options)
    -> Expected<std::string> {
    ImageLoader loader;
    auto        loaded = loader.decode(image);
    if (!loaded)
        return std::unexpected(loaded.error());
    return Export(*loaded->tree, loaded->header, loaded->checksum, options);
}

auto ImageJsonExporter::Export(Namesystem const& namesystem, ImageJsonOptions const& options)
    -> Expected<std::string> {
    return namesystem.inspect([&](NamespaceTree const& tree) {
        return Export(tree, std::nullopt, std::nullopt, options);
    });
}

} // namespace FSI
