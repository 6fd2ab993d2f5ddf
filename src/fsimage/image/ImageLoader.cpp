#include "image/ImageLoader.hpp"

#include "image/ImageCodec.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace FSI {

using ImageCodec::readScalar;
using ImageCodec::readString;

namespace {

auto corrupt(std::string message) -> Error {
    return Error{Error::Code::Corrupt, std::move(message)};
}

auto readIds(std::span<const std::byte>& buffer, std::vector<NodeId>& out) -> Expected<void> {
    auto count = readScalar<std::uint32_t>(buffer);
    if (!count)
        return std::unexpected(count.error());
    if (*count > buffer.size() / sizeof(std::uint64_t)) {
        return std::unexpected(corrupt("Id list of " + std::to_string(*count) + " entries overruns the payload"));
    }
    out.reserve(*count);
    for (std::uint32_t i = 0; i < *count; ++i) {
        auto id = readScalar<std::uint64_t>(buffer);
        if (!id)
            return std::unexpected(id.error());
        out.push_back(*id);
    }
    return {};
}

} // namespace

namespace ImageSections {

auto decodeAttributes(std::span<const std::byte>& buffer) -> Expected<Attributes> {
    Attributes attributes;
    auto       owner = readString(buffer);
    if (!owner)
        return std::unexpected(owner.error());
    auto group = readString(buffer);
    if (!group)
        return std::unexpected(group.error());
    auto permission = readScalar<std::uint16_t>(buffer);
    if (!permission)
        return std::unexpected(permission.error());
    auto mtime = readScalar<std::uint64_t>(buffer);
    if (!mtime)
        return std::unexpected(mtime.error());
    attributes.owner            = std::move(*owner);
    attributes.group            = std::move(*group);
    attributes.permission       = *permission;
    attributes.modificationTime = *mtime;
    return attributes;
}

auto decodeFileState(std::span<const std::byte>& buffer) -> Expected<FileState> {
    FileState state;
    auto      replication = readScalar<std::uint16_t>(buffer);
    if (!replication)
        return std::unexpected(replication.error());
    auto blockSize = readScalar<std::uint64_t>(buffer);
    if (!blockSize)
        return std::unexpected(blockSize.error());
    auto blockCount = readScalar<std::uint32_t>(buffer);
    if (!blockCount)
        return std::unexpected(blockCount.error());
    if (*blockSize == 0) {
        return std::unexpected(corrupt("File state has a zero preferred block size"));
    }
    if (*blockCount > buffer.size() / (3 * sizeof(std::uint64_t))) {
        return std::unexpected(corrupt("Block list of " + std::to_string(*blockCount) + " entries overruns the payload"));
    }
    state.blocks.reserve(*blockCount);
    state.replication        = *replication;
    state.preferredBlockSize = *blockSize;
    for (std::uint32_t i = 0; i < *blockCount; ++i) {
        auto blockId = readScalar<std::uint64_t>(buffer);
        if (!blockId)
            return std::unexpected(blockId.error());
        auto numBytes = readScalar<std::uint64_t>(buffer);
        if (!numBytes)
            return std::unexpected(numBytes.error());
        auto stamp = readScalar<std::uint64_t>(buffer);
        if (!stamp)
            return std::unexpected(stamp.error());
        state.blocks.push_back(BlockInfo{.blockId = *blockId, .numBytes = *numBytes, .generationStamp = *stamp});
    }
    return state;
}

} // namespace ImageSections

auto readExactly(ByteSource& source, std::size_t count) -> Expected<std::vector<std::byte>> {
    // Grows with what the source actually yields so a bogus count cannot
    // force a large allocation.
    std::vector<std::byte> out;
    while (out.size() < count) {
        auto chunk = source.read(std::min(count - out.size(), ImageReadChunkSize));
        if (!chunk)
            return std::unexpected(chunk.error());
        if (chunk->empty()) {
            return std::unexpected(Error{Error::Code::Truncated,
                                         "Image ended after " + std::to_string(out.size()) + " of "
                                             + std::to_string(count) + " bytes"});
        }
        out.insert(out.end(), chunk->begin(), chunk->end());
    }
    return out;
}

ImageLoader::ImageLoader(NamesystemOptions options)
    : options_(std::move(options)) {}

auto ImageLoader::decodeHeader(std::span<const std::byte> bytes) -> Expected<ImageHeader> {
    if (bytes.size() < ImageHeaderSize) {
        return std::unexpected(Error{Error::Code::Truncated, "Image header truncated"});
    }
    ImageHeader header;
    header.magic = *readScalar<std::uint32_t>(bytes);
    if (header.magic != ImageMagic) {
        return std::unexpected(corrupt("Not an fsimage file (bad magic)"));
    }
    header.version = *readScalar<std::uint32_t>(bytes);
    if (header.version != ImageVersion) {
        return std::unexpected(Error{Error::Code::FormatVersionMismatch,
                                     "Unsupported image version " + std::to_string(header.version) + ", expected "
                                         + std::to_string(ImageVersion)});
    }
    header.transactionId = *readScalar<std::uint64_t>(bytes);
    header.flags         = *readScalar<std::uint32_t>(bytes);
    header.payloadLength = *readScalar<std::uint64_t>(bytes);
    if (header.payloadLength > ImageMaxPayloadLength) {
        return std::unexpected(corrupt("Payload length " + std::to_string(header.payloadLength) + " is out of range"));
    }
    return header;
}

auto ImageLoader::load(ByteSource& source) -> Expected<LoadedImage> {
    auto headerBytes = readExactly(source, ImageHeaderSize);
    if (!headerBytes)
        return std::unexpected(headerBytes.error());
    auto header = decodeHeader(*headerBytes);
    if (!header)
        return std::unexpected(header.error());

    auto rest = readExactly(source, static_cast<std::size_t>(header->payloadLength) + ImageTrailerSize);
    if (!rest)
        return std::unexpected(rest.error());

    std::vector<std::byte> image = std::move(*headerBytes);
    image.insert(image.end(), rest->begin(), rest->end());
    return decode(image);
}

auto ImageLoader::decode(std::span<const std::byte> image) -> Expected<LoadedImage> {
    auto header = decodeHeader(image);
    if (!header)
        return std::unexpected(header.error());

    // decodeHeader bounds payloadLength, so this cannot wrap.
    auto const expected = ImageHeaderSize + static_cast<std::size_t>(header->payloadLength) + ImageTrailerSize;
    if (image.size() < expected) {
        return std::unexpected(Error{Error::Code::Truncated,
                                     "Image holds " + std::to_string(image.size()) + " of " + std::to_string(expected)
                                         + " bytes"});
    }
    if (image.size() > expected) {
        return std::unexpected(corrupt("Trailing bytes after image trailer"));
    }

    auto const payload = image.subspan(ImageHeaderSize, static_cast<std::size_t>(header->payloadLength));
    auto       trailer = image.subspan(ImageHeaderSize + payload.size());
    auto const stored  = readScalar<std::uint64_t>(trailer);
    if (!stored)
        return std::unexpected(stored.error());
    auto const actual = ImageCodec::checksum(payload);
    if (*stored != actual) {
        fsi_log("Image checksum mismatch", "ImageLoader", "ERROR");
        return std::unexpected(corrupt("Checksum mismatch"));
    }

    auto tree = decodePayload(payload);
    if (!tree)
        return std::unexpected(tree.error());

    fsi_log("Loaded image txid=" + std::to_string(header->transactionId) + " nodes="
                + std::to_string((*tree)->nodeCount()),
            "ImageLoader");
    return LoadedImage{.header = *header, .checksum = actual, .tree = std::move(*tree)};
}

auto ImageLoader::decodeNode(std::span<const std::byte>& buffer) -> Expected<DecodedNode> {
    auto kind = readScalar<std::uint8_t>(buffer);
    if (!kind)
        return std::unexpected(kind.error());
    if (*kind != static_cast<std::uint8_t>(NodeKind::Directory) && *kind != static_cast<std::uint8_t>(NodeKind::File)) {
        return std::unexpected(corrupt("Unknown node kind " + std::to_string(*kind)));
    }
    auto id = readScalar<std::uint64_t>(buffer);
    if (!id)
        return std::unexpected(id.error());
    auto parent = readScalar<std::uint64_t>(buffer);
    if (!parent)
        return std::unexpected(parent.error());
    auto name = readString(buffer);
    if (!name)
        return std::unexpected(name.error());
    auto attributes = ImageSections::decodeAttributes(buffer);
    if (!attributes)
        return std::unexpected(attributes.error());
    auto createdAfter = readScalar<std::uint64_t>(buffer);
    if (!createdAfter)
        return std::unexpected(createdAfter.error());

    DecodedNode decoded;
    decoded.node               = std::make_unique<INode>();
    decoded.node->id           = *id;
    decoded.node->parent       = *parent;
    decoded.node->name         = std::move(*name);
    decoded.node->attributes   = std::move(*attributes);
    decoded.node->createdAfter = *createdAfter;

    if (*kind == static_cast<std::uint8_t>(NodeKind::Directory)) {
        auto childCount = readScalar<std::uint32_t>(buffer);
        if (!childCount)
            return std::unexpected(childCount.error());
        decoded.childCount = *childCount;
        return decoded;
    }

    FilePayload file;
    auto        state = ImageSections::decodeFileState(buffer);
    if (!state)
        return std::unexpected(state.error());
    file.state = std::move(*state);
    auto underConstruction = readScalar<std::uint8_t>(buffer);
    if (!underConstruction)
        return std::unexpected(underConstruction.error());
    if (*underConstruction != 0) {
        auto client = readString(buffer);
        if (!client)
            return std::unexpected(client.error());
        file.underConstruction = std::move(*client);
    }
    decoded.node->payload = std::move(file);
    return decoded;
}

auto ImageLoader::decodeSubtree(std::span<const std::byte>& buffer, NamespaceTree& tree) -> Expected<INode*> {
    struct Frame {
        INode*        directory = nullptr;
        std::uint32_t remaining = 0;
    };

    auto adopt = [&](DecodedNode&& decoded) -> Expected<INode*> {
        auto const id   = decoded.node->id;
        auto*      node = tree.arena_.adopt(std::move(decoded.node));
        if (!node) {
            return std::unexpected(corrupt("Duplicate or invalid node id " + std::to_string(id)));
        }
        return node;
    };

    auto first = decodeNode(buffer);
    if (!first)
        return std::unexpected(first.error());
    auto const firstChildren = first->childCount;
    auto       subtreeRoot   = adopt(std::move(*first));
    if (!subtreeRoot)
        return std::unexpected(subtreeRoot.error());

    std::vector<Frame> stack;
    if (firstChildren > 0) {
        stack.push_back(Frame{*subtreeRoot, firstChildren});
    }
    while (!stack.empty()) {
        if (stack.back().remaining == 0) {
            stack.pop_back();
            continue;
        }
        --stack.back().remaining;
        auto* directory = stack.back().directory;

        auto decoded = decodeNode(buffer);
        if (!decoded)
            return std::unexpected(decoded.error());
        if (decoded->node->parent != directory->id) {
            return std::unexpected(corrupt("Node " + std::to_string(decoded->node->id) + " is stored under the wrong parent"));
        }
        auto const childCount = decoded->childCount;
        auto const name       = decoded->node->name;
        auto       child      = adopt(std::move(*decoded));
        if (!child)
            return std::unexpected(child.error());
        if (!directory->directory().children.emplace(name, (*child)->id).second) {
            return std::unexpected(corrupt("Duplicate child name \"" + name + "\""));
        }
        if (childCount > 0) {
            stack.push_back(Frame{*child, childCount});
        }
    }
    return *subtreeRoot;
}

auto ImageLoader::decodeRegistry(std::span<const std::byte>& buffer, NamespaceTree& tree) -> Expected<void> {
    auto count = readScalar<std::uint32_t>(buffer);
    if (!count)
        return std::unexpected(count.error());
    for (std::uint32_t i = 0; i < *count; ++i) {
        SnapshotRegistry::Entry entry;
        auto                    directory = readScalar<std::uint64_t>(buffer);
        if (!directory)
            return std::unexpected(directory.error());
        auto quota = readScalar<std::uint32_t>(buffer);
        if (!quota)
            return std::unexpected(quota.error());
        auto snapshots = readScalar<std::uint32_t>(buffer);
        if (!snapshots)
            return std::unexpected(snapshots.error());
        entry.directory = *directory;
        entry.quota     = *quota;
        for (std::uint32_t s = 0; s < *snapshots; ++s) {
            auto name = readString(buffer);
            if (!name)
                return std::unexpected(name.error());
            auto id = readScalar<std::uint64_t>(buffer);
            if (!id)
                return std::unexpected(id.error());
            auto created = readScalar<std::uint64_t>(buffer);
            if (!created)
                return std::unexpected(created.error());
            entry.snapshots.push_back(
                Snapshot{.name = std::move(*name), .id = *id, .root = *directory, .creationTime = *created});
        }
        if (auto restored = tree.registry_.restore(std::move(entry)); !restored)
            return restored;
    }
    return {};
}

auto ImageLoader::decodeDiffChains(std::span<const std::byte>& buffer, NamespaceTree& tree) -> Expected<void> {
    auto owners = readScalar<std::uint64_t>(buffer);
    if (!owners)
        return std::unexpected(owners.error());
    for (std::uint64_t i = 0; i < *owners; ++i) {
        auto ownerId = readScalar<std::uint64_t>(buffer);
        if (!ownerId)
            return std::unexpected(ownerId.error());
        auto kind = readScalar<std::uint8_t>(buffer);
        if (!kind)
            return std::unexpected(kind.error());
        auto diffCount = readScalar<std::uint32_t>(buffer);
        if (!diffCount)
            return std::unexpected(diffCount.error());

        auto* owner = tree.arena_.find(*ownerId);
        if (!owner || static_cast<std::uint8_t>(owner->kind()) != *kind) {
            return std::unexpected(corrupt("Diff chain for unknown node " + std::to_string(*ownerId)));
        }
        if (owner->diffCount() != 0) {
            return std::unexpected(corrupt("Node " + std::to_string(*ownerId) + " has two diff chains"));
        }

        for (std::uint32_t d = 0; d < *diffCount; ++d) {
            auto snapshot = readScalar<std::uint64_t>(buffer);
            if (!snapshot)
                return std::unexpected(snapshot.error());
            auto attributes = ImageSections::decodeAttributes(buffer);
            if (!attributes)
                return std::unexpected(attributes.error());

            if (owner->isDirectory()) {
                DirectoryDiff diff;
                diff.snapshot   = *snapshot;
                diff.attributes = std::move(*attributes);
                if (auto ids = readIds(buffer, diff.children.created); !ids)
                    return ids;
                if (auto ids = readIds(buffer, diff.children.deleted); !ids)
                    return ids;
                auto renamed = readScalar<std::uint32_t>(buffer);
                if (!renamed)
                    return std::unexpected(renamed.error());
                for (std::uint32_t r = 0; r < *renamed; ++r) {
                    auto oldName = readString(buffer);
                    if (!oldName)
                        return std::unexpected(oldName.error());
                    auto child = readScalar<std::uint64_t>(buffer);
                    if (!child)
                        return std::unexpected(child.error());
                    diff.children.renamed.push_back(RenameRecord{std::move(*oldName), *child});
                }
                owner->directory().diffs.push_back(std::move(diff));
            } else {
                auto state = ImageSections::decodeFileState(buffer);
                if (!state)
                    return std::unexpected(state.error());
                owner->file().diffs.push_back(
                    FileDiff{.snapshot = *snapshot, .attributes = std::move(*attributes), .state = std::move(*state)});
            }
        }
    }
    return {};
}

auto ImageLoader::decodePayload(std::span<const std::byte> payload) -> Expected<std::unique_ptr<NamespaceTree>> {
    auto tree = NamespaceTree::makeForLoad(options_);

    NamespaceCounters counters;
    for (auto* field : {&counters.lastNodeId, &counters.lastBlockId, &counters.generationStamp, &counters.lastSnapshotId}) {
        auto value = readScalar<std::uint64_t>(payload);
        if (!value)
            return std::unexpected(value.error());
        *field = *value;
    }

    auto root = decodeSubtree(payload, *tree);
    if (!root)
        return std::unexpected(root.error());
    if ((*root)->id != RootNodeId || (*root)->parent != InvalidNodeId || !(*root)->isDirectory()) {
        return std::unexpected(corrupt("Tree section does not start with the root directory"));
    }

    if (auto registry = decodeRegistry(payload, *tree); !registry)
        return std::unexpected(registry.error());

    auto retained = readScalar<std::uint64_t>(payload);
    if (!retained)
        return std::unexpected(retained.error());
    for (std::uint64_t i = 0; i < *retained; ++i) {
        auto subtree = decodeSubtree(payload, *tree);
        if (!subtree)
            return std::unexpected(subtree.error());
    }

    if (auto diffs = decodeDiffChains(payload, *tree); !diffs)
        return std::unexpected(diffs.error());
    if (!payload.empty()) {
        return std::unexpected(corrupt("Unexpected bytes after diff section"));
    }

    if (counters.lastNodeId < tree->arena_.lastAllocatedId()) {
        return std::unexpected(corrupt("Node id counter is behind stored nodes"));
    }
    if (counters.lastSnapshotId < tree->registry_.lastSequence()) {
        return std::unexpected(corrupt("Snapshot counter is behind stored snapshots"));
    }
    tree->arena_.setLastAllocatedId(counters.lastNodeId);
    tree->registry_.setLastSequence(counters.lastSnapshotId);
    tree->lastBlockId_     = counters.lastBlockId;
    tree->generationStamp_ = counters.generationStamp;

    if (auto finished = tree->finishLoad(); !finished)
        return std::unexpected(finished.error());
    return tree;
}

} // namespace FSI
