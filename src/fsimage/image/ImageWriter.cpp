#include "image/ImageWriter.hpp"

#include "image/ImageCodec.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace FSI {

using ImageCodec::appendScalar;
using ImageCodec::appendString;

namespace ImageSections {

auto encodeAttributes(std::vector<std::byte>& out, Attributes const& attributes) -> void {
    appendString(out, attributes.owner);
    appendString(out, attributes.group);
    appendScalar<std::uint16_t>(out, attributes.permission);
    appendScalar<std::uint64_t>(out, attributes.modificationTime);
}

auto encodeFileState(std::vector<std::byte>& out, FileState const& state) -> void {
    appendScalar<std::uint16_t>(out, state.replication);
    appendScalar<std::uint64_t>(out, state.preferredBlockSize);
    appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(state.blocks.size()));
    for (auto const& block : state.blocks) {
        appendScalar<std::uint64_t>(out, block.blockId);
        appendScalar<std::uint64_t>(out, block.numBytes);
        appendScalar<std::uint64_t>(out, block.generationStamp);
    }
}

} // namespace ImageSections

ImageWriter::ImageWriter(NamespaceTree const& tree, std::uint64_t transactionId, ImageSaveOptions options)
    : tree_(tree), transactionId_(options.transactionId.value_or(transactionId)), options_(std::move(options)) {}

auto ImageWriter::encodeCounters(std::vector<std::byte>& out) const -> void {
    auto const counters = tree_.counters();
    appendScalar<std::uint64_t>(out, counters.lastNodeId);
    appendScalar<std::uint64_t>(out, counters.lastBlockId);
    appendScalar<std::uint64_t>(out, counters.generationStamp);
    appendScalar<std::uint64_t>(out, counters.lastSnapshotId);
}

auto ImageWriter::encodeNode(std::vector<std::byte>& out, INode const& node) const -> void {
    appendScalar<std::uint8_t>(out, static_cast<std::uint8_t>(node.kind()));
    appendScalar<std::uint64_t>(out, node.id);
    appendScalar<std::uint64_t>(out, node.parent);
    appendString(out, node.name);
    ImageSections::encodeAttributes(out, node.attributes);
    appendScalar<std::uint64_t>(out, node.createdAfter);

    std::visit(Overloaded{
                   [&](DirectoryPayload const& dir) {
                       appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(dir.children.size()));
                   },
                   [&](FilePayload const& file) {
                       ImageSections::encodeFileState(out, file.state);
                       appendScalar<std::uint8_t>(out, file.underConstruction ? 1 : 0);
                       if (file.underConstruction) {
                           appendString(out, *file.underConstruction);
                       }
                   },
               },
               node.payload);
}

auto ImageWriter::encodeSubtree(std::vector<std::byte>& out, NodeId root) const -> void {
    // Children maps are name-ordered; push in reverse so the stack pops them in order.
    std::vector<NodeId> pending{root};
    while (!pending.empty()) {
        auto const id = pending.back();
        pending.pop_back();
        auto const* node = tree_.node(id);
        encodeNode(out, *node);
        if (!node->isDirectory()) {
            continue;
        }
        auto const& children = node->directory().children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            pending.push_back(it->second);
        }
    }
}

auto ImageWriter::encodeRegistry(std::vector<std::byte>& out) const -> void {
    auto const& registry    = tree_.registry();
    auto const  directories = registry.directories();
    appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(directories.size()));
    for (auto directory : directories) {
        auto const* entry = registry.entry(directory);
        appendScalar<std::uint64_t>(out, entry->directory);
        appendScalar<std::uint32_t>(out, entry->quota);
        appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(entry->snapshots.size()));
        for (auto const& snapshot : entry->snapshots) {
            appendString(out, snapshot.name);
            appendScalar<std::uint64_t>(out, snapshot.id);
            appendScalar<std::uint64_t>(out, snapshot.creationTime);
        }
    }
}

auto ImageWriter::encodeRetained(std::vector<std::byte>& out) const -> void {
    // Roots of retained subtrees: nodes kept only by diff records and not
    // linked into a parent's children map.
    std::vector<NodeId> roots;
    for (auto id : tree_.arena().ids()) {
        if (tree_.isLive(id)) {
            continue;
        }
        auto const* node   = tree_.node(id);
        auto const* parent = tree_.node(node->parent);
        bool        linked = false;
        if (parent && parent->isDirectory()) {
            auto const& children = parent->directory().children;
            auto        it       = children.find(node->name);
            linked               = it != children.end() && it->second == id;
        }
        if (!linked) {
            roots.push_back(id);
        }
    }
    appendScalar<std::uint64_t>(out, static_cast<std::uint64_t>(roots.size()));
    for (auto root : roots) {
        encodeSubtree(out, root);
    }
}

auto ImageWriter::encodeDiffChains(std::vector<std::byte>& out) const -> void {
    std::vector<INode const*> owners;
    for (auto id : tree_.arena().ids()) {
        auto const* node = tree_.node(id);
        if (node->diffCount() > 0) {
            owners.push_back(node);
        }
    }
    appendScalar<std::uint64_t>(out, static_cast<std::uint64_t>(owners.size()));
    for (auto const* owner : owners) {
        appendScalar<std::uint64_t>(out, owner->id);
        appendScalar<std::uint8_t>(out, static_cast<std::uint8_t>(owner->kind()));
        appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(owner->diffCount()));
        std::visit(Overloaded{
                       [&](DirectoryPayload const& dir) {
                           for (auto const& diff : dir.diffs) {
                               appendScalar<std::uint64_t>(out, diff.snapshot);
                               ImageSections::encodeAttributes(out, diff.attributes);
                               appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(diff.children.created.size()));
                               for (auto id : diff.children.created) {
                                   appendScalar<std::uint64_t>(out, id);
                               }
                               appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(diff.children.deleted.size()));
                               for (auto id : diff.children.deleted) {
                                   appendScalar<std::uint64_t>(out, id);
                               }
                               appendScalar<std::uint32_t>(out, static_cast<std::uint32_t>(diff.children.renamed.size()));
                               for (auto const& record : diff.children.renamed) {
                                   appendString(out, record.oldName);
                                   appendScalar<std::uint64_t>(out, record.child);
                               }
                           }
                       },
                       [&](FilePayload const& file) {
                           for (auto const& diff : file.diffs) {
                               appendScalar<std::uint64_t>(out, diff.snapshot);
                               ImageSections::encodeAttributes(out, diff.attributes);
                               ImageSections::encodeFileState(out, diff.state);
                           }
                       },
                   },
                   owner->payload);
    }
}

auto ImageWriter::encodePayload(CancellationToken const& token) const -> std::optional<std::vector<std::byte>> {
    std::vector<std::byte> out;
    out.reserve(tree_.nodeCount() * 64);

    encodeCounters(out);

    auto const& root = tree_.root();
    encodeNode(out, root);
    auto const& children = root.directory().children;
    std::size_t index    = 0;
    for (auto const& [name, child] : children) {
        if (token.isCancelled()) {
            fsi_log("Save cancelled before subtree /" + name, "ImageWriter");
            return std::nullopt;
        }
        if (options_.progress) {
            options_.progress(name, index, children.size());
        }
        encodeSubtree(out, child);
        ++index;
    }
    if (token.isCancelled()) {
        return std::nullopt;
    }

    encodeRegistry(out);
    encodeRetained(out);
    encodeDiffChains(out);
    return out;
}

auto ImageWriter::save(ByteSink& sink, CancellationToken const& token) -> Expected<SaveOutcome> {
    auto payload = encodePayload(token);
    if (!payload) {
        sink.discard();
        return SaveOutcome{SaveCancelled{}};
    }

    std::vector<std::byte> header;
    header.reserve(ImageHeaderSize);
    appendScalar<std::uint32_t>(header, ImageMagic);
    appendScalar<std::uint32_t>(header, ImageVersion);
    appendScalar<std::uint64_t>(header, transactionId_);
    appendScalar<std::uint32_t>(header, options_.flags);
    appendScalar<std::uint64_t>(header, static_cast<std::uint64_t>(payload->size()));

    auto const checksum = ImageCodec::checksum(*payload);
    std::vector<std::byte> trailer;
    appendScalar<std::uint64_t>(trailer, checksum);

    auto fail = [&](Error error) -> Expected<SaveOutcome> {
        fsi_log("Image save failed: " + describeError(error), "ImageWriter", "ERROR");
        sink.discard();
        return std::unexpected(std::move(error));
    };

    if (auto written = sink.write(header); !written)
        return fail(written.error());
    if (auto written = sink.write(*payload); !written)
        return fail(written.error());
    if (auto written = sink.write(trailer); !written)
        return fail(written.error());
    if (auto flushed = sink.flush(); !flushed)
        return fail(flushed.error());
    if (auto closed = sink.close(); !closed)
        return fail(closed.error());

    ImageSaved saved;
    saved.bytesWritten = header.size() + payload->size() + trailer.size();
    saved.checksum     = checksum;
    fsi_log("Saved image txid=" + std::to_string(transactionId_) + " bytes=" + std::to_string(saved.bytesWritten),
            "ImageWriter");
    return SaveOutcome{saved};
}

} // namespace FSI
