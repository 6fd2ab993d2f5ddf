#pragma once

#include "core/Error.hpp"
#include "image/ByteStreams.hpp"
#include "image/CancellationToken.hpp"
#include "image/ImageFormat.hpp"
#include "namespace/NamespaceTree.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace FSI {

/**
 * Serializes a namespace into the image format:
 *
 *   header   magic, version, transaction id, flags, payload length
 *   payload  counters, live tree (pre-order, children by name),
 *            snapshot registry, retained subtrees, diff chains
 *   trailer  FNV-1a 64 of the payload
 *
 * The caller holds the namespace read lock for the whole call. The payload is
 * assembled in memory first so a cancelled save never touches the sink.
 */
class ImageWriter {
public:
    ImageWriter(NamespaceTree const& tree, std::uint64_t transactionId, ImageSaveOptions options = {});

    auto save(ByteSink& sink, CancellationToken const& token) -> Expected<SaveOutcome>;

    // The payload section alone, or nullopt when cancelled.
    [[nodiscard]] auto encodePayload(CancellationToken const& token) const -> std::optional<std::vector<std::byte>>;

private:
    auto encodeCounters(std::vector<std::byte>& out) const -> void;
    auto encodeNode(std::vector<std::byte>& out, INode const& node) const -> void;
    auto encodeSubtree(std::vector<std::byte>& out, NodeId root) const -> void;
    auto encodeRegistry(std::vector<std::byte>& out) const -> void;
    auto encodeRetained(std::vector<std::byte>& out) const -> void;
    auto encodeDiffChains(std::vector<std::byte>& out) const -> void;

    NamespaceTree const& tree_;
    std::uint64_t        transactionId_;
    ImageSaveOptions     options_;
};

// Image section helpers shared with the loader and the JSON exporter.
namespace ImageSections {
auto encodeAttributes(std::vector<std::byte>& out, Attributes const& attributes) -> void;
auto encodeFileState(std::vector<std::byte>& out, FileState const& state) -> void;
} // namespace ImageSections

} // namespace FSI
