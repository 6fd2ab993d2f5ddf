#pragma once

#include "core/Error.hpp"
#include "image/ByteStreams.hpp"
#include "image/ImageFormat.hpp"
#include "namespace/NamespaceTree.hpp"
#include "namespace/NamesystemOptions.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace FSI {

struct LoadedImage {
    ImageHeader                    header;
    std::uint64_t                  checksum = 0;
    std::unique_ptr<NamespaceTree> tree;
};

/**
 * Rebuilds a namespace from an image into a brand new NamespaceTree.
 *
 * The stream is fully read and the checksum verified before any node is
 * decoded, so a damaged image never produces a partial tree. Swapping the
 * result into a live namespace is the caller's job (Namesystem::loadImage).
 */
class ImageLoader {
public:
    explicit ImageLoader(NamesystemOptions options = {});

    auto load(ByteSource& source) -> Expected<LoadedImage>;

    // Decodes a complete in-memory image (header, payload, trailer).
    auto decode(std::span<const std::byte> image) -> Expected<LoadedImage>;

    [[nodiscard]] static auto decodeHeader(std::span<const std::byte> bytes) -> Expected<ImageHeader>;

private:
    struct DecodedNode {
        std::unique_ptr<INode> node;
        std::uint32_t          childCount = 0;
    };

    auto decodePayload(std::span<const std::byte> payload) -> Expected<std::unique_ptr<NamespaceTree>>;
    static auto decodeNode(std::span<const std::byte>& buffer) -> Expected<DecodedNode>;
    static auto decodeSubtree(std::span<const std::byte>& buffer, NamespaceTree& tree) -> Expected<INode*>;
    static auto decodeRegistry(std::span<const std::byte>& buffer, NamespaceTree& tree) -> Expected<void>;
    static auto decodeDiffChains(std::span<const std::byte>& buffer, NamespaceTree& tree) -> Expected<void>;

    NamesystemOptions options_;
};

// Reads exactly `count` bytes, failing with Truncated when the stream ends first.
auto readExactly(ByteSource& source, std::size_t count) -> Expected<std::vector<std::byte>>;

namespace ImageSections {
auto decodeAttributes(std::span<const std::byte>& buffer) -> Expected<Attributes>;
auto decodeFileState(std::span<const std::byte>& buffer) -> Expected<FileState>;
} // namespace ImageSections

} // namespace FSI
