#pragma once

#include "core/Error.hpp"
#include "image/ImageFormat.hpp"
#include "namespace/Namesystem.hpp"
#include "namespace/NamespaceTree.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace FSI {

struct ImageJsonOptions {
    bool includeSnapshotViews = true;
    bool includeDiffs         = true;
    bool includeBlocks        = true;
    int  indent               = 2; // negative for compact output
};

/**
 * JSON rendering of a namespace or an image file for inspection tooling:
 * header, counters, live tree, snapshot registry (optionally with each
 * snapshot's reconstructed view) and raw diff chains with node ids.
 */
class ImageJsonExporter {
public:
    static auto Export(std::span<const std::byte> image, ImageJsonOptions const& options = ImageJsonOptions{})
        -> Expected<std::string>;
    static auto Export(Namesystem const& namesystem, ImageJsonOptions const& options = ImageJsonOptions{})
        -> Expected<std::string>;
    static auto Export(NamespaceTree const& tree, std::optional<ImageHeader> const& header,
                       std::optional<std::uint64_t> checksum, ImageJsonOptions const& options = ImageJsonOptions{})
        -> Expected<std::string>;
};

} // namespace FSI
