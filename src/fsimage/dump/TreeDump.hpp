#pragma once

#include "core/Error.hpp"
#include "namespace/NamespaceTree.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace FSI::TreeDump {

/*
 * Deterministic text rendering of a namespace, used as the round-trip oracle.
 *
 * One line per node, children sorted by name and indented two spaces per
 * level. Each snapshottable directory is followed by a `.snapshot` block that
 * renders every snapshot's reconstructed view in creation order. Directories
 * and files with history get one `~` line per diff record, keyed by snapshot
 * name. Node identifiers and snapshot sequence numbers never appear.
 */
[[nodiscard]] auto dumpNamespace(NamespaceTree const& tree) -> std::string;

// The view of one snapshot alone, rooted at the snapshot name.
[[nodiscard]] auto dumpSnapshot(NamespaceTree const& tree, NodeId directory, std::string_view name)
    -> Expected<std::string>;

struct DumpDifference {
    std::size_t line = 0; // 1-based
    std::string expected;
    std::string actual;
};

// nullopt when the dumps are identical.
[[nodiscard]] auto compareDumps(std::string_view expected, std::string_view actual) -> std::optional<DumpDifference>;

[[nodiscard]] auto describeDifference(DumpDifference const& difference) -> std::string;

} // namespace FSI::TreeDump
