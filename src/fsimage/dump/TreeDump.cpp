#include "dump/TreeDump.hpp"

#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace FSI::TreeDump {

namespace {

constexpr std::string_view EndOfDump = "<end of dump>";

class Renderer {
public:
    explicit Renderer(NamespaceTree const& tree)
        : tree_(tree) {
        for (auto directory : tree_.registry().directories()) {
            for (auto const& snapshot : tree_.registry().entry(directory)->snapshots) {
                snapshotNames_.emplace(snapshot.id, snapshot.name);
            }
        }
    }

    auto renderLive(INode const& node, std::string_view name, std::size_t depth) -> void {
        renderLine(node, name, CurrentState, depth);
        out_ << '\n';
        renderDiffs(node, depth + 1);
        if (!node.isDirectory()) {
            return;
        }
        for (auto const& [childName, childId] : node.directory().children) {
            renderLive(*tree_.node(childId), childName, depth + 1);
        }
        if (auto const* entry = tree_.registry().entry(node.id)) {
            indent(depth + 1);
            out_ << SnapshotDirectoryName << " quota=" << entry->quota << '\n';
            for (auto const& snapshot : entry->snapshots) {
                renderSnapshotRoot(node, snapshot, depth + 2);
            }
        }
    }

    auto renderSnapshotRoot(INode const& directory, Snapshot const& snapshot, std::size_t depth) -> void {
        renderLine(directory, snapshot.name, snapshot.id, depth);
        out_ << " ctime=" << snapshot.creationTime << '\n';
        renderViewChildren(directory, snapshot.id, depth + 1);
    }

    auto str() const -> std::string { return out_.str(); }

private:
    auto indent(std::size_t depth) -> void {
        for (std::size_t i = 0; i < depth; ++i) {
            out_ << "  ";
        }
    }

    auto renderLine(INode const& node, std::string_view name, SnapshotId snapshot, std::size_t depth) -> void {
        auto const& attributes = SnapshotDiff::attributesAt(node, snapshot);
        indent(depth);
        out_ << name << ' ' << nodeKindName(node.kind()) << ' ' << attributes.owner << ':' << attributes.group << ' '
             << permissionString(attributes.permission) << " mtime=" << attributes.modificationTime;
        if (node.isFile()) {
            auto const& state = SnapshotDiff::fileStateAt(node, snapshot);
            out_ << " len=" << state.length() << " repl=" << state.replication << " blocks=" << state.blocks.size();
            if (snapshot == CurrentState && node.file().underConstruction) {
                out_ << " uc=" << *node.file().underConstruction;
            }
        }
    }

    auto renderViewChildren(INode const& directory, SnapshotId snapshot, std::size_t depth) -> void {
        for (auto const& child : tree_.childrenAt(directory, snapshot)) {
            auto const& node = *tree_.node(child.id);
            renderLine(node, child.name, snapshot, depth);
            out_ << '\n';
            if (node.isDirectory()) {
                renderViewChildren(node, snapshot, depth + 1);
            }
        }
    }

    auto snapshotName(SnapshotId id) const -> std::string_view {
        auto it = snapshotNames_.find(id);
        return it == snapshotNames_.end() ? std::string_view{"?"} : std::string_view{it->second};
    }

    auto renderDiffs(INode const& node, std::size_t depth) -> void {
        std::visit(Overloaded{
                       [&](DirectoryPayload const& dir) {
                           for (auto const& diff : dir.diffs) {
                               indent(depth);
                               out_ << "~ " << snapshotName(diff.snapshot)
                                    << " created=" << diff.children.created.size()
                                    << " deleted=" << diff.children.deleted.size()
                                    << " renamed=" << diff.children.renamed.size() << '\n';
                           }
                       },
                       [&](FilePayload const& file) {
                           for (auto const& diff : file.diffs) {
                               indent(depth);
                               out_ << "~ " << snapshotName(diff.snapshot) << " len=" << diff.state.length()
                                    << " repl=" << diff.state.replication << '\n';
                           }
                       },
                   },
                   node.payload);
    }

    NamespaceTree const&                        tree_;
    std::unordered_map<SnapshotId, std::string> snapshotNames_;
    std::ostringstream                          out_;
};

auto splitLines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t                   start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

} // namespace

auto dumpNamespace(NamespaceTree const& tree) -> std::string {
    Renderer renderer(tree);
    renderer.renderLive(tree.root(), "/", 0);
    auto text = renderer.str();
    fsi_log(text, "TreeDump");
    return text;
}

auto dumpSnapshot(NamespaceTree const& tree, NodeId directory, std::string_view name) -> Expected<std::string> {
    auto const* snapshot = tree.registry().find(directory, name);
    if (!snapshot) {
        return std::unexpected(Error{Error::Code::NotFound, "Snapshot \"" + std::string{name} + "\" does not exist"});
    }
    Renderer renderer(tree);
    renderer.renderSnapshotRoot(*tree.node(directory), *snapshot, 0);
    return renderer.str();
}

auto compareDumps(std::string_view expected, std::string_view actual) -> std::optional<DumpDifference> {
    auto const lhs = splitLines(expected);
    auto const rhs = splitLines(actual);
    auto const n   = std::max(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < n; ++i) {
        auto const left  = i < lhs.size() ? lhs[i] : EndOfDump;
        auto const right = i < rhs.size() ? rhs[i] : EndOfDump;
        if (left != right) {
            return DumpDifference{.line = i + 1, .expected = std::string{left}, .actual = std::string{right}};
        }
    }
    return std::nullopt;
}

auto describeDifference(DumpDifference const& difference) -> std::string {
    std::ostringstream oss;
    oss << "line " << difference.line << ":\n  expected: " << difference.expected
        << "\n  actual:   " << difference.actual;
    return oss.str();
}

} // namespace FSI::TreeDump
