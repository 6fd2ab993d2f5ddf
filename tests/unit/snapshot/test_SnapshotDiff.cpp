#include "snapshot/SnapshotDiff.hpp"

#include <doctest/doctest.h>

#include <algorithm>

using namespace FSI;
namespace Diff = FSI::SnapshotDiff;

namespace {

auto makeDirectory(NodeArena& arena, NodeId parent, std::string name) -> INode& {
    auto& node  = arena.allocate(NodeKind::Directory);
    node.parent = parent;
    node.name   = std::move(name);
    return node;
}

auto link(INode& directory, INode& child) -> void {
    directory.directory().children.emplace(child.name, child.id);
}

auto names(std::vector<Diff::ChildView> const& view) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto const& child : view) {
        out.push_back(child.name);
    }
    return out;
}

} // namespace

TEST_SUITE_BEGIN("snapshot.diff");

TEST_CASE("recordCreate and recordDelete reference bookkeeping") {
    ChildrenDiff diff;

    auto created = Diff::recordCreate(diff, 7);
    CHECK(created.acquired == std::vector<NodeId>{7});
    CHECK(diff.created == std::vector<NodeId>{7});

    SUBCASE("deleting a child created in the same window forgets it") {
        auto deleted = Diff::recordDelete(diff, 7);
        CHECK(deleted.acquired.empty());
        CHECK(deleted.released == std::vector<NodeId>{7});
        CHECK(diff.empty());
    }
    SUBCASE("deleting an older child retains it") {
        auto deleted = Diff::recordDelete(diff, 3);
        CHECK(deleted.acquired == std::vector<NodeId>{3});
        CHECK(diff.deleted == std::vector<NodeId>{3});
    }
}

TEST_CASE("recordRename keeps the name seen by the snapshot") {
    ChildrenDiff diff;
    auto         first = Diff::recordRename(diff, 5, "a", "b");
    CHECK(first.acquired == std::vector<NodeId>{5});
    REQUIRE(diff.renamed.size() == 1);
    CHECK(diff.renamed.front().oldName == "a");

    auto second = Diff::recordRename(diff, 5, "b", "c");
    CHECK(second.acquired.empty());
    CHECK(diff.renamed.front().oldName == "a");

    auto back = Diff::recordRename(diff, 5, "c", "a");
    CHECK(back.released == std::vector<NodeId>{5});
    CHECK(diff.renamed.empty());

    SUBCASE("children created in the window are not recorded") {
        (void)Diff::recordCreate(diff, 9);
        auto renamed = Diff::recordRename(diff, 9, "x", "y");
        CHECK(renamed.acquired.empty());
        CHECK(diff.renamed.empty());
    }
}

TEST_CASE("combine folds a later window into an earlier one") {
    ChildrenDiff prior;
    ChildrenDiff later;
    prior.created = {10};
    later.deleted = {10, 11};
    later.created = {12};
    later.renamed = {RenameRecord{"old", 13}};

    auto delta = Diff::combine(prior, later);
    CHECK(prior.created == std::vector<NodeId>{12});
    CHECK(prior.deleted == std::vector<NodeId>{11});
    REQUIRE(prior.renamed.size() == 1);
    CHECK(prior.renamed.front().child == 13);
    CHECK(std::count(delta.released.begin(), delta.released.end(), NodeId{10}) == 2);
    CHECK(later.empty());
}

TEST_CASE("childrenAt reconstructs older views") {
    NodeArena arena;
    auto&     root = makeDirectory(arena, InvalidNodeId, "");
    auto&     a    = makeDirectory(arena, root.id, "a");
    auto&     b    = makeDirectory(arena, root.id, "b");
    link(root, a);
    link(root, b);

    // Snapshot 1 sees {a, b}. Afterwards: b deleted, c created, a renamed to z.
    DirectoryDiff diff;
    diff.snapshot = 1;
    auto& c       = makeDirectory(arena, root.id, "c");
    root.directory().children.erase("b");
    (void)Diff::recordDelete(diff.children, b.id);
    link(root, c);
    (void)Diff::recordCreate(diff.children, c.id);
    root.directory().children.erase("a");
    a.name = "z";
    link(root, a);
    (void)Diff::recordRename(diff.children, a.id, "a", "z");
    root.directory().diffs.push_back(diff);

    CHECK(names(Diff::childrenAt(arena, root, CurrentState)) == std::vector<std::string>{"c", "z"});
    CHECK(names(Diff::childrenAt(arena, root, 1)) == std::vector<std::string>{"a", "b"});
    // A snapshot newer than every diff sees the live state.
    CHECK(names(Diff::childrenAt(arena, root, 2)) == std::vector<std::string>{"c", "z"});
}

TEST_CASE("attributesAt and fileStateAt use the oldest diff at or after the snapshot") {
    INode file;
    file.payload                       = FilePayload{};
    file.attributes.owner              = "live";
    file.file().state.replication      = 1;
    file.file().diffs.push_back(FileDiff{.snapshot = 2, .attributes = {.owner = "at2"}, .state = {.replication = 3}});
    file.file().diffs.push_back(FileDiff{.snapshot = 5, .attributes = {.owner = "at5"}, .state = {.replication = 2}});

    CHECK(Diff::attributesAt(file, 1).owner == "at2");
    CHECK(Diff::attributesAt(file, 2).owner == "at2");
    CHECK(Diff::attributesAt(file, 3).owner == "at5");
    CHECK(Diff::attributesAt(file, 6).owner == "live");
    CHECK(Diff::fileStateAt(file, 4).replication == 2);
    CHECK(Diff::fileStateAt(file, CurrentState).replication == 1);
}

TEST_SUITE_END();
