#include "NamesystemTestHelper.hpp"

#include <doctest/doctest.h>

using namespace FSI;
using namespace FSI::Test;

namespace {

auto directory() -> NodeSpec {
    return NodeSpec{.kind = NodeKind::Directory};
}

auto file() -> NodeSpec {
    return NodeSpec{.kind = NodeKind::File};
}

} // namespace

TEST_SUITE_BEGIN("namespace.tree");

TEST_CASE("a fresh tree holds only the root") {
    NamespaceTree tree(testOptions());
    CHECK(tree.nodeCount() == 1);
    CHECK(tree.root().id == RootNodeId);
    CHECK(tree.root().isDirectory());
    CHECK(tree.pathOf(RootNodeId) == "/");
    CHECK(tree.isLive(RootNodeId));
    auto counters = tree.counters();
    CHECK(counters.lastNodeId == RootNodeId);
    CHECK(counters.lastSnapshotId == NoSnapshot);
}

TEST_CASE("createChild links nodes under their parent") {
    NamespaceTree tree(testOptions());
    auto          a = require(tree.createChild(RootNodeId, "a", directory()));
    auto          f = require(tree.createChild(a, "f", file()));

    CHECK(a == RootNodeId + 1);
    CHECK(f == RootNodeId + 2);
    CHECK(tree.pathOf(f) == "/a/f");
    CHECK(tree.isLive(f));
    CHECK(require(tree.lookupChild(a, "f")) == f);

    auto const* node = tree.node(f);
    REQUIRE(node != nullptr);
    CHECK(node->references == 1);
    CHECK(node->file().state.replication == 3);
    CHECK(node->file().state.preferredBlockSize == 1024);
    CHECK(node->attributes.permission == 0644);

    SUBCASE("duplicate names") {
        auto again = tree.createChild(a, "f", file());
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::AlreadyExists);
    }
    SUBCASE("reserved and invalid names") {
        CHECK(tree.createChild(a, ".snapshot", directory()).error().code == Error::Code::InvalidPath);
        CHECK(tree.createChild(a, "x/y", directory()).error().code == Error::Code::InvalidPath);
        CHECK(tree.createChild(a, "..", directory()).error().code == Error::Code::InvalidPath);
    }
    SUBCASE("files have no children") {
        CHECK(tree.createChild(f, "x", file()).error().code == Error::Code::NotDirectory);
        CHECK(tree.lookupChild(f, "x").error().code == Error::Code::NotDirectory);
    }
    SUBCASE("explicit attributes and file settings") {
        NodeSpec spec           = file();
        spec.attributes         = Attributes{.owner = "u", .group = "g", .permission = 0600, .modificationTime = 5};
        spec.replication        = 1;
        spec.preferredBlockSize = 4096;
        spec.underConstruction  = "client";
        auto const* custom      = tree.node(require(tree.createChild(a, "custom", spec)));
        CHECK(custom->attributes.owner == "u");
        CHECK(custom->attributes.modificationTime == 5);
        CHECK(custom->file().state.replication == 1);
        CHECK(custom->file().state.preferredBlockSize == 4096);
        CHECK(custom->file().underConstruction == std::optional<std::string>{"client"});
    }
}

TEST_CASE("resolve walks live and snapshot paths") {
    NamespaceTree tree(testOptions());
    auto          d = require(tree.createChild(RootNodeId, "d", directory()));
    auto          f = require(tree.createChild(d, "f", file()));

    CHECK(require(tree.resolve("/d/f")).node == f);
    CHECK(require(tree.resolve("/")).node == RootNodeId);
    CHECK(tree.resolve("/d/missing").error().code == Error::Code::NotFound);
    CHECK(tree.resolve("/d/f/x").error().code == Error::Code::NotDirectory);
    CHECK(tree.resolve("d/f").error().code == Error::Code::InvalidPath);
    CHECK(tree.resolve("/d/.snapshot").error().code == Error::Code::NotSnapshottable);

    require(tree.allowSnapshots(d));
    auto listing = require(tree.resolve("/d/.snapshot"));
    CHECK(listing.snapshotListing);
    CHECK(listing.node == d);
    CHECK(tree.resolve("/d/.snapshot/s0").error().code == Error::Code::NotFound);

    auto snapshot = require(tree.createSnapshot(d, "s0"));
    auto root     = require(tree.resolve("/d/.snapshot/s0"));
    CHECK(root.node == d);
    CHECK(root.snapshot == snapshot.id);
    REQUIRE(root.snapshotRoot.has_value());
    CHECK(root.snapshotRoot->name == "s0");

    auto inside = require(tree.resolve("/d/.snapshot/s0/f"));
    CHECK(inside.node == f);
    CHECK(inside.snapshot == snapshot.id);
    CHECK_FALSE(inside.snapshotRoot.has_value());

    CHECK(tree.resolve("/d/.snapshot/s0/.snapshot/s0").error().code == Error::Code::InvalidPath);
}

TEST_CASE("diff records are only created when a snapshot needs them") {
    NamespaceTree tree(testOptions());
    auto          d = require(tree.createChild(RootNodeId, "d", directory()));
    auto          f = require(tree.createChild(d, "f", file()));

    SUBCASE("no snapshot, no history") {
        require(tree.createChild(d, "g", file()));
        require(tree.renameChild(d, "g", "h"));
        require(tree.setAttributes(f, AttributeUpdate{.owner = std::string{"x"}}));
        require(tree.deleteChild(d, "h"));
        CHECK(tree.diffRecordCount() == 0);
    }
    SUBCASE("one record per node and snapshot") {
        require(tree.allowSnapshots(d));
        require(tree.createSnapshot(d, "s0"));
        require(tree.createChild(d, "g", file()));
        require(tree.createChild(d, "h", file()));
        require(tree.setAttributes(d, AttributeUpdate{.permission = 0700}));
        CHECK(tree.diffRecordCount() == 1);

        require(tree.setReplication(f, 2));
        require(tree.setReplication(f, 1));
        CHECK(tree.diffRecordCount() == 2);
        CHECK(tree.node(f)->file().diffs.front().state.replication == 3);
    }
    SUBCASE("nodes created after the newest snapshot carry no history") {
        require(tree.allowSnapshots(d));
        require(tree.createSnapshot(d, "s0"));
        auto g = require(tree.createChild(d, "g", file()));
        CHECK(tree.diffRecordCount() == 1);
        CHECK(tree.node(g)->createdAfter == 1);
        require(tree.setReplication(g, 5));
        require(tree.setAttributes(g, AttributeUpdate{.group = std::string{"other"}}));
        CHECK(tree.diffRecordCount() == 1);
        CHECK(tree.node(g)->file().diffs.empty());
    }
    SUBCASE("snapshots of unrelated directories do not cover the node") {
        auto other = require(tree.createChild(RootNodeId, "other", directory()));
        require(tree.allowSnapshots(other));
        require(tree.createSnapshot(other, "s0"));
        require(tree.setReplication(f, 2));
        require(tree.createChild(d, "g", file()));
        CHECK(tree.diffRecordCount() == 0);
    }
}

TEST_CASE("deleting without snapshots reclaims the subtree") {
    NamespaceTree tree(testOptions());
    auto          d = require(tree.createChild(RootNodeId, "d", directory()));
    auto          e = require(tree.createChild(d, "e", directory()));
    require(tree.createChild(e, "f1", file()));
    require(tree.createChild(e, "f2", file()));
    CHECK(tree.nodeCount() == 5);

    CHECK(require(tree.deleteChild(RootNodeId, "d")) == d);
    CHECK(tree.nodeCount() == 1);
    CHECK(tree.node(e) == nullptr);
    CHECK(tree.deleteChild(RootNodeId, "d").error().code == Error::Code::NotFound);
}

TEST_CASE("deleting a snapshottable subtree") {
    NamespaceTree tree(testOptions());
    auto          d = require(tree.createChild(RootNodeId, "d", directory()));
    auto          e = require(tree.createChild(d, "e", directory()));
    require(tree.allowSnapshots(e));

    SUBCASE("is refused while snapshots exist") {
        require(tree.createSnapshot(e, "s0"));
        CHECK(tree.deleteChild(RootNodeId, "d").error().code == Error::Code::SnapshotsExist);
        CHECK(tree.deleteChild(d, "e").error().code == Error::Code::SnapshotsExist);
        CHECK(tree.isLive(e));
    }
    SUBCASE("forgets the registration otherwise") {
        require(tree.deleteChild(RootNodeId, "d"));
        CHECK_FALSE(tree.registry().isSnapshottable(e));
        CHECK(tree.registry().empty());
    }
}

TEST_CASE("renameChild") {
    NamespaceTree tree(testOptions());
    auto          d = require(tree.createChild(RootNodeId, "d", directory()));
    auto          a = require(tree.createChild(d, "a", file()));
    require(tree.createChild(d, "b", file()));

    CHECK(tree.renameChild(d, "a", "b").error().code == Error::Code::AlreadyExists);
    CHECK(tree.renameChild(d, "zz", "c").error().code == Error::Code::NotFound);
    CHECK(tree.renameChild(d, "a", ".snapshot").error().code == Error::Code::InvalidPath);
    require(tree.renameChild(d, "a", "a"));

    require(tree.renameChild(d, "a", "c"));
    CHECK(tree.node(a)->name == "c");
    CHECK(tree.pathOf(a) == "/d/c");
    CHECK(tree.lookupChild(d, "a").error().code == Error::Code::NotFound);
}

TEST_CASE("attribute and replication updates") {
    NamespaceTree tree(testOptions());
    auto          d = require(tree.createChild(RootNodeId, "d", directory()));
    auto          f = require(tree.createChild(d, "f", file()));

    require(tree.setAttributes(f, AttributeUpdate{.owner = std::string{"alice"}, .permission = 01777}));
    CHECK(tree.node(f)->attributes.owner == "alice");
    CHECK(tree.node(f)->attributes.group == "supergroup");
    CHECK(tree.node(f)->attributes.permission == 0777);

    CHECK(tree.setReplication(f, 0).error().code == Error::Code::MalformedInput);
    CHECK(tree.setReplication(d, 2).error().code == Error::Code::NotFile);
    CHECK(tree.setAttributes(999999, AttributeUpdate{}).error().code == Error::Code::NotFound);
}

TEST_CASE("snapshot management through the tree") {
    NamespaceTree tree(testOptions());
    auto          d = require(tree.createChild(RootNodeId, "d", directory()));
    auto          f = require(tree.createChild(d, "f", file()));

    CHECK(tree.createSnapshot(d, "s0").error().code == Error::Code::NotSnapshottable);
    CHECK(tree.allowSnapshots(f).error().code == Error::Code::NotDirectory);
    require(tree.allowSnapshots(d));
    CHECK(tree.createSnapshot(d, "").error().code == Error::Code::InvalidPath);
    CHECK(tree.createSnapshot(d, "a/b").error().code == Error::Code::InvalidPath);

    require(tree.createSnapshot(d, "s0"));
    require(tree.renameSnapshot(d, "s0", "first"));
    CHECK(tree.renameSnapshot(d, "first", "").error().code == Error::Code::InvalidPath);
    auto listed = require(tree.listSnapshots(d));
    REQUIRE(listed.size() == 1);
    CHECK(listed.front().name == "first");

    CHECK(tree.disallowSnapshots(d).error().code == Error::Code::SnapshotsExist);
    require(tree.deleteSnapshot(d, "first"));
    CHECK(tree.deleteSnapshot(d, "first").error().code == Error::Code::NotFound);
    require(tree.disallowSnapshots(d));
    CHECK(tree.listSnapshots(d).error().code == Error::Code::NotSnapshottable);
}

TEST_SUITE_END();
