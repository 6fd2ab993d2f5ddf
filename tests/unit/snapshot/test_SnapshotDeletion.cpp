#include "NamesystemTestHelper.hpp"

#include <doctest/doctest.h>

using namespace FSI;
using namespace FSI::Test;

namespace {

auto nodeCount(Namesystem const& ns) -> std::size_t {
    return ns.inspect([](NamespaceTree const& tree) { return tree.nodeCount(); });
}

auto diffCount(Namesystem const& ns) -> std::size_t {
    return ns.inspect([](NamespaceTree const& tree) { return tree.diffRecordCount(); });
}

auto names(Namesystem const& ns, std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto const& status : require(ns.listing(path))) {
        out.push_back(status.name);
    }
    return out;
}

auto snapshotDump(Namesystem const& ns, std::string_view directory, std::string_view name) -> std::string {
    return ns.inspect([&](NamespaceTree const& tree) {
        return require(TreeDump::dumpSnapshot(tree, require(tree.resolve(directory)).node, name));
    });
}

} // namespace

TEST_SUITE_BEGIN("snapshot.deletion");

TEST_CASE("deleting the only snapshot reclaims what it retained") {
    Namesystem ns(testOptions());
    require(ns.mkdirs("/d/sub"));
    writeFile(ns, "/d/sub/f", 100);
    writeFile(ns, "/d/g", 100);
    require(ns.allowSnapshots("/d"));
    auto const baseline = nodeCount(ns);

    require(ns.createSnapshot("/d", "s0"));
    require(ns.deletePath("/d/sub", true));
    require(ns.setReplication("/d/g", 1));
    CHECK(nodeCount(ns) == baseline);
    CHECK(diffCount(ns) == 2);
    CHECK(ns.exists("/d/.snapshot/s0/sub/f"));

    require(ns.deleteSnapshot("/d", "s0"));
    CHECK(nodeCount(ns) == baseline - 2);
    CHECK(diffCount(ns) == 0);
    CHECK(require(ns.getFileInfo("/d/g")).replication == 1);
}

TEST_CASE("deleting the newer snapshot hands its records to the older one") {
    Namesystem ns(testOptions());
    require(ns.mkdirs("/d"));
    writeFile(ns, "/d/x", 1);
    writeFile(ns, "/d/y", 1);
    require(ns.allowSnapshots("/d"));

    require(ns.createSnapshot("/d", "s1"));
    require(ns.deletePath("/d/x"));
    require(ns.createSnapshot("/d", "s2"));
    require(ns.deletePath("/d/y"));
    CHECK(diffCount(ns) == 2);

    auto const s1Before = snapshotDump(ns, "/d", "s1");
    require(ns.deleteSnapshot("/d", "s2"));

    CHECK(diffCount(ns) == 1);
    CHECK(snapshotDump(ns, "/d", "s1") == s1Before);
    CHECK(names(ns, "/d/.snapshot/s1") == std::vector<std::string>{"x", "y"});
    CHECK(names(ns, "/d").empty());

    require(ns.deleteSnapshot("/d", "s1"));
    CHECK(diffCount(ns) == 0);
    CHECK(nodeCount(ns) == 2);
}

TEST_CASE("deleting the older snapshot keeps the newer view intact") {
    Namesystem ns(testOptions());
    require(ns.mkdirs("/d"));
    writeFile(ns, "/d/x", 1);
    writeFile(ns, "/d/y", 1);
    require(ns.allowSnapshots("/d"));

    require(ns.createSnapshot("/d", "s1"));
    require(ns.deletePath("/d/x"));
    writeFile(ns, "/d/c", 1);
    require(ns.createSnapshot("/d", "s2"));
    require(ns.deletePath("/d/y"));

    auto const s2Before = snapshotDump(ns, "/d", "s2");
    require(ns.deleteSnapshot("/d", "s1"));

    CHECK(snapshotDump(ns, "/d", "s2") == s2Before);
    CHECK(names(ns, "/d/.snapshot/s2") == std::vector<std::string>{"c", "y"});
    // root, d, c and the y retained by s2
    CHECK(nodeCount(ns) == 4);
    CHECK(diffCount(ns) == 1);
}

TEST_CASE("a child born and removed between two snapshots is reclaimed") {
    Namesystem ns(testOptions());
    require(ns.mkdirs("/d"));
    require(ns.allowSnapshots("/d"));

    require(ns.createSnapshot("/d", "s1"));
    writeFile(ns, "/d/z", 10);
    require(ns.createSnapshot("/d", "s2"));
    require(ns.deletePath("/d/z"));
    CHECK(ns.exists("/d/.snapshot/s2/z"));
    CHECK_FALSE(ns.exists("/d/.snapshot/s1/z"));
    CHECK(nodeCount(ns) == 3);

    require(ns.deleteSnapshot("/d", "s2"));
    CHECK(nodeCount(ns) == 2);
    CHECK(names(ns, "/d/.snapshot/s1").empty());
}

TEST_CASE("snapshots of an ancestor inherit records of a deleted nested snapshot") {
    Namesystem ns(testOptions());
    require(ns.mkdirs("/a/b"));
    writeFile(ns, "/a/b/f", 2000);
    require(ns.allowSnapshots("/a"));
    require(ns.allowSnapshots("/a/b"));

    require(ns.createSnapshot("/a", "sa"));
    require(ns.createSnapshot("/a/b", "sb"));
    require(ns.setReplication("/a/b/f", 1));
    require(ns.deletePath("/a/b/f"));

    require(ns.deleteSnapshot("/a/b", "sb"));
    auto viaAncestor = require(ns.getFileInfo("/a/.snapshot/sa/b/f"));
    CHECK(viaAncestor.length == 2000);
    CHECK(viaAncestor.replication == 3);
    CHECK(diffCount(ns) == 2);

    require(ns.deleteSnapshot("/a", "sa"));
    CHECK(diffCount(ns) == 0);
    CHECK(nodeCount(ns) == 3);
}

TEST_CASE("rename records disappear with their snapshot") {
    Namesystem ns(testOptions());
    require(ns.mkdirs("/d"));
    writeFile(ns, "/d/a", 1);
    require(ns.allowSnapshots("/d"));
    require(ns.createSnapshot("/d", "s1"));
    require(ns.rename("/d/a", "/d/b"));
    require(ns.rename("/d/b", "/d/c"));

    CHECK(names(ns, "/d/.snapshot/s1") == std::vector<std::string>{"a"});
    CHECK(names(ns, "/d") == std::vector<std::string>{"c"});

    require(ns.deleteSnapshot("/d", "s1"));
    CHECK(names(ns, "/d") == std::vector<std::string>{"c"});
    CHECK(diffCount(ns) == 0);
    CHECK(nodeCount(ns) == 3);
}

TEST_CASE("deleting a snapshottable directory after its snapshots are gone") {
    Namesystem ns(testOptions());
    require(ns.mkdirs("/d/e"));
    require(ns.allowSnapshots("/d"));
    require(ns.createSnapshot("/d", "s1"));
    require(ns.deletePath("/d/e"));

    CHECK(ns.deletePath("/d", true).error().code == Error::Code::SnapshotsExist);
    require(ns.deleteSnapshot("/d", "s1"));
    require(ns.deletePath("/d", true));
    CHECK(ns.snapshottableDirectories().empty());
    CHECK(nodeCount(ns) == 1);
}

TEST_SUITE_END();
