#include "NamesystemTestHelper.hpp"

#include "tools/ImageJsonExporter.hpp"

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

using namespace FSI;
using namespace FSI::Test;
using Json = nlohmann::json;

namespace {

auto sampleNamespace(Namesystem& ns) -> void {
    require(ns.mkdirs("/d/sub"));
    writeFile(ns, "/d/sub/f", 1500);
    writeFile(ns, "/d/g", 10);
    require(ns.allowSnapshots("/d"));
    require(ns.createSnapshot("/d", "s0"));
    require(ns.deletePath("/d/g"));
    auto handle = require(ns.create("/d/open", "client-7"));
    require(ns.write(handle, 20));
    require(ns.sync(handle));
}

auto findChild(Json const& directory, std::string_view name) -> Json const* {
    for (auto const& child : directory.at("children")) {
        if (child.at("name").get<std::string>() == name) {
            return &child;
        }
    }
    return nullptr;
}

} // namespace

TEST_SUITE_BEGIN("tools.json");

TEST_CASE("exporting an image") {
    Namesystem ns(testOptions());
    sampleNamespace(ns);

    ImageSaveOptions saveOptions;
    saveOptions.transactionId = 99;
    auto const image          = saveToMemory(ns, saveOptions);

    auto text = require(ImageJsonExporter::Export(std::span<const std::byte>(image)));
    auto json = Json::parse(text);

    CHECK(json.at("header").at("transaction_id").get<std::uint64_t>() == 99);
    CHECK(json.at("header").at("version").get<std::uint32_t>() == ImageVersion);
    CHECK(json.at("header").at("magic").get<std::string>() == "0x000000004653494d");
    CHECK(json.at("header").at("checksum").get<std::string>().size() == 18);
    CHECK(json.at("stats").at("snapshots").get<std::size_t>() == 1);
    CHECK(json.at("stats").at("diff_records").get<std::size_t>() == 1);
    CHECK(json.at("counters").at("last_snapshot_id").get<std::uint64_t>() == 1);

    auto const& tree = json.at("tree");
    CHECK(tree.at("name") == "/");
    auto const* d = findChild(tree, "d");
    REQUIRE(d != nullptr);
    CHECK(findChild(*d, "g") == nullptr);
    auto const* open = findChild(*d, "open");
    REQUIRE(open != nullptr);
    CHECK(open->at("under_construction") == "client-7");
    CHECK(open->at("length").get<std::uint64_t>() == 20);
    auto const* sub = findChild(*d, "sub");
    REQUIRE(sub != nullptr);
    auto const* f = findChild(*sub, "f");
    REQUIRE(f != nullptr);
    CHECK(f->at("blocks").size() == 2);

    auto const& snapshottable = json.at("snapshottable");
    REQUIRE(snapshottable.size() == 1);
    CHECK(snapshottable[0].at("path") == "/d");
    auto const& s0 = snapshottable[0].at("snapshots").at(0);
    CHECK(s0.at("name") == "s0");
    auto const& view = s0.at("view");
    CHECK(findChild(view, "g") != nullptr);
    CHECK(findChild(view, "open") == nullptr);

    auto const& diffs = json.at("diffs");
    REQUIRE(diffs.size() == 1);
    CHECK(diffs[0].at("path") == "/d");
    CHECK(diffs[0].at("records").at(0).at("snapshot").at("name") == "s0");
    CHECK(diffs[0].at("records").at(0).at("deleted").size() == 1);
}

TEST_CASE("exporter options") {
    Namesystem ns(testOptions());
    sampleNamespace(ns);

    ImageJsonOptions options;
    options.includeSnapshotViews = false;
    options.includeDiffs         = false;
    options.includeBlocks        = false;
    options.indent               = -1;

    auto text = require(ImageJsonExporter::Export(ns, options));
    CHECK(text.find('\n') == std::string::npos);
    auto json = Json::parse(text);
    CHECK_FALSE(json.contains("header"));
    CHECK_FALSE(json.contains("diffs"));
    CHECK_FALSE(json.at("snapshottable").at(0).at("snapshots").at(0).contains("view"));
    auto const* f = findChild(*findChild(*findChild(json.at("tree"), "d"), "sub"), "f");
    REQUIRE(f != nullptr);
    CHECK_FALSE(f->contains("blocks"));
    CHECK(f->at("block_count").get<std::size_t>() == 2);
}

TEST_CASE("exporting a damaged image reports the load error") {
    Namesystem ns(testOptions());
    sampleNamespace(ns);
    auto image = saveToMemory(ns);
    image.resize(image.size() - 1);

    auto text = ImageJsonExporter::Export(std::span<const std::byte>(image));
    REQUIRE_FALSE(text.has_value());
    CHECK(text.error().code == Error::Code::Truncated);
}

TEST_SUITE_END();
