#include "path/PathUtils.hpp"

#include <doctest/doctest.h>

using namespace FSI;

TEST_SUITE_BEGIN("path");

TEST_CASE("validatePath classifies malformed paths") {
    static_assert(validatePath("/").code == PathValidation::Code::None);
    static_assert(validatePath("/a/b").code == PathValidation::Code::None);

    CHECK(validatePath("").code == PathValidation::Code::EmptyPath);
    CHECK(validatePath("a/b").code == PathValidation::Code::MustStartWithSlash);
    CHECK(validatePath("/a/").code == PathValidation::Code::EndsWithSlash);
    CHECK(validatePath("/a//b").code == PathValidation::Code::EmptyPathComponent);
    CHECK(validatePath("/a/../b").code == PathValidation::Code::RelativePath);
    CHECK(validatePath("/a/./b").code == PathValidation::Code::RelativePath);
}

TEST_CASE("splitPath") {
    SUBCASE("root has no components") {
        auto parts = splitPath("/");
        REQUIRE(parts.has_value());
        CHECK(parts->empty());
    }
    SUBCASE("components in order") {
        auto parts = splitPath("/d/.snapshot/s0/file");
        REQUIRE(parts.has_value());
        CHECK(*parts == std::vector<std::string>{"d", ".snapshot", "s0", "file"});
    }
    SUBCASE("invalid path reports InvalidPath") {
        auto parts = splitPath("relative");
        REQUIRE_FALSE(parts.has_value());
        CHECK(parts.error().code == Error::Code::InvalidPath);
    }
}

TEST_CASE("validateChildName rejects reserved and relative names") {
    CHECK(validateChildName("file.txt").has_value());
    CHECK(validateChildName(".hidden").has_value());
    CHECK_FALSE(validateChildName("").has_value());
    CHECK_FALSE(validateChildName(".").has_value());
    CHECK_FALSE(validateChildName("..").has_value());
    CHECK_FALSE(validateChildName("a/b").has_value());
    auto reserved = validateChildName(".snapshot");
    REQUIRE_FALSE(reserved.has_value());
    CHECK(reserved.error().code == Error::Code::InvalidPath);
}

TEST_CASE("joinPath parentPath baseName") {
    CHECK(joinPath("/", "a") == "/a");
    CHECK(joinPath("/a", "b") == "/a/b");
    CHECK(parentPath("/a") == "/");
    CHECK(parentPath("/a/b/c") == "/a/b");
    CHECK(baseName("/a/b/c") == "c");
    CHECK(baseName("/").empty());
}

TEST_SUITE_END();
