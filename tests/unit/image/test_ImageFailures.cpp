#include "NamesystemTestHelper.hpp"

#include "image/ImageCodec.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <fstream>

using namespace FSI;
using namespace FSI::Test;

namespace {

auto populated() -> std::unique_ptr<Namesystem> {
    auto ns = std::make_unique<Namesystem>(testOptions());
    require(ns->mkdirs("/a/b"));
    require(ns->mkdirs("/c"));
    writeFile(*ns, "/a/b/file", 4000);
    require(ns->allowSnapshots("/a"));
    require(ns->createSnapshot("/a", "s0"));
    require(ns->deletePath("/a/b/file"));
    return ns;
}

// Sink that fails the n-th write and records whether it was discarded.
class FailingSink final : public ByteSink {
public:
    explicit FailingSink(int failAt)
        : failAt_(failAt) {}

    auto write(std::span<const std::byte>) -> Expected<void> override {
        if (++writes_ == failAt_) {
            return std::unexpected(Error{Error::Code::IoFailure, "disk full"});
        }
        return {};
    }
    auto flush() -> Expected<void> override { return {}; }
    auto close() -> Expected<void> override {
        closed = true;
        return {};
    }
    auto discard() -> void override { discarded = true; }

    bool closed    = false;
    bool discarded = false;

private:
    int failAt_;
    int writes_ = 0;
};

// Rebuilds header and trailer around a payload so that only the payload is damaged.
auto reframe(std::vector<std::byte> const& image, std::vector<std::byte> payload) -> std::vector<std::byte> {
    auto header = ImageLoader::decodeHeader(image);
    REQUIRE(header.has_value());
    std::vector<std::byte> out;
    ImageCodec::appendScalar<std::uint32_t>(out, header->magic);
    ImageCodec::appendScalar<std::uint32_t>(out, header->version);
    ImageCodec::appendScalar<std::uint64_t>(out, header->transactionId);
    ImageCodec::appendScalar<std::uint32_t>(out, header->flags);
    ImageCodec::appendScalar<std::uint64_t>(out, payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
    ImageCodec::appendScalar<std::uint64_t>(out, ImageCodec::checksum(payload));
    return out;
}

// Overwrites the header's payload length field in place.
auto setPayloadLength(std::vector<std::byte>& image, std::uint64_t length) -> void {
    std::vector<std::byte> field;
    ImageCodec::appendScalar<std::uint64_t>(field, length);
    std::copy(field.begin(), field.end(), image.begin() + static_cast<std::ptrdiff_t>(ImageHeaderSize - sizeof(std::uint64_t)));
}

auto payloadOf(std::vector<std::byte> const& image) -> std::vector<std::byte> {
    return {image.begin() + static_cast<std::ptrdiff_t>(ImageHeaderSize),
            image.end() - static_cast<std::ptrdiff_t>(ImageTrailerSize)};
}

} // namespace

TEST_SUITE_BEGIN("image.failures");

TEST_CASE("a damaged image never replaces the current namespace") {
    auto source = populated();
    auto image  = saveToMemory(*source);

    Namesystem target(testOptions());
    require(target.mkdirs("/existing"));
    auto const before = target.dump();
    auto const txid   = target.transactionId();

    SUBCASE("flipped payload byte") {
        image[ImageHeaderSize + image.size() / 3] ^= std::byte{0x40};
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Corrupt);
    }
    SUBCASE("flipped trailer byte") {
        image.back() ^= std::byte{0x01};
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Corrupt);
    }
    SUBCASE("truncated payload") {
        image.resize(image.size() - 5);
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Truncated);
    }
    SUBCASE("truncated header") {
        image.resize(10);
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Truncated);
    }
    SUBCASE("bad magic") {
        image[0] = std::byte{'X'};
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Corrupt);
    }
    SUBCASE("unknown format version") {
        image[4] = std::byte{2};
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::FormatVersionMismatch);
    }
    SUBCASE("payload length far beyond the image") {
        setPayloadLength(image, std::uint64_t{1} << 40);
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Truncated);
    }
    SUBCASE("payload length that wraps the framed size") {
        setPayloadLength(image, 0xfffffffffffffffeull);
        auto loaded = loadFromMemory(target, image);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Corrupt);
    }
    SUBCASE("payload with a valid checksum but extra bytes") {
        auto payload = payloadOf(image);
        payload.push_back(std::byte{0});
        auto loaded = loadFromMemory(target, reframe(image, std::move(payload)));
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Corrupt);
    }
    SUBCASE("payload with a valid checksum but a cut section") {
        auto payload = payloadOf(image);
        payload.resize(payload.size() - 3);
        auto loaded = loadFromMemory(target, reframe(image, std::move(payload)));
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::Corrupt);
    }

    CHECK(target.dump() == before);
    CHECK(target.transactionId() == txid);
    CHECK(target.exists("/existing"));
}

TEST_CASE("decode rejects trailing bytes after the trailer") {
    auto source = populated();
    auto image  = saveToMemory(*source);
    image.push_back(std::byte{0});

    ImageLoader loader(testOptions());
    auto        decoded = loader.decode(image);
    REQUIRE_FALSE(decoded.has_value());
    CHECK(decoded.error().code == Error::Code::Corrupt);
}

TEST_CASE("decode bounds the payload length before slicing") {
    auto source = populated();
    auto image  = saveToMemory(*source);
    ImageLoader loader(testOptions());

    SUBCASE("length past the end") {
        setPayloadLength(image, std::uint64_t{1} << 40);
        auto decoded = loader.decode(image);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::Truncated);
    }
    SUBCASE("length near the top of the range") {
        std::uint64_t const lengths[] = {ImageMaxPayloadLength + 1, 0xfffffffffffffffeull, 0xffffffffffffffffull};
        for (auto length : lengths) {
            setPayloadLength(image, length);
            auto decoded = loader.decode(image);
            REQUIRE_FALSE(decoded.has_value());
            CHECK(decoded.error().code == Error::Code::Corrupt);
        }
    }
}

TEST_CASE("huge payload length in an image file fails without a large allocation") {
    auto source = populated();
    auto image  = saveToMemory(*source);
    setPayloadLength(image, std::uint64_t{1} << 40);

    ScratchDirectory scratch("huge-length");
    auto const       path = scratch.path / "huge.fsimage";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<char const*>(image.data()), static_cast<std::streamsize>(image.size()));
    }

    Namesystem target(testOptions());
    auto const before = target.dump();
    auto       loaded = target.loadImageFromFile(path);
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == Error::Code::Truncated);
    CHECK(target.dump() == before);
}

TEST_CASE("file state records are bounded by the payload") {
    std::vector<std::byte> bytes;
    ImageCodec::appendScalar<std::uint16_t>(bytes, 3);

    SUBCASE("zero preferred block size") {
        ImageCodec::appendScalar<std::uint64_t>(bytes, 0);
        ImageCodec::appendScalar<std::uint32_t>(bytes, 0);
        std::span<const std::byte> view{bytes};
        auto state = ImageSections::decodeFileState(view);
        REQUIRE_FALSE(state.has_value());
        CHECK(state.error().code == Error::Code::Corrupt);
    }
    SUBCASE("block count larger than the remaining bytes") {
        ImageCodec::appendScalar<std::uint64_t>(bytes, 1024);
        ImageCodec::appendScalar<std::uint32_t>(bytes, 0xffffffffu);
        ImageCodec::appendScalar<std::uint64_t>(bytes, 7);
        std::span<const std::byte> view{bytes};
        auto state = ImageSections::decodeFileState(view);
        REQUIRE_FALSE(state.has_value());
        CHECK(state.error().code == Error::Code::Corrupt);
    }
}

TEST_CASE("a cancelled save writes nothing") {
    auto source = populated();

    SUBCASE("cancelled before the save starts") {
        CancellationToken token;
        token.cancel();
        MemoryByteSink sink;
        auto           outcome = require(source->saveImage(sink, token));
        CHECK(wasCancelled(outcome));
        CHECK_FALSE(sink.closed());
        CHECK(sink.bytes().empty());
    }
    SUBCASE("cancelled between top-level subtrees") {
        CancellationToken token;
        ImageSaveOptions  options;
        std::size_t       calls = 0;
        options.progress        = [&](std::string_view, std::size_t, std::size_t) {
            ++calls;
            token.cancel();
        };
        MemoryByteSink sink;
        auto           outcome = require(source->saveImage(sink, token, options));
        CHECK(wasCancelled(outcome));
        CHECK(calls == 1);
        CHECK_FALSE(sink.closed());

        token.reset();
        auto retried = require(source->saveImage(sink, token));
        CHECK_FALSE(wasCancelled(retried));
        CHECK(sink.closed());
    }
    SUBCASE("an existing image file is left in place") {
        ScratchDirectory scratch("cancelled_save");
        auto const       path = scratch.path / imageFileName(1);
        {
            std::ofstream previous(path, std::ios::binary);
            previous << "previous image";
        }
        CancellationToken token;
        token.cancel();
        auto outcome = require(source->saveImageToFile(path, token));
        CHECK(wasCancelled(outcome));
        CHECK(require(readTextFile(path)) == "previous image");
        CHECK_FALSE(std::filesystem::exists(scratch.path / (imageFileName(1) + ".tmp")));
    }
}

TEST_CASE("a failing sink is discarded") {
    auto              source = populated();
    CancellationToken token;

    for (int failAt = 1; failAt <= 3; ++failAt) {
        CAPTURE(failAt);
        FailingSink sink(failAt);
        auto        outcome = source->saveImage(sink, token);
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == Error::Code::IoFailure);
        CHECK(sink.discarded);
        CHECK_FALSE(sink.closed);
    }
}

TEST_SUITE_END();
