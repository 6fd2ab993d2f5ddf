#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace FSI::ImageCodec {

/*
 * Little-endian scalar and length-prefixed string encoding shared by the
 * image writer and loader. Readers consume from the front of the span and
 * fail with Corrupt when the payload ends inside a record.
 */

template <typename T>
void appendScalar(std::vector<std::byte>& buffer, T value) {
    static_assert(std::is_unsigned_v<T>, "appendScalar requires an unsigned integer");
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        buffer.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFFu));
    }
}

void appendString(std::vector<std::byte>& buffer, std::string_view value);

template <typename T>
auto readScalar(std::span<const std::byte>& buffer) -> Expected<T> {
    static_assert(std::is_unsigned_v<T>, "readScalar requires an unsigned integer");
    if (buffer.size() < sizeof(T)) {
        return std::unexpected(Error{Error::Code::Corrupt, "Image record truncated"});
    }
    T value{};
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<T>(std::to_integer<std::uint8_t>(buffer[i])) << (8 * i));
    }
    buffer = buffer.subspan(sizeof(T));
    return value;
}

auto readString(std::span<const std::byte>& buffer) -> Expected<std::string>;

// 64-bit FNV-1a, the image trailer checksum.
struct Fnv1a64 {
    std::uint64_t value = 14695981039346656037ull;

    void mix_bytes(std::span<const std::byte> bytes) {
        for (auto byte : bytes) {
            value ^= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(byte));
            value *= 1099511628211ull;
        }
    }
};

[[nodiscard]] inline auto checksum(std::span<const std::byte> bytes) -> std::uint64_t {
    Fnv1a64 hash;
    hash.mix_bytes(bytes);
    return hash.value;
}

} // namespace FSI::ImageCodec
