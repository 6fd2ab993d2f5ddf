#include "image/ImageCodec.hpp"

#include <cstring>
#include <limits>

namespace FSI::ImageCodec {

void appendString(std::vector<std::byte>& buffer, std::string_view value) {
    appendScalar<std::uint32_t>(buffer, static_cast<std::uint32_t>(value.size()));
    auto const base = reinterpret_cast<const std::byte*>(value.data());
    buffer.insert(buffer.end(), base, base + value.size());
}

auto readString(std::span<const std::byte>& buffer) -> Expected<std::string> {
    auto sizeExpected = readScalar<std::uint32_t>(buffer);
    if (!sizeExpected)
        return std::unexpected(sizeExpected.error());
    auto const size = static_cast<std::size_t>(*sizeExpected);
    if (buffer.size() < size) {
        return std::unexpected(Error{Error::Code::Corrupt, "Image string truncated"});
    }
    std::string value(size, '\0');
    if (size > 0) {
        std::memcpy(value.data(), buffer.data(), size);
    }
    buffer = buffer.subspan(size);
    return value;
}

} // namespace FSI::ImageCodec
