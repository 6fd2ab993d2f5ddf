#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FSI {

inline constexpr std::string_view ImageFilePrefix = "fsimage_";

// fsimage_<transaction id padded to 19 digits>
[[nodiscard]] auto imageFileName(std::uint64_t transactionId) -> std::string;

// Transaction id encoded in an image file name, if it follows imageFileName().
[[nodiscard]] auto parseImageFileName(std::string_view fileName) -> std::optional<std::uint64_t>;

// Image with the highest transaction id inside `directory`.
[[nodiscard]] auto latestImageIn(std::filesystem::path const& directory) -> Expected<std::filesystem::path>;

auto readBinaryFile(std::filesystem::path const& path) -> Expected<std::vector<std::byte>>;
auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

} // namespace FSI
