#include "image/ImageFiles.hpp"

#include <charconv>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace FSI {

auto imageFileName(std::uint64_t transactionId) -> std::string {
    std::ostringstream oss;
    oss << ImageFilePrefix << std::setfill('0') << std::setw(19) << transactionId;
    return oss.str();
}

auto parseImageFileName(std::string_view fileName) -> std::optional<std::uint64_t> {
    if (!fileName.starts_with(ImageFilePrefix)) {
        return std::nullopt;
    }
    auto digits = fileName.substr(ImageFilePrefix.size());
    if (digits.size() != 19) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec]      = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

auto latestImageIn(std::filesystem::path const& directory) -> Expected<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::NotFound, "Cannot list " + directory.string()});
    }
    std::optional<std::uint64_t>         best;
    std::filesystem::path                bestPath;
    for (auto const& entry : it) {
        auto txid = parseImageFileName(entry.path().filename().string());
        if (txid && (!best || *txid > *best)) {
            best     = txid;
            bestPath = entry.path();
        }
    }
    if (!best) {
        return std::unexpected(Error{Error::Code::NotFound, "No image in " + directory.string()});
    }
    return bestPath;
}

auto readBinaryFile(std::filesystem::path const& path) -> Expected<std::vector<std::byte>> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    stream.seekg(0, std::ios::end);
    auto size = static_cast<std::size_t>(stream.tellg());
    stream.seekg(0, std::ios::beg);
    std::vector<std::byte> buffer(size);
    if (!stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size))) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to read " + path.string()});
    }
    return buffer;
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to read " + path.string()});
    }
    return oss.str();
}

} // namespace FSI
