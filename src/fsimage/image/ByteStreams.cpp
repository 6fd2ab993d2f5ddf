#include "image/ByteStreams.hpp"

#include "image/ImageFormat.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace FSI {

auto MemoryByteSink::write(std::span<const std::byte> bytes) -> Expected<void> {
    if (closed_) {
        return std::unexpected(Error{Error::Code::IoFailure, "Sink already closed"});
    }
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
    return {};
}

auto MemoryByteSink::close() -> Expected<void> {
    if (closed_) {
        return std::unexpected(Error{Error::Code::IoFailure, "Sink already closed"});
    }
    committed_ = std::move(pending_);
    pending_.clear();
    closed_ = true;
    return {};
}

auto MemoryByteSink::discard() -> void {
    pending_.clear();
}

auto MemoryByteSource::read(std::size_t count) -> Expected<std::vector<std::byte>> {
    auto const available = bytes_.size() - std::min(offset_, bytes_.size());
    auto const take      = std::min(count, available);
    auto const begin     = bytes_.begin() + static_cast<std::ptrdiff_t>(offset_);
    std::vector<std::byte> out(begin, begin + static_cast<std::ptrdiff_t>(take));
    offset_ += take;
    return out;
}

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "fsync failed"});
    }
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "open directory failed"});
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

FileByteSink::FileByteSink(std::filesystem::path path, bool fsyncData)
    : path_(std::move(path)), fsyncData_(fsyncData) {}

FileByteSink::~FileByteSink() {
    if (!finished_) {
        discard();
    }
}

auto FileByteSink::temporaryPath() const -> std::filesystem::path {
    auto tmpPath = path_;
    tmpPath += ".tmp";
    return tmpPath;
}

auto FileByteSink::openTemporary() -> Expected<void> {
    std::error_code ec;
    auto            parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IoFailure, "Failed to create directories for " + path_.string()});
        }
    }
    fd_ = ::open(temporaryPath().c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd_ < 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to open temp file " + temporaryPath().string()});
    }
    return {};
}

auto FileByteSink::closeDescriptor() -> void {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto FileByteSink::write(std::span<const std::byte> bytes) -> Expected<void> {
    if (finished_) {
        return std::unexpected(Error{Error::Code::IoFailure, "Sink already closed"});
    }
    if (fd_ < 0) {
        if (auto opened = openTemporary(); !opened)
            return opened;
    }

    std::size_t totalWritten = 0;
    while (totalWritten < bytes.size()) {
        auto const* ptr       = bytes.data() + static_cast<std::ptrdiff_t>(totalWritten);
        auto const  remaining = bytes.size() - totalWritten;
        auto        written   = ::write(fd_, reinterpret_cast<void const*>(ptr), remaining);
        if (written <= 0) {
            return std::unexpected(Error{Error::Code::IoFailure, "Failed to write temp file"});
        }
        totalWritten += static_cast<std::size_t>(written);
    }
    return {};
}

auto FileByteSink::flush() -> Expected<void> {
    if (fd_ < 0 || !fsyncData_) {
        return {};
    }
    return fsyncFileDescriptor(fd_);
}

auto FileByteSink::close() -> Expected<void> {
    if (finished_) {
        return std::unexpected(Error{Error::Code::IoFailure, "Sink already closed"});
    }
    if (fd_ < 0) {
        // Nothing written yet: still produce an (empty) file.
        if (auto opened = openTemporary(); !opened)
            return opened;
    }
    if (fsyncData_) {
        if (auto sync = fsyncFileDescriptor(fd_); !sync) {
            return sync;
        }
    }
    if (::close(fd_) != 0) {
        fd_ = -1;
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to close temp file"});
    }
    fd_ = -1;

    std::error_code ec;
    std::filesystem::rename(temporaryPath(), path_, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to rename temp file to " + path_.string()});
    }
    finished_ = true;

    auto parent = path_.parent_path();
    if (fsyncData_ && !parent.empty()) {
        if (auto syncDir = fsyncDirectory(parent); !syncDir) {
            return syncDir;
        }
    }
    fsi_log("Wrote image " + path_.string(), "ImageWriter");
    return {};
}

auto FileByteSink::discard() -> void {
    closeDescriptor();
    std::error_code ec;
    std::filesystem::remove(temporaryPath(), ec);
    finished_ = true;
}

FileByteSource::FileByteSource(std::filesystem::path const& path)
    : stream_(path, std::ios::binary) {}

auto FileByteSource::read(std::size_t count) -> Expected<std::vector<std::byte>> {
    if (!stream_.is_open()) {
        return std::unexpected(Error{Error::Code::IoFailure, "Image file is not open"});
    }
    count = std::min(count, ImageReadChunkSize);
    std::vector<std::byte> buffer(count);
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    auto const got = stream_.gcount();
    if (stream_.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to read image file"});
    }
    buffer.resize(static_cast<std::size_t>(got));
    return buffer;
}

auto FileByteSource::eof() const -> bool {
    if (!stream_.is_open() || stream_.eof()) {
        return true;
    }
    return stream_.peek() == std::ifstream::traits_type::eof();
}

} // namespace FSI
