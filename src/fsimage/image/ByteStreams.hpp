#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace FSI {

/**
 * Destination of a saved image. A sink either reaches close() with every byte
 * committed, or is discarded and leaves nothing a loader could pick up.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual auto write(std::span<const std::byte> bytes) -> Expected<void> = 0;
    virtual auto flush() -> Expected<void>                                 = 0;
    virtual auto close() -> Expected<void>                                 = 0;
    virtual auto discard() -> void                                         = 0;
};

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Returns up to `count` bytes; fewer only at the end of the stream.
    virtual auto read(std::size_t count) -> Expected<std::vector<std::byte>> = 0;
    [[nodiscard]] virtual auto eof() const -> bool                           = 0;
};

class MemoryByteSink final : public ByteSink {
public:
    auto write(std::span<const std::byte> bytes) -> Expected<void> override;
    auto flush() -> Expected<void> override { return {}; }
    auto close() -> Expected<void> override;
    auto discard() -> void override;

    [[nodiscard]] auto bytes() const noexcept -> std::vector<std::byte> const& { return committed_; }
    [[nodiscard]] auto closed() const noexcept -> bool { return closed_; }

private:
    std::vector<std::byte> pending_;
    std::vector<std::byte> committed_;
    bool                   closed_ = false;
};

class MemoryByteSource final : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::byte> bytes)
        : bytes_(std::move(bytes)) {}

    auto read(std::size_t count) -> Expected<std::vector<std::byte>> override;
    [[nodiscard]] auto eof() const -> bool override { return offset_ >= bytes_.size(); }

private:
    std::vector<std::byte> bytes_;
    std::size_t            offset_ = 0;
};

/**
 * Writes `<path>.tmp`, then on close fsyncs it and renames it over `path`.
 * Discarding (or destroying an unclosed sink) removes the temporary file.
 */
class FileByteSink final : public ByteSink {
public:
    explicit FileByteSink(std::filesystem::path path, bool fsyncData = true);
    ~FileByteSink() override;

    FileByteSink(FileByteSink const&)            = delete;
    FileByteSink& operator=(FileByteSink const&) = delete;

    auto write(std::span<const std::byte> bytes) -> Expected<void> override;
    auto flush() -> Expected<void> override;
    auto close() -> Expected<void> override;
    auto discard() -> void override;

    [[nodiscard]] auto path() const noexcept -> std::filesystem::path const& { return path_; }
    [[nodiscard]] auto temporaryPath() const -> std::filesystem::path;

private:
    auto openTemporary() -> Expected<void>;
    auto closeDescriptor() -> void;

    std::filesystem::path path_;
    bool                  fsyncData_ = true;
    int                   fd_        = -1;
    bool                  finished_  = false;
};

class FileByteSource final : public ByteSource {
public:
    explicit FileByteSource(std::filesystem::path const& path);

    [[nodiscard]] auto isOpen() const -> bool { return stream_.is_open(); }

    auto read(std::size_t count) -> Expected<std::vector<std::byte>> override;
    [[nodiscard]] auto eof() const -> bool override;

private:
    mutable std::ifstream stream_;
};

auto fsyncFileDescriptor(int fd) -> Expected<void>;
auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

} // namespace FSI
