#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <variant>

namespace FSI {

inline constexpr std::uint32_t ImageMagic   = 0x4653494D; // 'FSIM'
inline constexpr std::uint32_t ImageVersion = 1;

// magic, version, transaction id, flags, payload length
inline constexpr std::size_t ImageHeaderSize  = 4 + 4 + 8 + 4 + 8;
inline constexpr std::size_t ImageTrailerSize = 8;

// Largest payload length whose framed image still fits in a size_t.
inline constexpr std::uint64_t ImageMaxPayloadLength = SIZE_MAX - ImageHeaderSize - ImageTrailerSize;

// Upper bound on a single ByteSource read while loading.
inline constexpr std::size_t ImageReadChunkSize = 64 * 1024;

struct ImageHeader {
    std::uint32_t magic         = ImageMagic;
    std::uint32_t version       = ImageVersion;
    std::uint64_t transactionId = 0;
    // Carried through save and load untouched. Payloads are never compressed.
    std::uint32_t flags         = 0;
    std::uint64_t payloadLength = 0;
};

struct ImageSaveOptions {
    // Recorded in the header instead of the namespace's transaction id.
    std::optional<std::uint64_t> transactionId;
    std::uint32_t                flags = 0;
    // Called before each top-level subtree is serialized.
    std::function<void(std::string_view name, std::size_t index, std::size_t total)> progress;
};

struct ImageSaved {
    std::uint64_t bytesWritten = 0;
    std::uint64_t checksum     = 0;
};

struct SaveCancelled {};

using SaveOutcome = std::variant<ImageSaved, SaveCancelled>;

[[nodiscard]] inline auto wasCancelled(SaveOutcome const& outcome) -> bool {
    return std::holds_alternative<SaveCancelled>(outcome);
}

} // namespace FSI
