#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace FSI {

struct Error {
    enum class Code {
        UnknownError = 0,
        NotFound,
        AlreadyExists,
        DuplicateName,
        NotSnapshottable,
        SnapshotsExist,
        NotDirectory,
        NotFile,
        InvalidPath,
        DirectoryNotEmpty,
        NotUnderConstruction,
        AlreadyUnderConstruction,
        CapacityExceeded,
        Corrupt,
        Truncated,
        FormatVersionMismatch,
        IoFailure,
        MalformedInput
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::AlreadyExists:
        return "already_exists";
    case Error::Code::DuplicateName:
        return "duplicate_name";
    case Error::Code::NotSnapshottable:
        return "not_snapshottable";
    case Error::Code::SnapshotsExist:
        return "snapshots_exist";
    case Error::Code::NotDirectory:
        return "not_directory";
    case Error::Code::NotFile:
        return "not_file";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::DirectoryNotEmpty:
        return "directory_not_empty";
    case Error::Code::NotUnderConstruction:
        return "not_under_construction";
    case Error::Code::AlreadyUnderConstruction:
        return "already_under_construction";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    case Error::Code::Corrupt:
        return "corrupt";
    case Error::Code::Truncated:
        return "truncated";
    case Error::Code::FormatVersionMismatch:
        return "format_version_mismatch";
    case Error::Code::IoFailure:
        return "io_failure";
    case Error::Code::MalformedInput:
        return "malformed_input";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace FSI
