#pragma once
#include "core/Error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace FSI {

// Reserved component used to address snapshot views: /dir/.snapshot/<name>/...
inline constexpr std::string_view SnapshotDirectoryName = ".snapshot";

struct PathValidation {
    enum class Code {
        None,
        EmptyPath,
        MustStartWithSlash,
        EndsWithSlash,
        EmptyPathComponent,
        RelativePath
    };
    Code code = Code::None;
};

constexpr auto validatePath(std::string_view str) -> PathValidation {
    if (str.empty())
        return {PathValidation::Code::EmptyPath};
    if (str[0] != '/')
        return {PathValidation::Code::MustStartWithSlash};
    if (str.size() == 1)
        return {};
    if (str.back() == '/')
        return {PathValidation::Code::EndsWithSlash};

    std::size_t start = 1;
    for (std::size_t i = 1; i <= str.size(); ++i) {
        if (i == str.size() || str[i] == '/') {
            auto component = str.substr(start, i - start);
            if (component.empty())
                return {PathValidation::Code::EmptyPathComponent};
            if (component == "." || component == "..")
                return {PathValidation::Code::RelativePath};
            start = i + 1;
        }
    }
    return {};
}

[[nodiscard]] auto validationMessage(PathValidation::Code code) -> std::string_view;

// Splits an absolute path into its components. "/" yields no components.
[[nodiscard]] auto splitPath(std::string_view path) -> Expected<std::vector<std::string>>;

// Checks a single child name used for create/rename.
[[nodiscard]] auto validateChildName(std::string_view name) -> Expected<void>;

[[nodiscard]] auto joinPath(std::string_view parent, std::string_view child) -> std::string;
[[nodiscard]] auto parentPath(std::string_view path) -> std::string;
[[nodiscard]] auto baseName(std::string_view path) -> std::string_view;

} // namespace FSI
