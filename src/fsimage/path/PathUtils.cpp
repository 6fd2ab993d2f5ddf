#include "path/PathUtils.hpp"

namespace FSI {

auto validationMessage(PathValidation::Code code) -> std::string_view {
    switch (code) {
    case PathValidation::Code::None:
        return "valid";
    case PathValidation::Code::EmptyPath:
        return "Path is empty";
    case PathValidation::Code::MustStartWithSlash:
        return "Path must start with '/'";
    case PathValidation::Code::EndsWithSlash:
        return "Path must not end with '/'";
    case PathValidation::Code::EmptyPathComponent:
        return "Path contains an empty component";
    case PathValidation::Code::RelativePath:
        return "Path contains a relative component";
    }
    return "invalid path";
}

auto splitPath(std::string_view path) -> Expected<std::vector<std::string>> {
    auto const result = validatePath(path);
    if (result.code != PathValidation::Code::None) {
        std::string message{validationMessage(result.code)};
        message.append(": ");
        message.append(path);
        return std::unexpected(Error{Error::Code::InvalidPath, std::move(message)});
    }

    std::vector<std::string> components;
    if (path.size() <= 1) {
        return components;
    }

    std::size_t start = 1; // skip leading '/'
    for (std::size_t i = 1; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == '/') {
            components.emplace_back(path.substr(start, i - start));
            start = i + 1;
        }
    }
    return components;
}

auto validateChildName(std::string_view name) -> Expected<void> {
    if (name.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "Name is empty"});
    }
    if (name == "." || name == "..") {
        return std::unexpected(Error{Error::Code::InvalidPath, "Name is a relative component"});
    }
    if (name.find('/') != std::string_view::npos) {
        return std::unexpected(Error{Error::Code::InvalidPath, "Name contains '/'"});
    }
    if (name == SnapshotDirectoryName) {
        return std::unexpected(Error{Error::Code::InvalidPath, "\".snapshot\" is a reserved name"});
    }
    return {};
}

auto joinPath(std::string_view parent, std::string_view child) -> std::string {
    std::string out{parent};
    if (out.empty() || out.back() != '/') {
        out.push_back('/');
    }
    out.append(child);
    return out;
}

auto parentPath(std::string_view path) -> std::string {
    auto const pos = path.rfind('/');
    if (pos == std::string_view::npos || pos == 0) {
        return "/";
    }
    return std::string{path.substr(0, pos)};
}

auto baseName(std::string_view path) -> std::string_view {
    auto const pos = path.rfind('/');
    if (pos == std::string_view::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

} // namespace FSI
