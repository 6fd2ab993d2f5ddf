#include "namespace/INode.hpp"

namespace FSI {

auto INode::diffCount() const noexcept -> std::size_t {
    return std::visit(Overloaded{
                          [](DirectoryPayload const& dir) { return dir.diffs.size(); },
                          [](FilePayload const& file) { return file.diffs.size(); },
                      },
                      payload);
}

auto permissionString(std::uint16_t permission) -> std::string {
    static constexpr char Flags[] = {'r', 'w', 'x'};
    std::string out(9, '-');
    for (int i = 0; i < 9; ++i) {
        auto const bit = 8 - i;
        if (permission & (1u << bit)) {
            out[static_cast<std::size_t>(i)] = Flags[i % 3];
        }
    }
    return out;
}

} // namespace FSI
