#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace FSI {

/**
 * Tunables applied when a namespace is created, formatted or reloaded.
 *
 * The clock feeds modification times and snapshot creation times; tests
 * replace it with a deterministic counter so dumps are reproducible.
 */
struct NamesystemOptions {
    std::string   defaultOwner          = "fsimage";
    std::string   defaultGroup          = "supergroup";
    std::uint16_t directoryPermission   = 0755;
    std::uint16_t filePermission        = 0644;
    std::uint16_t defaultReplication    = 3;
    std::uint64_t preferredBlockSize    = 128ull * 1024 * 1024;
    std::uint32_t snapshotQuota         = 65536;
    std::function<std::uint64_t()> clock;

    [[nodiscard]] auto now() const -> std::uint64_t {
        if (clock) {
            return clock();
        }
        auto const duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch());
        return static_cast<std::uint64_t>(duration.count());
    }
};

} // namespace FSI
