#pragma once

#include <atomic>

namespace FSI {

/**
 * Cooperative cancellation flag shared between a save and the controller
 * that may abort it. The writer polls it between top-level subtrees.
 */
class CancellationToken {
public:
    auto cancel() noexcept -> void { cancelled_.store(true, std::memory_order_release); }
    auto reset() noexcept -> void { cancelled_.store(false, std::memory_order_release); }
    [[nodiscard]] auto isCancelled() const noexcept -> bool { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace FSI
