#pragma once

#include <atomic>

namespace regwire {

// Set by the host when the snapshot a run works on has been invalidated.
class cancel_token {
public:
    cancel_token() = default;
    cancel_token(const cancel_token&) = delete;
    cancel_token& operator=(const cancel_token&) = delete;

    void request_cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancellation_requested() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace regwire
