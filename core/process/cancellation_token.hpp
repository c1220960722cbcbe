#pragma once

#include <atomic>

namespace trellico {
namespace process {

// One-way stop flag shared between whoever may cancel a process and the
// execution context that polls it. Never reset once set.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace process
}  // namespace trellico
