#pragma once

#include <atomic>
#include <memory>

namespace ecp {

/**
 * @brief Shared flag used to stop a long-running call early.
 *
 * Copies share the same flag: hand one copy to the operation and keep one to
 * call `cancel()` from another thread. A default-constructed token can still
 * be cancelled; `CancellationToken::none()` is simply never cancelled by
 * anyone.
 *
 * Discovery checks the flag between datagrams and rounds; `sendText` checks
 * it before each character. A request already in flight is not interrupted.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    static CancellationToken none() { return CancellationToken{}; }

    void cancel() noexcept { flag_->store(true, std::memory_order_relaxed); }

    bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace ecp
