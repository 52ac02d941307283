#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace sconv {

/**
 * @brief Cooperative cancellation flag shared between a caller and one pipeline
 *
 * THREAD SAFETY:
 * - request_cancel() may be called from any thread, including signal-driven
 *   watcher threads
 * - Cancel hooks run on the cancelling thread while the token lock is held,
 *   so remove_hook() never returns while the hook is still running
 */
class CancellationToken {
public:
    using Hook = std::function<void()>;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void request_cancel();

    bool is_cancelled() const;

    /**
     * @brief Sleep for up to @p timeout, waking early on cancellation
     *
     * RETURNS: true if the token was cancelled
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
    }

    /**
     * @brief Register a hook run once on cancellation
     *
     * If the token is already cancelled the hook runs immediately.
     * RETURNS: Hook ID for remove_hook()
     */
    std::size_t add_hook(Hook hook) const;

    void remove_hook(std::size_t hook_id) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    mutable std::size_t next_hook_id_ = 0;
    mutable std::vector<std::pair<std::size_t, Hook>> hooks_;
};

/**
 * @brief Scoped hook registration, removed on destruction
 */
class CancellationScope {
public:
    CancellationScope(const CancellationToken& token, CancellationToken::Hook hook);
    ~CancellationScope();

    CancellationScope(const CancellationScope&) = delete;
    CancellationScope& operator=(const CancellationScope&) = delete;

private:
    const CancellationToken& token_;
    std::size_t hook_id_;
};

} // namespace sconv
