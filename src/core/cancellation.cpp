#include "sconv/core/cancellation.hpp"

#include <algorithm>

namespace sconv {

void CancellationToken::request_cancel() {
    std::unique_lock lock(mutex_);
    if (cancelled_) {
        return;
    }
    cancelled_ = true;

    // Hooks run under the lock; they must not call back into the token.
    for (auto& [id, hook] : hooks_) {
        if (hook) {
            hook();
        }
    }
    hooks_.clear();
    cv_.notify_all();
}

bool CancellationToken::is_cancelled() const {
    std::unique_lock lock(mutex_);
    return cancelled_;
}

std::size_t CancellationToken::add_hook(Hook hook) const {
    std::unique_lock lock(mutex_);
    const auto hook_id = next_hook_id_++;
    if (cancelled_) {
        if (hook) {
            hook();
        }
        return hook_id;
    }
    hooks_.emplace_back(hook_id, std::move(hook));
    return hook_id;
}

void CancellationToken::remove_hook(std::size_t hook_id) const {
    std::unique_lock lock(mutex_);
    hooks_.erase(std::remove_if(hooks_.begin(), hooks_.end(),
                                [hook_id](const auto& entry) { return entry.first == hook_id; }),
                 hooks_.end());
}

CancellationScope::CancellationScope(const CancellationToken& token, CancellationToken::Hook hook)
    : token_(token), hook_id_(token.add_hook(std::move(hook))) {}

CancellationScope::~CancellationScope() {
    token_.remove_hook(hook_id_);
}

} // namespace sconv
