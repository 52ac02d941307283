#pragma once

#include "sconv/core/error.hpp"
#include "sconv/core/result.hpp"
#include "sconv/pipeline/types.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace sconv::pipeline {

/**
 * @brief Lifecycle of one transfer
 *
 * Only the orchestrator thread mutates the session; state() may be read
 * from any thread (heartbeat timer, event handlers).
 */
class TransferSession {
public:
    TransferSession(std::string session_id, std::string source_locator);

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::string& source_locator() const noexcept { return source_locator_; }
    [[nodiscard]] SessionState state() const noexcept { return state_.load(); }

    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept { return size_; }
    void set_size(std::optional<std::uint64_t> size) { size_ = size; }

    [[nodiscard]] const std::optional<PipelineError>& last_error() const noexcept { return last_error_; }

    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(PipelineError error);

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    std::string session_id_;
    std::string source_locator_;
    std::atomic<SessionState> state_{SessionState::Idle};
    std::optional<std::uint64_t> size_;
    std::optional<PipelineError> last_error_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace sconv::pipeline
