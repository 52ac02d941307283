#include "sconv/pipeline/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace sconv::pipeline {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::SizeChecked}},
        {SessionState::SizeChecked, {SessionState::AttemptingStreamCopy}},
        {SessionState::AttemptingStreamCopy, {SessionState::AttemptingFullReencode, SessionState::Succeeded}},
        {SessionState::AttemptingFullReencode, {SessionState::Succeeded}},
    };

    if (target == SessionState::Failed || target == SessionState::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

TransferSession::TransferSession(std::string session_id, std::string source_locator)
    : session_id_(std::move(session_id)),
      source_locator_(std::move(source_locator)),
      started_at_(std::chrono::steady_clock::now()) {
}

Result<void> TransferSession::transition_to(SessionState next_state) {
    const auto current = state_.load();
    if (current == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(std::string("Illegal session state transition ") +
                         to_string(current) + " -> " + to_string(next_state));
    }

    state_.store(next_state);
    return Ok();
}

Result<void> TransferSession::mark_failed(PipelineError error) {
    if (is_terminal(state_.load())) {
        return Err<void>(std::string("Session already finished"));
    }
    last_error_ = std::move(error);
    return transition_to(SessionState::Failed);
}

std::chrono::milliseconds TransferSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
}

bool TransferSession::can_transition(SessionState target) const noexcept {
    const auto current = state_.load();
    if (current == target) {
        return true;
    }

    if (is_terminal(current)) {
        return false;
    }

    return is_progressive(current, target);
}

} // namespace sconv::pipeline
