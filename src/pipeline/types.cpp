#include "sconv/pipeline/types.hpp"

#include "sconv/core/format.hpp"

#include <cstring>

namespace sconv::pipeline {

const char* to_string(ConversionStrategy strategy) {
    switch (strategy) {
        case ConversionStrategy::StreamCopy: return "StreamCopy";
        case ConversionStrategy::FullReencode: return "FullReencode";
    }
    return "Unknown";
}

const char* to_string(Classification classification) {
    switch (classification) {
        case Classification::Success: return "Success";
        case Classification::FailRetryable: return "Fail-Retryable";
        case Classification::FailFatal: return "Fail-Fatal";
        case Classification::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::SizeChecked: return "SizeChecked";
        case SessionState::AttemptingStreamCopy: return "AttemptingStreamCopy";
        case SessionState::AttemptingFullReencode: return "AttemptingFullReencode";
        case SessionState::Succeeded: return "Succeeded";
        case SessionState::Failed: return "Failed";
        case SessionState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Succeeded ||
           state == SessionState::Failed ||
           state == SessionState::Cancelled;
}

bool is_attempting(SessionState state) noexcept {
    return state == SessionState::AttemptingStreamCopy ||
           state == SessionState::AttemptingFullReencode;
}

std::string ExitStatus::describe() const {
    if (exited) {
        return "exit code " + std::to_string(code);
    }
    return "killed by signal " + std::to_string(signal) + " (" + ::strsignal(signal) + ")";
}

std::string describe(const Outcome& outcome) {
    if (const auto* ok = std::get_if<Succeeded>(&outcome)) {
        return "Succeeded: " + format_bytes(ok->bytes_written) + " to " + ok->output_locator;
    }
    if (const auto* failed = std::get_if<Failed>(&outcome)) {
        return "Failed: " + failed->error.describe();
    }
    return "Cancelled";
}

} // namespace sconv::pipeline
