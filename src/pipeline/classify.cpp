#include "sconv/pipeline/classify.hpp"

namespace sconv::pipeline {
namespace {

constexpr std::size_t kDiagnosticExcerpt = 1000;

std::string with_diagnostics(std::string message, const std::string& diagnostics) {
    if (diagnostics.empty()) {
        return message;
    }
    const auto excerpt = diagnostics.size() > kDiagnosticExcerpt
        ? diagnostics.substr(diagnostics.size() - kDiagnosticExcerpt)
        : diagnostics;
    return message + ": " + excerpt;
}

Verdict verdict(Classification classification, ErrorKind kind, std::string message) {
    return Verdict{classification, PipelineError{kind, std::move(message)}};
}

} // namespace

Verdict classify_attempt(const AttemptFacts& facts) {
    if (facts.cancelled) {
        return verdict(Classification::Cancelled, ErrorKind::CancellationRequested, "cancelled by caller");
    }
    if (facts.launch_error) {
        return Verdict{Classification::FailFatal, facts.launch_error};
    }
    if (facts.source_error) {
        // Re-encoding cannot repair an unreadable source.
        return Verdict{Classification::FailFatal, facts.source_error};
    }
    if (facts.sink_error) {
        return Verdict{Classification::FailRetryable, facts.sink_error};
    }
    if (!facts.exit_status) {
        return verdict(Classification::FailRetryable, ErrorKind::ConverterExitError,
                       "converter exit status unknown");
    }
    if (!facts.exit_status->success()) {
        return verdict(Classification::FailRetryable, ErrorKind::ConverterExitError,
                       with_diagnostics("converter " + facts.exit_status->describe(), facts.diagnostics));
    }
    if (facts.bytes_out == 0) {
        return verdict(Classification::FailRetryable, ErrorKind::ConverterExitError,
                       with_diagnostics("converter produced no output", facts.diagnostics));
    }
    if (facts.bytes_accepted != facts.bytes_out) {
        return verdict(Classification::FailRetryable, ErrorKind::DestinationWriteError,
                       "destination accepted " + std::to_string(facts.bytes_accepted) + " of " +
                       std::to_string(facts.bytes_out) + " bytes");
    }
    return Verdict{Classification::Success, std::nullopt};
}

Result<SessionState> next_state(SessionState current, Classification classification) {
    if (!is_attempting(current)) {
        return Err<SessionState>(std::string("No attempt runs in state ") + to_string(current));
    }

    switch (classification) {
        case Classification::Success:
            return Ok(SessionState::Succeeded);
        case Classification::FailRetryable:
            if (current == SessionState::AttemptingStreamCopy) {
                return Ok(SessionState::AttemptingFullReencode);
            }
            return Ok(SessionState::Failed);
        case Classification::FailFatal:
            return Ok(SessionState::Failed);
        case Classification::Cancelled:
            return Ok(SessionState::Cancelled);
    }
    return Err<SessionState>(std::string("Unknown classification"));
}

SessionState attempting_state(ConversionStrategy strategy) noexcept {
    return strategy == ConversionStrategy::StreamCopy
        ? SessionState::AttemptingStreamCopy
        : SessionState::AttemptingFullReencode;
}

} // namespace sconv::pipeline
