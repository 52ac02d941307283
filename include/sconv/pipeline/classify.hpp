#pragma once

#include "sconv/core/error.hpp"
#include "sconv/core/result.hpp"
#include "sconv/pipeline/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sconv::pipeline {

/**
 * @brief What the orchestrator observed once an attempt's threads were joined
 */
struct AttemptFacts {
    bool cancelled = false;
    std::optional<PipelineError> launch_error;
    std::optional<PipelineError> source_error;   ///< Feeder failure other than ConverterInputClosed
    std::optional<PipelineError> sink_error;
    std::optional<ExitStatus> exit_status;
    std::uint64_t bytes_out = 0;                 ///< Drained from converter stdout
    std::uint64_t bytes_accepted = 0;            ///< Acknowledged by the destination
    std::string diagnostics;
};

struct Verdict {
    Classification classification = Classification::FailFatal;
    std::optional<PipelineError> error;
};

/**
 * @brief Classify a finished attempt
 *
 * PRECEDENCE: cancellation, launch failure, unreadable source (both fatal),
 * destination failure, converter exit status, empty output, byte mismatch.
 */
Verdict classify_attempt(const AttemptFacts& facts);

/**
 * @brief State the session moves to after an attempt in @p current
 *
 * Pure: StreamCopy falls back to FullReencode only on FailRetryable;
 * FullReencode never falls back. Errors for non-attempting states.
 */
Result<SessionState> next_state(SessionState current, Classification classification);

/// Attempt state for a strategy.
SessionState attempting_state(ConversionStrategy strategy) noexcept;

} // namespace sconv::pipeline
