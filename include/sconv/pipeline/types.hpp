#pragma once

#include "sconv/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sconv::pipeline {

/**
 * @brief Conversion strategies, tried in declaration order
 */
enum class ConversionStrategy {
    StreamCopy,     ///< Remux without re-encoding
    FullReencode    ///< Re-encode video and audio; only after a retryable StreamCopy failure
};

enum class Classification {
    Success,
    FailRetryable,
    FailFatal,
    Cancelled
};

enum class SessionState {
    Idle,
    SizeChecked,
    AttemptingStreamCopy,
    AttemptingFullReencode,
    Succeeded,
    Failed,
    Cancelled
};

const char* to_string(ConversionStrategy strategy);
const char* to_string(Classification classification);
const char* to_string(SessionState state);

bool is_terminal(SessionState state) noexcept;
bool is_attempting(SessionState state) noexcept;

/**
 * @brief How the converter process ended
 */
struct ExitStatus {
    bool exited = false;    ///< Normal exit; otherwise killed by @ref signal
    int code = 0;
    int signal = 0;

    bool success() const noexcept { return exited && code == 0; }
    std::string describe() const;
};

/**
 * @brief Everything known about one conversion attempt once it concluded
 */
struct AttemptReport {
    ConversionStrategy strategy = ConversionStrategy::StreamCopy;
    int pid = -1;                           ///< -1 when the converter never started
    std::optional<ExitStatus> exit_status;
    std::string diagnostics;                ///< Tail of converter stderr
    std::uint64_t bytes_in = 0;             ///< Forwarded to converter stdin
    std::uint64_t bytes_out = 0;            ///< Drained from converter stdout
    std::uint64_t bytes_accepted = 0;       ///< Acknowledged by the destination
    Classification classification = Classification::FailFatal;
    std::optional<PipelineError> error;
    std::chrono::milliseconds duration{0};
};

// ════════════════════════════════════════════════════════
// Outcome of run_pipeline()
// ════════════════════════════════════════════════════════

struct Succeeded {
    std::uint64_t bytes_written = 0;
    std::string output_locator;
};

struct Failed {
    PipelineError error;
};

struct Cancelled {};

using Outcome = std::variant<Succeeded, Failed, Cancelled>;

std::string describe(const Outcome& outcome);

} // namespace sconv::pipeline
